// frontend/include/vellum/hir/Reader.hpp
#pragma once
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/hir/HIR.hpp>
#include <vellum/text/SourceManager.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>
#include <string_view>


namespace vellum::hir {

    struct ReadResult {
        bool ok = false;
        uint32_t file_id = 0;   // span이 가리키는 SourceManager file
    };

    /// @brief 프론트엔드가 내보낸 typed HIR JSON 문서를 읽어 Module을 만든다.
    ///
    /// 이름은 심볼로 해석되고 모든 식 노드에 타입이 기록된다. 형식 오류는 예외 없이
    /// `kHir*` 진단으로 보고된다. 문서의 `source` 항목이 있으면 그 텍스트를 span 기준으로 등록한다.
    ReadResult read_module_json(
        std::string_view json_text,
        std::string_view doc_name,
        Module& out,
        ty::TypePool& types,
        SourceManager& sm,
        diag::Bag& bag
    );

} // namespace vellum::hir
