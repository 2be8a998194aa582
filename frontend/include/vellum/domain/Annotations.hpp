// frontend/include/vellum/domain/Annotations.hpp
#pragma once
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/hir/HIR.hpp>

#include <string>
#include <vector>


namespace vellum::domain {

    /// @brief 어노테이션에 적힌 `ns:key` 하나. `ns`, `ns:*`는 와일드카드다.
    struct DeclaredKey {
        std::string ns;
        std::string key;
        bool wildcard = false;
    };

    /// @brief 함수 어노테이션 해석 결과.
    ///
    /// 인식하는 형식:
    /// - `reads("ns:key", ...)`, `writes("ns:key", ...)`: 해당 집합을 대체(override)
    /// - `no_state`: 상태 효과 없음(검증하지 않고 신뢰)
    /// - `proof("id")`: 외부 증명 의무 id
    /// 그 밖의 이름은 다른 소비자를 위한 것으로 보고 무시한다.
    struct FnAnnotations {
        bool has_reads = false;
        bool has_writes = false;
        bool no_state = false;

        std::vector<DeclaredKey> reads;
        std::vector<DeclaredKey> writes;
        std::vector<std::string> proofs;
    };

    /// @brief 원문 어노테이션을 해석한다. 형식 오류는 kAttrMalformed로 보고하고 false.
    bool parse_annotations(const std::vector<hir::Attr>& attrs, FnAnnotations& out, diag::Bag& bag);

    /// @brief `reads`/`writes`/`no_state` 중 하나라도 붙어 있는지. 형식은 검사하지 않는다.
    bool overrides_domains(const std::vector<hir::Attr>& attrs);

} // namespace vellum::domain
