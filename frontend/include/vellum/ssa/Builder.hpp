// frontend/include/vellum/ssa/Builder.hpp
#pragma once
#include <vellum/hir/HIR.hpp>
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>
#include <vector>


namespace vellum::ssa {

    struct BuildOptions {
        // FuncId -> true면 본문을 만들지 않고 excluded로 표시한다(ownership 실패 등).
        std::vector<bool> skip;
    };

    struct BuildResult {
        bool ok = false;
        uint32_t built = 0;      // 본문을 만든 함수 수
        uint32_t phi_params = 0; // join/loop header에 만든 block param 수
    };

    /// @brief 검사된 HIR을 SSA 모듈로 낮춘다. ssa::FuncId == hir::FuncId.
    ///
    /// 구조적 제어 흐름을 CFG로 바꾸면서 바인딩 값을 직접 추적한다.
    /// join에는 이후에 살아 있고 경로마다 값이 다른 바인딩에만 param을 만들고,
    /// loop header에는 본문에서 다시 대입되는 바인딩 전부에 param을 만든다.
    BuildResult build_module(
        const hir::Module& hm,
        ty::TypePool& types,
        Module& out,
        const BuildOptions& opt = {}
    );

} // namespace vellum::ssa
