// frontend/include/vellum/ssa/Passes.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>


namespace vellum::ssa {

    struct PassOptions {
        uint32_t opt_level = 1;          // 0이면 아무것도 바꾸지 않는다
        uint32_t inline_max_insts = 16;  // 인라인 대상 callee의 최대 inst 수
    };

    bool simplify_cfg(Module& m);
    bool const_fold(Module& m, const ty::TypePool& types);
    bool inline_calls(Module& m, const PassOptions& opt);
    bool dce(Module& m);

    /// @brief 기본 파이프라인: simplify_cfg -> const_fold -> inline -> const_fold -> dce -> simplify_cfg
    void run_passes(Module& m, const ty::TypePool& types, const PassOptions& opt = {});

} // namespace vellum::ssa
