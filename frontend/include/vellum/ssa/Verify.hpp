// frontend/include/vellum/ssa/Verify.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <string>
#include <vector>


namespace vellum::ssa {

    struct VerifyError { std::string msg; };

    struct VerifyOptions {
        // 최적화 이후에는 모든 블록이 entry에서 도달 가능해야 한다.
        bool require_reachable = false;
    };

    std::vector<VerifyError> verify(const Module& m, const VerifyOptions& opt = {});
    std::vector<VerifyError> verify_function(const Module& m, FuncId fid, const VerifyOptions& opt = {});

} // namespace vellum::ssa
