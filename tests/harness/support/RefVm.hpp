// tests/harness/support/RefVm.hpp
#pragma once
#include "SsaEval.hpp"
#include "TestHost.hpp"

#include <vellum/backend/vm/Bytecode.hpp>

#include <cstdint>
#include <string_view>
#include <vector>


namespace vellum::harness {

    struct VmLimits {
        uint64_t max_steps = 5'000'000;
        uint32_t max_depth = 256;
        uint64_t max_stack = 1u << 16;
    };

    /// @brief bytecode 규약을 그대로 따르는 참조 인터프리터.
    ///
    /// import는 host 테이블의 (module, version, name)으로 해석하고,
    /// 상태/컨텍스트/로그는 TestHost에 위임한다.
    RunResult run_function(
        const backend::vm::Module& m,
        uint32_t index,
        const std::vector<uint64_t>& args,
        TestHost& host,
        const VmLimits& limits = {}
    );

    /// @brief export 이름으로 함수를 찾아 실행한다.
    RunResult run_export(
        const backend::vm::Module& m,
        std::string_view name,
        const std::vector<uint64_t>& args,
        TestHost& host,
        const VmLimits& limits = {}
    );

} // namespace vellum::harness
