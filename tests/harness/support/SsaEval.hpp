// tests/harness/support/SsaEval.hpp
#pragma once
#include "TestHost.hpp"

#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::harness {

    /// @brief 실행 한 번의 종료 방식. SSA 평가기와 참조 VM이 같은 모양으로 보고한다.
    enum class Exit : uint8_t {
        kReturned,
        kReverted,   // require/revert
        kPanicked,   // panic, overflow, unwrap 실패, host 실패
        kTrapped,    // 0으로 나누기, unreachable 등 네이티브 trap
        kError,      // 평가기 자체의 한계(스텝/깊이 초과, 잘못된 입력)
    };

    struct RunResult {
        Exit exit = Exit::kError;
        bool has_value = false;
        uint64_t value = 0;       // 정수/bool 반환값(워드 표현)
        std::string message{};    // revert/panic 메시지 또는 평가기 오류
        uint32_t trap = 0;        // vm::TrapCode
        std::string host_status{};  // 마지막으로 실패한 host 호출의 상태 이름
    };

    const char* exit_name(Exit e);

    struct EvalLimits {
        uint64_t max_steps = 1'000'000;
        uint32_t max_depth = 256;
    };

    /// @brief 최적화 전후 SSA를 직접 해석한다. 인자는 정수/bool 워드만 받는다.
    RunResult eval_function(
        const ssa::Module& m,
        const ty::TypePool& types,
        ssa::FuncId fid,
        const std::vector<uint64_t>& args,
        TestHost& host,
        std::string_view unit,
        const EvalLimits& limits = {}
    );

} // namespace vellum::harness
