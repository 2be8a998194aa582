// backend/include/vellum/backend/vm/Stackify.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>

#include <cstdint>
#include <vector>


namespace vellum::backend::vm {

    inline constexpr uint32_t kNoSlot = 0xFFFF'FFFFu;

    /// @brief SSA 값이 bytecode에서 머무는 곳.
    enum class ValueHome : uint8_t {
        kNone,    // 사용되지 않음(정의 후 drop, 죽은 block param은 복사 생략)
        kConst,   // 상수: 사용 지점마다 다시 만든다
        kStack,   // 바로 다음 명령이 한 번만 소비: 평가 스택에 남긴다
        kLocal,   // 이름 있는 local slot
    };

    /// @brief 함수 하나의 slot 배치. ValueId로 인덱싱한다.
    struct SlotPlan {
        std::vector<ValueHome> home;
        std::vector<uint32_t> slot;
        uint32_t num_slots = 0;   // 매개변수 slot 포함

        // 통계
        uint32_t stack_values = 0;
        uint32_t local_values = 0;
        uint32_t const_values = 0;
    };

    /// @brief 명령 lowering이 가장 먼저, 다른 출력 없이 스택에 올리는 operand.
    ///
    /// 이 operand만 평가 스택에 남겨 둘 수 있다. lowering은 이 규약을 지켜야 한다.
    /// 해당 operand가 없으면 kInvalidId.
    ssa::ValueId stack_operand(const ssa::Inst& inst);
    ssa::ValueId stack_operand(const ssa::Terminator& term);

    /// @brief 사용 횟수, 다음 명령 소비 여부, 생존 구간 간섭으로 slot을 정한다.
    ///
    /// 1) 상수는 kConst, 사용이 없으면 kNone
    /// 2) 한 번만, 바로 다음 명령의 stack operand로 쓰이면 kStack
    /// 3) 나머지는 kLocal: 블록 단위 역방향 생존 분석 후 간섭 그래프를 탐욕적으로 색칠한다.
    ///    entry 매개변수는 slot 0..n-1에 고정한다.
    SlotPlan plan_slots(const ssa::Module& m, const ssa::Function& f);

} // namespace vellum::backend::vm
