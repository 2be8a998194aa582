// backend/include/vellum/backend/meta/Gas.hpp
#pragma once
#include <vellum/backend/vm/Bytecode.hpp>
#include <vellum/ssa/SSA.hpp>

#include <cstdint>
#include <vector>


namespace vellum::backend::meta {

    /// @brief 정적 gas 추정에 쓰는 비용표.
    struct GasTable {
        uint64_t op = 1;            // 일반 스택/산술 명령
        uint64_t memory_op = 3;     // load/store
        uint64_t copy_op = 10;      // memcpy(길이와 무관한 고정 비용)
        uint64_t div_op = 5;
        uint64_t call_op = 10;      // 호출 자체 비용(callee 추정치는 따로 더한다)
        uint64_t loop_factor = 10;  // 루프 안 블록의 반복 가중치
        uint32_t max_loop_depth = 3;
    };

    uint64_t op_cost(const GasTable& t, vm::Op op);

    struct GasCall {
        ssa::FuncId callee = ssa::kInvalidId;
        uint64_t weight = 1;        // 호출 지점 블록의 루프 가중치
    };

    /// @brief 함수 하나의 지역 비용과 호출 목록.
    struct FunctionGas {
        bool present = false;       // lowering된 함수만 true
        uint64_t local = 0;
        std::vector<GasCall> calls;
    };

    /// @brief 블록별 루프 중첩 깊이(BlockId로 인덱싱). 자연 루프 기준.
    std::vector<uint32_t> loop_depths(const ssa::Module& m, const ssa::Function& f);

    /// @brief loop_factor^min(depth, max_loop_depth)
    uint64_t loop_weight(const GasTable& t, uint32_t depth);

    /// @brief 호출 그래프를 따라 callee 추정치를 더한다. 재귀 사이클은 한 번만 센다.
    std::vector<uint64_t> estimate_gas(const std::vector<FunctionGas>& fns);

} // namespace vellum::backend::meta
