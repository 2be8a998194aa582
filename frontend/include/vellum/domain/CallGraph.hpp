// frontend/include/vellum/domain/CallGraph.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>

#include <cstdint>
#include <vector>


namespace vellum::domain {

    using ssa::FuncId;

    /// @brief arena 인덱스 기반 호출 그래프와 강연결요소(SCC).
    struct CallGraph {
        std::vector<std::vector<FuncId>> callees;   // 중복 없는 직접 callee
        std::vector<std::vector<FuncId>> sccs;      // 역위상 순서: callee SCC가 먼저
        std::vector<uint32_t> scc_of;               // FuncId -> sccs index

        /// @brief SCC가 자기 자신으로의 간선(재귀)이나 둘 이상의 멤버를 갖는지.
        bool is_cyclic(uint32_t scc) const;
    };

    /// @brief 본문이 있는 함수의 호출 명령에서 그래프를 만든다(Tarjan).
    CallGraph build_call_graph(const ssa::Module& m);

} // namespace vellum::domain
