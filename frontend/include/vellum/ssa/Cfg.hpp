// frontend/include/vellum/ssa/Cfg.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>

#include <cstdint>
#include <unordered_map>
#include <vector>


namespace vellum::ssa {

    /// @brief 함수 소속 블록 마스크(BlockId로 인덱싱).
    std::vector<uint8_t> owned_block_mask(const Module& m, const Function& f);

    /// @brief predecessor 리스트(BlockId로 인덱싱). 같은 선행 블록이 두 번 나올 수 있다.
    std::vector<std::vector<BlockId>> build_preds(const Module& m, const Function& f);

    /// @brief entry에서 도달 가능한 블록의 역후위 순서.
    std::vector<BlockId> reverse_post_order(const Module& m, const Function& f);

    struct DomInfo {
        std::vector<BlockId> blocks;
        std::unordered_map<BlockId, uint32_t> index_of;

        // dom[b][d] == 1 이면 d가 b를 지배한다.
        std::vector<std::vector<uint8_t>> dom;
        std::vector<uint8_t> reachable;

        uint32_t entry_index = UINT32_MAX;
    };

    DomInfo build_dom_info(const Module& m, const Function& f);

    /// @brief a가 b를 지배하는지 검사한다.
    bool dominates(const DomInfo& dom, BlockId a, BlockId b);

} // namespace vellum::ssa
