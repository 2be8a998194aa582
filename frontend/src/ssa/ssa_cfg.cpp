// frontend/src/ssa/ssa_cfg.cpp
#include <vellum/ssa/Cfg.hpp>

#include <algorithm>
#include <utility>


namespace vellum::ssa {

    std::vector<uint8_t> owned_block_mask(const Module& m, const Function& f) {
        std::vector<uint8_t> owned(m.blocks.size(), 0);
        for (auto bb : f.blocks) {
            if (bb == kInvalidId || (size_t)bb >= m.blocks.size()) continue;
            owned[bb] = 1;
        }
        return owned;
    }

    std::vector<std::vector<BlockId>> build_preds(const Module& m, const Function& f) {
        std::vector<std::vector<BlockId>> preds(m.blocks.size());
        const auto owned = owned_block_mask(m, f);

        for (auto bb : f.blocks) {
            if (bb == kInvalidId || (size_t)bb >= m.blocks.size()) continue;
            const auto& b = m.blocks[bb];
            if (!b.has_term) continue;
            for_each_successor(b.term, [&](BlockId to) {
                if (to == kInvalidId || (size_t)to >= m.blocks.size()) return;
                if (!owned[to]) return;
                preds[to].push_back(bb);
            });
        }
        return preds;
    }

    std::vector<BlockId> reverse_post_order(const Module& m, const Function& f) {
        std::vector<BlockId> post;
        if (f.entry == kInvalidId || (size_t)f.entry >= m.blocks.size()) return post;

        const auto owned = owned_block_mask(m, f);
        std::vector<uint8_t> seen(m.blocks.size(), 0);

        // (block, 다음에 볼 successor 위치)
        std::vector<std::pair<BlockId, uint32_t>> stack;
        stack.emplace_back(f.entry, 0);
        seen[f.entry] = 1;

        while (!stack.empty()) {
            auto& [bb, next] = stack.back();
            std::vector<BlockId> succs;
            if (m.blocks[bb].has_term) {
                for_each_successor(m.blocks[bb].term, [&](BlockId s) { succs.push_back(s); });
            }

            if (next < succs.size()) {
                const BlockId s = succs[next++];
                if (s != kInvalidId && (size_t)s < m.blocks.size() && owned[s] && !seen[s]) {
                    seen[s] = 1;
                    stack.emplace_back(s, 0);
                }
                continue;
            }
            post.push_back(bb);
            stack.pop_back();
        }

        std::reverse(post.begin(), post.end());
        return post;
    }

    DomInfo build_dom_info(const Module& m, const Function& f) {
        DomInfo info{};
        info.blocks = f.blocks;
        const auto preds = build_preds(m, f);

        for (uint32_t i = 0; i < (uint32_t)info.blocks.size(); ++i) {
            info.index_of[info.blocks[i]] = i;
        }
        auto eit = info.index_of.find(f.entry);
        if (eit == info.index_of.end()) return info;
        info.entry_index = eit->second;

        const uint32_t n = (uint32_t)info.blocks.size();
        info.reachable.assign(n, 0);
        for (auto bb : reverse_post_order(m, f)) {
            auto it = info.index_of.find(bb);
            if (it != info.index_of.end()) info.reachable[it->second] = 1;
        }

        info.dom.assign(n, std::vector<uint8_t>(n, 1));

        // 초기화: entry는 자기 자신만 지배.
        for (uint32_t d = 0; d < n; ++d) info.dom[info.entry_index][d] = 0;
        info.dom[info.entry_index][info.entry_index] = 1;

        bool changed = false;
        do {
            changed = false;
            for (uint32_t bi = 0; bi < n; ++bi) {
                if (bi == info.entry_index) continue;
                const BlockId bb = info.blocks[bi];

                std::vector<uint8_t> ndom(n, 1);
                bool has_pred = false;
                for (auto pbb : preds[bb]) {
                    auto pit = info.index_of.find(pbb);
                    if (pit == info.index_of.end()) continue;
                    const uint32_t pi = pit->second;
                    if (!info.reachable[pi]) continue;
                    if (!has_pred) {
                        ndom = info.dom[pi];
                        has_pred = true;
                    } else {
                        for (uint32_t d = 0; d < n; ++d) {
                            ndom[d] = (uint8_t)(ndom[d] & info.dom[pi][d]);
                        }
                    }
                }
                if (!has_pred) {
                    std::fill(ndom.begin(), ndom.end(), 0);
                }
                ndom[bi] = 1;

                if (ndom != info.dom[bi]) {
                    info.dom[bi] = std::move(ndom);
                    changed = true;
                }
            }
        } while (changed);

        return info;
    }

    bool dominates(const DomInfo& dom, BlockId a, BlockId b) {
        auto ia = dom.index_of.find(a);
        auto ib = dom.index_of.find(b);
        if (ia == dom.index_of.end() || ib == dom.index_of.end()) return false;
        return dom.dom[ib->second][ia->second] != 0;
    }

} // namespace vellum::ssa
