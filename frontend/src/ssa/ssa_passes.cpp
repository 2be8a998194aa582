// frontend/src/ssa/ssa_passes.cpp
#include <vellum/domain/Annotations.hpp>
#include <vellum/ssa/Cfg.hpp>
#include <vellum/ssa/Fold.hpp>
#include <vellum/ssa/Passes.hpp>

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>


namespace vellum::ssa {

    namespace {

        /// @brief ValueId 치환 테이블을 따라 최종 대표 값을 찾는다.
        ValueId resolve_alias_(const std::unordered_map<ValueId, ValueId>& repl, ValueId v) {
            ValueId cur = v;
            for (uint32_t i = 0; i < 64; ++i) {
                auto it = repl.find(cur);
                if (it == repl.end()) return cur;
                if (it->second == cur) return cur;
                cur = it->second;
            }
            return cur;
        }

        /// @brief inst/terminator의 operand를 순회하며 값 치환을 적용한다.
        void rewrite_operands_(Module& m, const std::unordered_map<ValueId, ValueId>& repl) {
            if (repl.empty()) return;
            auto apply = [&](ValueId& v) {
                if (v == kInvalidId) return;
                v = resolve_alias_(repl, v);
            };

            for (auto& inst : m.insts) for_each_operand_mut(inst.data, apply);

            for (auto& b : m.blocks) {
                if (!b.has_term) continue;
                std::visit([&](auto& t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, TermRet>) {
                        if (t.has_value) apply(t.value);
                    } else if constexpr (std::is_same_v<T, TermBr>) {
                        for (auto& a : t.args) apply(a);
                    } else if constexpr (std::is_same_v<T, TermCondBr>) {
                        apply(t.cond);
                        for (auto& a : t.then_args) apply(a);
                        for (auto& a : t.else_args) apply(a);
                    }
                }, b.term);
            }
        }

        /// @brief 모듈 전체 value use count를 계산한다.
        std::vector<uint32_t> build_use_count_(const Module& m) {
            std::vector<uint32_t> uses(m.values.size(), 0);
            auto add = [&](ValueId v) {
                if (v == kInvalidId || (size_t)v >= uses.size()) return;
                uses[v] += 1;
            };

            for (const auto& f : m.funcs) {
                for (auto bb : f.blocks) {
                    const auto& b = m.blocks[bb];
                    for (auto iid : b.insts) for_each_operand(m.insts[iid].data, add);
                    if (b.has_term) for_each_term_operand(b.term, add);
                }
            }
            return uses;
        }

        /// @brief ConstInt/ConstBool로 정의된 값이면 워드를 돌려준다.
        bool as_const_word_(const Module& m, ValueId v, uint64_t& out) {
            if (v == kInvalidId || (size_t)v >= m.values.size()) return false;
            const auto& val = m.values[v];
            if (val.def_b != kInvalidId) return false;   // block param
            if (val.def_a == kInvalidId || (size_t)val.def_a >= m.insts.size()) return false;

            const auto& inst = m.insts[val.def_a];
            if (const auto* ci = std::get_if<InstConstInt>(&inst.data)) {
                out = ci->bits;
                return true;
            }
            if (const auto* cb = std::get_if<InstConstBool>(&inst.data)) {
                out = cb->value ? 1 : 0;
                return true;
            }
            return false;
        }

        const Inst* def_inst_(const Module& m, ValueId v) {
            if (v == kInvalidId || (size_t)v >= m.values.size()) return nullptr;
            const auto& val = m.values[v];
            if (val.def_b != kInvalidId || val.def_a == kInvalidId) return nullptr;
            if ((size_t)val.def_a >= m.insts.size()) return nullptr;
            return &m.insts[val.def_a];
        }

        /// @brief inst를 상수 정의로 바꾼다. 결과 타입이 bool이면 ConstBool을 쓴다.
        void make_const_(Module& m, Inst& inst, bool is_bool, uint64_t w) {
            if (is_bool) inst.data = InstConstBool{w != 0};
            else inst.data = InstConstInt{w};
            inst.eff = Effect::Pure;
            m.opt_stats.consts_folded += 1;
        }

        /// @brief condbr의 조건이 상수이거나 두 타깃이 같으면 br로 단순화한다.
        bool simplify_condbr_(Module& m, uint32_t& folded) {
            bool changed = false;
            for (auto& f : m.funcs) {
                for (auto bb : f.blocks) {
                    auto& b = m.blocks[bb];
                    if (!b.has_term) continue;
                    if (!std::holds_alternative<TermCondBr>(b.term)) continue;
                    const auto c = std::get<TermCondBr>(b.term);

                    uint64_t w = 0;
                    if (as_const_word_(m, c.cond, w)) {
                        TermBr nb{};
                        nb.target = (w != 0) ? c.then_bb : c.else_bb;
                        nb.args = (w != 0) ? c.then_args : c.else_args;
                        b.term = std::move(nb);
                        ++folded;
                        changed = true;
                        continue;
                    }

                    if (c.then_bb == c.else_bb && c.then_args == c.else_args) {
                        TermBr nb{};
                        nb.target = c.then_bb;
                        nb.args = c.then_args;
                        b.term = std::move(nb);
                        changed = true;
                    }
                }
            }
            return changed;
        }

        /// @brief 함수의 entry에서 도달 가능한 블록만 남긴다.
        bool remove_unreachable_blocks_(Module& m, Function& f, uint32_t& removed) {
            if (f.entry == kInvalidId || (size_t)f.entry >= m.blocks.size()) return false;

            std::vector<uint8_t> reach(m.blocks.size(), 0);
            for (auto bb : reverse_post_order(m, f)) reach[bb] = 1;

            std::vector<BlockId> kept;
            kept.reserve(f.blocks.size());
            for (auto bb : f.blocks) {
                if (bb == kInvalidId || (size_t)bb >= m.blocks.size()) continue;
                if (!reach[bb]) continue;
                kept.push_back(bb);
            }
            const bool changed = (kept.size() != f.blocks.size());
            removed += static_cast<uint32_t>(f.blocks.size() - kept.size());
            f.blocks = std::move(kept);
            return changed;
        }

        /// @brief inline 가능한 callee인지: 단일 블록, ret 종료, 호출 없음, 크기 제한 이하.
        /// 도메인 집합을 선언하거나 신뢰받는 callee는 호출 간선이 남아 있어야 한다.
        bool is_inlinable_(const Module& m, FuncId caller, FuncId callee, const PassOptions& opt) {
            if (callee == caller || callee >= m.funcs.size()) return false;
            const auto& f = m.funcs[callee];
            if (f.excluded || f.blocks.size() != 1) return false;
            if (domain::overrides_domains(f.attrs)) return false;

            const auto& b = m.blocks[f.entry];
            if (!b.has_term || !std::holds_alternative<TermRet>(b.term)) return false;
            if (b.insts.size() > opt.inline_max_insts) return false;
            for (auto iid : b.insts) {
                if (std::holds_alternative<InstCall>(m.insts[iid].data)) return false;
            }
            return true;
        }

    } // namespace

    bool simplify_cfg(Module& m) {
        bool changed = false;
        changed |= simplify_condbr_(m, m.opt_stats.condbr_folded);
        for (auto& f : m.funcs) {
            if (f.excluded) continue;
            changed |= remove_unreachable_blocks_(m, f, m.opt_stats.blocks_removed);
        }
        return changed;
    }

    bool const_fold(Module& m, const ty::TypePool& types) {
        bool changed = false;
        std::vector<uint8_t> forwarded(m.values.size(), 0);

        for (;;) {
            bool round_changed = false;
            std::unordered_map<ValueId, ValueId> repl;

            for (const auto& f : m.funcs) {
                if (f.excluded) continue;
                for (auto bb : f.blocks) {
                    for (auto iid : m.blocks[bb].insts) {
                        auto& inst = m.insts[iid];
                        if (inst.result == kInvalidId) continue;
                        const TypeId rty = m.values[inst.result].ty;
                        const bool rbool = types.is_bool(rty);

                        if (const auto* bin = std::get_if<InstBinOp>(&inst.data)) {
                            uint64_t a = 0, b = 0;
                            if (bin->mode == ArithMode::Checked) continue;
                            if (!as_const_word_(m, bin->lhs, a) || !as_const_word_(m, bin->rhs, b)) continue;
                            const auto k = int_kind_of(types, m.values[bin->lhs].ty);
                            const auto r = fold_binop(bin->op, bin->mode, k, a, b);
                            // trap을 일으키는 연산은 접지 않는다.
                            if (r.status != FoldStatus::kValue) continue;
                            make_const_(m, inst, rbool, r.value);
                            round_changed = true;
                        } else if (const auto* un = std::get_if<InstUnary>(&inst.data)) {
                            uint64_t a = 0;
                            if (!as_const_word_(m, un->src, a)) continue;
                            if (un->op == UnOp::Not) {
                                make_const_(m, inst, true, a == 0 ? 1 : 0);
                                round_changed = true;
                                continue;
                            }
                            const auto k = int_kind_of(types, rty);
                            if (un->op == UnOp::BitNot) {
                                make_const_(m, inst, false, ty::normalize(k, ~a));
                                round_changed = true;
                                continue;
                            }
                            if (un->mode == ArithMode::Checked) continue;
                            const auto r = fold_neg(un->mode, k, a);
                            if (r.status != FoldStatus::kValue) continue;
                            make_const_(m, inst, false, r.value);
                            round_changed = true;
                        } else if (const auto* c = std::get_if<InstCast>(&inst.data)) {
                            uint64_t a = 0;
                            if (!as_const_word_(m, c->src, a)) continue;
                            const auto from = int_kind_of(types, m.values[c->src].ty);
                            const auto to = int_kind_of(types, c->to);
                            const auto r = fold_cast(c->mode, from, to, a);
                            if (r.status != FoldStatus::kValue) continue;
                            make_const_(m, inst, false, r.value);
                            round_changed = true;
                        } else if (const auto* ok = std::get_if<InstResultIsOk>(&inst.data)) {
                            const auto* d = def_inst_(m, ok->src);
                            if (d == nullptr) continue;
                            if (const auto* mr = std::get_if<InstMakeResult>(&d->data)) {
                                make_const_(m, inst, true, mr->is_ok ? 1 : 0);
                                round_changed = true;
                            }
                        } else if (const auto* ef = std::get_if<InstExtractField>(&inst.data)) {
                            const auto* d = def_inst_(m, ef->base);
                            if (d == nullptr) continue;
                            if (forwarded[inst.result]) continue;
                            if (const auto* ms = std::get_if<InstMakeStruct>(&d->data)) {
                                if (ef->index < ms->fields.size()) {
                                    repl[inst.result] = ms->fields[ef->index];
                                    forwarded[inst.result] = 1;
                                    m.opt_stats.consts_folded += 1;
                                }
                            }
                        }
                    }
                }
            }

            if (!repl.empty()) {
                rewrite_operands_(m, repl);
                round_changed = true;
            }
            if (!round_changed) break;
            changed = true;
        }
        return changed;
    }

    bool inline_calls(Module& m, const PassOptions& opt) {
        bool changed = false;

        for (FuncId fi = 0; fi < m.funcs.size(); ++fi) {
            if (m.funcs[fi].excluded) continue;

            // m.funcs[fi].blocks 는 inline 중 바뀌지 않는다(단일 블록 callee만 대상).
            const std::vector<BlockId> blocks = m.funcs[fi].blocks;
            for (auto bb : blocks) {
                std::vector<InstId> out;
                std::unordered_map<ValueId, ValueId> repl;
                bool block_changed = false;

                const std::vector<InstId> insts = m.blocks[bb].insts;
                for (auto iid : insts) {
                    const auto* call = std::get_if<InstCall>(&m.insts[iid].data);
                    if (call == nullptr || !is_inlinable_(m, fi, call->callee, opt)) {
                        out.push_back(iid);
                        continue;
                    }

                    const InstCall c = *call;
                    const ValueId call_result = m.insts[iid].result;
                    const auto& callee = m.funcs[c.callee];
                    const BlockId cbb = callee.entry;

                    // callee param -> caller arg
                    std::unordered_map<ValueId, ValueId> vmap;
                    const auto& params = m.blocks[cbb].params;
                    for (size_t i = 0; i < params.size() && i < c.args.size(); ++i) vmap[params[i]] = c.args[i];

                    const std::vector<InstId> body = m.blocks[cbb].insts;
                    for (auto ciid : body) {
                        Inst ni = m.insts[ciid];
                        for_each_operand_mut(ni.data, [&](ValueId& v) {
                            auto it = vmap.find(v);
                            if (it != vmap.end()) v = it->second;
                        });
                        ni.span = m.insts[iid].span;

                        const InstId nid = m.add_inst(ni);
                        if (ni.result != kInvalidId) {
                            Value nv = m.values[ni.result];
                            nv.def_a = nid;
                            nv.def_b = kInvalidId;
                            const ValueId nvid = m.add_value(nv);
                            m.insts[nid].result = nvid;
                            vmap[ni.result] = nvid;
                        }
                        out.push_back(nid);
                    }

                    const auto& ret = std::get<TermRet>(m.blocks[cbb].term);
                    if (call_result != kInvalidId && ret.has_value) {
                        auto it = vmap.find(ret.value);
                        repl[call_result] = (it != vmap.end()) ? it->second : ret.value;
                    }

                    m.opt_stats.calls_inlined += 1;
                    block_changed = true;
                }

                if (block_changed) {
                    m.blocks[bb].insts = std::move(out);
                    rewrite_operands_(m, repl);
                    changed = true;
                }
            }
        }
        return changed;
    }

    bool dce(Module& m) {
        bool changed = false;
        for (;;) {
            auto use_count = build_use_count_(m);
            bool round_changed = false;

            for (const auto& f : m.funcs) {
                for (auto bb : f.blocks) {
                    auto& b = m.blocks[bb];
                    std::vector<InstId> kept;
                    kept.reserve(b.insts.size());

                    for (auto iid : b.insts) {
                        const auto& inst = m.insts[iid];
                        const bool has_result = inst.result != kInvalidId;
                        const bool unused = has_result && use_count[inst.result] == 0;
                        if (unused && inst.eff == Effect::Pure) {
                            round_changed = true;
                            m.opt_stats.insts_removed += 1;
                            continue;
                        }
                        kept.push_back(iid);
                    }
                    if (kept.size() != b.insts.size()) b.insts = std::move(kept);
                }
            }

            if (!round_changed) break;
            changed = true;
        }
        return changed;
    }

    void run_passes(Module& m, const ty::TypePool& types, const PassOptions& opt) {
        if (opt.opt_level == 0) return;

        // 1) CFG 단순화
        // 2) 상수 폴딩
        // 3) leaf callee inline
        // 4) inline 결과에 대한 상수 폴딩
        // 5) pure DCE
        // 6) CFG 재정리(상수 condbr -> br, unreachable 제거)
        (void)simplify_cfg(m);
        (void)const_fold(m, types);
        (void)inline_calls(m, opt);
        (void)const_fold(m, types);
        (void)dce(m);
        (void)simplify_cfg(m);
    }

} // namespace vellum::ssa
