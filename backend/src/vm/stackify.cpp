// backend/src/vm/stackify.cpp
#include <vellum/backend/vm/Stackify.hpp>

#include <llvm/ADT/BitVector.h>

#include <type_traits>
#include <unordered_map>
#include <variant>


namespace vellum::backend::vm {

    using ssa::BlockId;
    using ssa::ValueId;
    using ssa::kInvalidId;

    namespace {

        bool is_const_inst_(const ssa::Inst& inst) {
            return std::holds_alternative<ssa::InstConstInt>(inst.data) ||
                   std::holds_alternative<ssa::InstConstBool>(inst.data) ||
                   std::holds_alternative<ssa::InstConstBytes>(inst.data);
        }

        /// @brief 블록 단위 생존 분석 + 간섭 그래프.
        class SlotAllocator final {
        public:
            SlotAllocator(const ssa::Module& m, const ssa::Function& f, SlotPlan& plan)
                : m_(m), f_(f), plan_(plan) {}

            void run() {
                index_locals_();
                if (locals_.empty()) return;
                compute_liveness_();
                build_interference_();
                color_();
            }

        private:
            void index_locals_() {
                dense_.assign(m_.values.size(), kNoSlot);
                auto add = [&](ValueId v) {
                    if (plan_.home[v] != ValueHome::kLocal || dense_[v] != kNoSlot) return;
                    dense_[v] = static_cast<uint32_t>(locals_.size());
                    locals_.push_back(v);
                };
                // entry 매개변수가 먼저 와야 slot을 고정할 수 있다.
                if (f_.entry != kInvalidId) {
                    for (auto p : m_.blocks[f_.entry].params) add(p);
                }
                for (auto bb : f_.blocks) {
                    const auto& b = m_.blocks[bb];
                    for (auto p : b.params) add(p);
                    for (auto iid : b.insts) {
                        const auto r = m_.insts[iid].result;
                        if (r != kInvalidId) add(r);
                    }
                }
            }

            uint32_t dense_of_(ValueId v) const {
                if (v == kInvalidId || (size_t)v >= dense_.size()) return kNoSlot;
                return dense_[v];
            }

            void compute_liveness_() {
                const size_t n = locals_.size();
                for (auto bb : f_.blocks) {
                    gen_[bb] = llvm::BitVector(n);
                    kill_[bb] = llvm::BitVector(n);
                    live_in_[bb] = llvm::BitVector(n);
                    live_out_[bb] = llvm::BitVector(n);

                    auto& gen = gen_[bb];
                    auto& kill = kill_[bb];
                    const auto& b = m_.blocks[bb];

                    auto use = [&](ValueId v) {
                        const uint32_t d = dense_of_(v);
                        if (d != kNoSlot && !kill.test(d)) gen.set(d);
                    };
                    for (auto p : b.params) {
                        const uint32_t d = dense_of_(p);
                        if (d != kNoSlot) kill.set(d);
                    }
                    for (auto iid : b.insts) {
                        const auto& inst = m_.insts[iid];
                        ssa::for_each_operand(inst.data, use);
                        const uint32_t d = dense_of_(inst.result);
                        if (d != kNoSlot) kill.set(d);
                    }
                    // 간선 인자는 선행 블록의 끝에서 읽힌다.
                    if (b.has_term) ssa::for_each_term_operand(b.term, use);
                }

                bool changed = true;
                while (changed) {
                    changed = false;
                    for (auto it = f_.blocks.rbegin(); it != f_.blocks.rend(); ++it) {
                        const BlockId bb = *it;
                        const auto& b = m_.blocks[bb];

                        llvm::BitVector out(locals_.size());
                        if (b.has_term) {
                            ssa::for_each_successor(b.term, [&](BlockId s) {
                                auto li = live_in_.find(s);
                                if (li != live_in_.end()) out |= li->second;
                            });
                        }

                        llvm::BitVector in = out;
                        in.reset(kill_[bb]);
                        in |= gen_[bb];

                        if (in != live_in_[bb] || out != live_out_[bb]) {
                            live_in_[bb] = std::move(in);
                            live_out_[bb] = std::move(out);
                            changed = true;
                        }
                    }
                }
            }

            void interfere_(uint32_t a, uint32_t b) {
                if (a == b) return;
                adj_[a].set(b);
                adj_[b].set(a);
            }

            void interfere_all_(uint32_t d, const llvm::BitVector& live) {
                for (auto x : live.set_bits()) interfere_(d, static_cast<uint32_t>(x));
            }

            void build_interference_() {
                const size_t n = locals_.size();
                adj_.assign(n, llvm::BitVector(n));

                for (auto bb : f_.blocks) {
                    const auto& b = m_.blocks[bb];
                    llvm::BitVector live = live_out_[bb];

                    auto use = [&](ValueId v) {
                        const uint32_t d = dense_of_(v);
                        if (d != kNoSlot) live.set(d);
                    };
                    if (b.has_term) ssa::for_each_term_operand(b.term, use);

                    for (auto it = b.insts.rbegin(); it != b.insts.rend(); ++it) {
                        const auto& inst = m_.insts[*it];
                        const uint32_t d = dense_of_(inst.result);
                        if (d != kNoSlot) {
                            // 정의 지점에서 살아 있는 값과는 slot을 나눌 수 없다.
                            interfere_all_(d, live);
                            live.reset(d);
                        }
                        ssa::for_each_operand(inst.data, use);
                    }

                    // block param은 진입 시점에 동시에 쓰인다(죽은 param 포함).
                    for (size_t i = 0; i < b.params.size(); ++i) {
                        const uint32_t d = dense_of_(b.params[i]);
                        if (d == kNoSlot) continue;
                        interfere_all_(d, live);
                        for (size_t j = i + 1; j < b.params.size(); ++j) {
                            const uint32_t e = dense_of_(b.params[j]);
                            if (e != kNoSlot) interfere_(d, e);
                        }
                    }
                }
            }

            void color_() {
                const size_t n = locals_.size();
                std::vector<uint32_t> color(n, kNoSlot);

                uint32_t fixed = 0;
                if (f_.entry != kInvalidId) {
                    for (auto p : m_.blocks[f_.entry].params) {
                        const uint32_t d = dense_of_(p);
                        if (d != kNoSlot) color[d] = fixed;
                        ++fixed;
                    }
                }
                uint32_t used = fixed;

                for (size_t i = 0; i < n; ++i) {
                    if (color[i] != kNoSlot) continue;
                    llvm::BitVector taken(used + 1);
                    for (auto x : adj_[i].set_bits()) {
                        if (color[x] != kNoSlot) taken.set(color[x]);
                    }
                    const int free_slot = taken.find_first_unset();
                    color[i] = (free_slot < 0) ? used : static_cast<uint32_t>(free_slot);
                    if (color[i] >= used) used = color[i] + 1;
                }

                for (size_t i = 0; i < n; ++i) plan_.slot[locals_[i]] = color[i];
                plan_.num_slots = used;
            }

            const ssa::Module& m_;
            const ssa::Function& f_;
            SlotPlan& plan_;

            std::vector<uint32_t> dense_;
            std::vector<ValueId> locals_;

            std::unordered_map<BlockId, llvm::BitVector> gen_;
            std::unordered_map<BlockId, llvm::BitVector> kill_;
            std::unordered_map<BlockId, llvm::BitVector> live_in_;
            std::unordered_map<BlockId, llvm::BitVector> live_out_;
            std::vector<llvm::BitVector> adj_;
        };

    } // namespace

    ValueId stack_operand(const ssa::Inst& inst) {
        return std::visit([&](auto&& x) -> ValueId {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, ssa::InstBinOp>) {
                const bool cmp_or_bits =
                    x.op == ssa::BinOp::Eq || x.op == ssa::BinOp::Ne || x.op == ssa::BinOp::Lt ||
                    x.op == ssa::BinOp::Le || x.op == ssa::BinOp::Gt || x.op == ssa::BinOp::Ge ||
                    x.op == ssa::BinOp::And || x.op == ssa::BinOp::Or || x.op == ssa::BinOp::Xor;
                if (cmp_or_bits) return x.lhs;
                if (x.op == ssa::BinOp::Rem && x.mode != ssa::ArithMode::Checked) return x.lhs;
                if (x.mode == ssa::ArithMode::Wrapping && x.op != ssa::BinOp::Div) return x.lhs;
                return kInvalidId;
            } else if constexpr (std::is_same_v<T, ssa::InstUnary>) {
                return (x.op == ssa::UnOp::Neg) ? kInvalidId : x.src;
            } else if constexpr (std::is_same_v<T, ssa::InstCast>) {
                return (x.mode == ssa::CastMode::Wrapping) ? x.src : kInvalidId;
            } else if constexpr (std::is_same_v<T, ssa::InstExtractField>) {
                return x.base;
            } else if constexpr (std::is_same_v<T, ssa::InstResultIsOk> ||
                                 std::is_same_v<T, ssa::InstResultCode> ||
                                 std::is_same_v<T, ssa::InstBytesLen>) {
                return x.src;
            } else if constexpr (std::is_same_v<T, ssa::InstRefLoad> ||
                                 std::is_same_v<T, ssa::InstRefStore>) {
                return x.ref;
            } else if constexpr (std::is_same_v<T, ssa::InstCall>) {
                return x.args.empty() ? kInvalidId : x.args.front();
            } else {
                return kInvalidId;
            }
        }, inst.data);
    }

    ValueId stack_operand(const ssa::Terminator& term) {
        if (const auto* cb = std::get_if<ssa::TermCondBr>(&term)) return cb->cond;
        if (const auto* r = std::get_if<ssa::TermRet>(&term)) return r->has_value ? r->value : kInvalidId;
        return kInvalidId;
    }

    SlotPlan plan_slots(const ssa::Module& m, const ssa::Function& f) {
        SlotPlan plan{};
        plan.home.assign(m.values.size(), ValueHome::kNone);
        plan.slot.assign(m.values.size(), kNoSlot);

        // 1) 사용 횟수
        std::vector<uint32_t> uses(m.values.size(), 0);
        auto count = [&](ValueId v) {
            if (v != kInvalidId && (size_t)v < uses.size()) ++uses[v];
        };
        for (auto bb : f.blocks) {
            const auto& b = m.blocks[bb];
            for (auto iid : b.insts) ssa::for_each_operand(m.insts[iid].data, count);
            if (b.has_term) ssa::for_each_term_operand(b.term, count);
        }

        // 2) home 결정
        for (auto bb : f.blocks) {
            const auto& b = m.blocks[bb];
            const bool is_entry = (bb == f.entry);
            for (auto p : b.params) {
                if (is_entry || uses[p] != 0) plan.home[p] = ValueHome::kLocal;
            }

            for (size_t i = 0; i < b.insts.size(); ++i) {
                const auto& inst = m.insts[b.insts[i]];
                const ValueId r = inst.result;
                if (r == kInvalidId) continue;

                if (is_const_inst_(inst)) {
                    plan.home[r] = ValueHome::kConst;
                    continue;
                }
                if (uses[r] == 0) continue;

                ValueId next_operand = kInvalidId;
                if (i + 1 < b.insts.size()) {
                    next_operand = stack_operand(m.insts[b.insts[i + 1]]);
                } else if (b.has_term) {
                    next_operand = stack_operand(b.term);
                }
                plan.home[r] = (uses[r] == 1 && next_operand == r) ? ValueHome::kStack : ValueHome::kLocal;
            }
        }

        // 3) local slot 색칠
        SlotAllocator alloc(m, f, plan);
        alloc.run();
        if (f.entry != kInvalidId && plan.num_slots < m.blocks[f.entry].params.size()) {
            plan.num_slots = static_cast<uint32_t>(m.blocks[f.entry].params.size());
        }

        for (auto h : plan.home) {
            if (h == ValueHome::kStack) ++plan.stack_values;
            else if (h == ValueHome::kLocal) ++plan.local_values;
            else if (h == ValueHome::kConst) ++plan.const_values;
        }
        return plan;
    }

} // namespace vellum::backend::vm
