// frontend/src/ssa/ssa_verify.cpp
#include <vellum/ssa/Cfg.hpp>
#include <vellum/ssa/Verify.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>


namespace vellum::ssa {

    namespace {

        /// @brief verify 오류를 수집 벡터에 추가한다.
        void push_error_(std::vector<VerifyError>& out, const std::string& msg) {
            out.push_back(VerifyError{msg});
        }

        /// @brief 값 ID 범위 유효성을 검사한다.
        bool check_value_id_(
            const Module& m,
            std::vector<VerifyError>& errs,
            uint32_t where_id,
            const char* where_kind,
            ValueId vid
        ) {
            if (vid == kInvalidId || (size_t)vid >= m.values.size()) {
                std::ostringstream oss;
                oss << where_kind << " #" << where_id
                    << " references invalid value id v" << vid;
                push_error_(errs, oss.str());
                return false;
            }
            return true;
        }

        struct DefLoc {
            bool known = false;
            bool is_block_param = false;
            BlockId bb = kInvalidId;
            uint32_t ord = 0;   // block 내 inst 순서
        };

        class FunctionVerifier final {
        public:
            FunctionVerifier(const Module& m, FuncId fid, const VerifyOptions& opt, std::vector<VerifyError>& errs)
                : m_(m), f_(m.funcs[fid]), opt_(opt), errs_(errs),
                  owned_(owned_block_mask(m, f_)), defs_(m.values.size()) {}

            void run() {
                if (f_.entry == kInvalidId || (size_t)f_.entry >= m_.blocks.size()) {
                    push_error_(errs_, "function has invalid entry: " + f_.name);
                    return;
                }
                if (!owned_[f_.entry]) {
                    std::ostringstream oss;
                    oss << "function " << f_.name << " entry bb#" << f_.entry
                        << " is not present in function block list";
                    push_error_(errs_, oss.str());
                    return;
                }

                for (auto bbid : f_.blocks) {
                    if (bbid == kInvalidId || (size_t)bbid >= m_.blocks.size()) {
                        std::ostringstream oss;
                        oss << "function " << f_.name << " has invalid block id bb#" << bbid;
                        push_error_(errs_, oss.str());
                        return;
                    }
                }

                verify_entry_();
                collect_defs_();

                for (auto bbid : f_.blocks) {
                    const auto& b = m_.blocks[bbid];
                    if (!b.has_term) {
                        std::ostringstream oss;
                        oss << "block has no terminator: #" << bbid;
                        push_error_(errs_, oss.str());
                        continue;
                    }
                    verify_terminator_(bbid, b.term);
                    for (auto iid : b.insts) verify_inst_(iid);
                }

                verify_dominance_();
            }

        private:
            void verify_entry_() {
                const auto& entry = m_.blocks[f_.entry];
                if (entry.params.size() != f_.param_tys.size()) {
                    std::ostringstream oss;
                    oss << "function " << f_.name << " entry has " << entry.params.size()
                        << " params, signature has " << f_.param_tys.size();
                    push_error_(errs_, oss.str());
                } else {
                    for (size_t i = 0; i < entry.params.size(); ++i) {
                        const ValueId p = entry.params[i];
                        if (!check_value_id_(m_, errs_, f_.entry, "block(param)", p)) continue;
                        if (m_.values[p].ty != f_.param_tys[i]) {
                            std::ostringstream oss;
                            oss << "function " << f_.name << " entry param " << i
                                << " type mismatch (ty=" << m_.values[p].ty
                                << ", expected ty=" << f_.param_tys[i] << ")";
                            push_error_(errs_, oss.str());
                        }
                    }
                }

                const auto preds = build_preds(m_, f_);
                if (!preds[f_.entry].empty()) {
                    std::ostringstream oss;
                    oss << "function " << f_.name << " entry bb#" << f_.entry
                        << " has " << preds[f_.entry].size() << " predecessor(s)";
                    push_error_(errs_, oss.str());
                }
            }

            /// @brief 정의 위치를 모으며 단일 정의를 검사한다.
            void collect_defs_() {
                auto define = [&](ValueId v, const DefLoc& loc, const char* what, uint32_t where) {
                    if (!check_value_id_(m_, errs_, where, what, v)) return;
                    if (defs_[v].known) {
                        std::ostringstream oss;
                        oss << "value v" << v << " is defined more than once in function " << f_.name;
                        push_error_(errs_, oss.str());
                        return;
                    }
                    defs_[v] = loc;
                };

                for (auto bbid : f_.blocks) {
                    const auto& b = m_.blocks[bbid];
                    for (uint32_t i = 0; i < b.params.size(); ++i) {
                        const ValueId p = b.params[i];
                        define(p, DefLoc{true, true, bbid, 0}, "block(param)", bbid);
                        if (p < m_.values.size() &&
                            (m_.values[p].def_a != bbid || m_.values[p].def_b != i)) {
                            std::ostringstream oss;
                            oss << "block #" << bbid << " param v" << p << " has stale def site";
                            push_error_(errs_, oss.str());
                        }
                    }
                    for (uint32_t k = 0; k < b.insts.size(); ++k) {
                        const InstId iid = b.insts[k];
                        if ((size_t)iid >= m_.insts.size()) {
                            std::ostringstream oss;
                            oss << "block #" << bbid << " references invalid inst id i" << iid;
                            push_error_(errs_, oss.str());
                            continue;
                        }
                        const ValueId r = m_.insts[iid].result;
                        if (r == kInvalidId) continue;
                        define(r, DefLoc{true, false, bbid, k}, "inst(result)", iid);
                        if (r < m_.values.size() &&
                            (m_.values[r].def_a != iid || m_.values[r].def_b != kInvalidId)) {
                            std::ostringstream oss;
                            oss << "inst #" << iid << " result v" << r << " has stale def site";
                            push_error_(errs_, oss.str());
                        }
                    }
                }
            }

            void check_edge_(BlockId bbid, BlockId target, const std::vector<ValueId>& args, const char* tag) {
                if (target == kInvalidId || (size_t)target >= m_.blocks.size()) {
                    std::ostringstream oss;
                    oss << "block #" << bbid << " has " << tag << " with invalid target bb#" << target;
                    push_error_(errs_, oss.str());
                    return;
                }
                if (!owned_[target]) {
                    std::ostringstream oss;
                    oss << "block #" << bbid << " " << tag << " targets foreign block bb#" << target
                        << " (outside function " << f_.name << ")";
                    push_error_(errs_, oss.str());
                    return;
                }
                for (auto v : args) (void)check_value_id_(m_, errs_, bbid, "block(term arg)", v);

                const auto& tb = m_.blocks[target];
                if (args.size() != tb.params.size()) {
                    std::ostringstream oss;
                    oss << "block #" << bbid << " " << tag << " arg count mismatch: got " << args.size()
                        << ", target bb#" << target << " expects " << tb.params.size();
                    push_error_(errs_, oss.str());
                    return;
                }
                for (uint32_t i = 0; i < args.size(); ++i) {
                    const ValueId arg = args[i];
                    const ValueId param = tb.params[i];
                    if ((size_t)arg >= m_.values.size() || (size_t)param >= m_.values.size()) continue;
                    if (m_.values[arg].ty != m_.values[param].ty) {
                        std::ostringstream oss;
                        oss << "block #" << bbid << " " << tag << " arg type mismatch at index " << i
                            << ": arg v" << arg << "(ty=" << m_.values[arg].ty << ") != "
                            << "target param v" << param << "(ty=" << m_.values[param].ty << ")";
                        push_error_(errs_, oss.str());
                    }
                }
            }

            void verify_terminator_(BlockId bbid, const Terminator& term) {
                std::visit([&](auto&& t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, TermRet>) {
                        if (!t.has_value) return;
                        if (!check_value_id_(m_, errs_, bbid, "block(term ret)", t.value)) return;
                        if (m_.values[t.value].ty != f_.ret_ty) {
                            std::ostringstream oss;
                            oss << "block #" << bbid << " returns v" << t.value << "(ty="
                                << m_.values[t.value].ty << "), function " << f_.name
                                << " returns ty=" << f_.ret_ty;
                            push_error_(errs_, oss.str());
                        }
                    } else if constexpr (std::is_same_v<T, TermBr>) {
                        check_edge_(bbid, t.target, t.args, "br");
                    } else if constexpr (std::is_same_v<T, TermCondBr>) {
                        (void)check_value_id_(m_, errs_, bbid, "block(term cond)", t.cond);
                        check_edge_(bbid, t.then_bb, t.then_args, "condbr then");
                        check_edge_(bbid, t.else_bb, t.else_args, "condbr else");
                    }
                }, term);
            }

            void verify_inst_(InstId iid) {
                if ((size_t)iid >= m_.insts.size()) return;
                const auto& inst = m_.insts[iid];

                for_each_operand(inst.data, [&](ValueId v) {
                    (void)check_value_id_(m_, errs_, iid, "inst(operand)", v);
                });

                if (const auto* c = std::get_if<InstCall>(&inst.data)) {
                    if (c->callee == kInvalidId || (size_t)c->callee >= m_.funcs.size()) {
                        std::ostringstream oss;
                        oss << "inst #" << iid << " has invalid direct callee id f" << c->callee;
                        push_error_(errs_, oss.str());
                        return;
                    }
                    const auto& callee = m_.funcs[c->callee];
                    if (c->args.size() != callee.param_tys.size()) {
                        std::ostringstream oss;
                        oss << "inst #" << iid << " call to " << callee.name << " passes "
                            << c->args.size() << " args, expects " << callee.param_tys.size();
                        push_error_(errs_, oss.str());
                        return;
                    }
                    for (size_t i = 0; i < c->args.size(); ++i) {
                        const ValueId a = c->args[i];
                        if ((size_t)a >= m_.values.size()) continue;
                        if (m_.values[a].ty != callee.param_tys[i]) {
                            std::ostringstream oss;
                            oss << "inst #" << iid << " call arg " << i << " type mismatch (ty="
                                << m_.values[a].ty << ", expected ty=" << callee.param_tys[i] << ")";
                            push_error_(errs_, oss.str());
                        }
                    }
                }
            }

            /// @brief 같은 블록이면 정의가 먼저, 아니면 정의 블록이 사용 블록을 지배해야 한다.
            bool available_(const DomInfo& dom, ValueId v, BlockId use_bb, uint32_t use_ord) const {
                if ((size_t)v >= defs_.size()) return false;
                const auto& d = defs_[v];
                if (!d.known) return false;
                if (d.bb == use_bb) {
                    if (d.is_block_param) return true;
                    return d.ord < use_ord;
                }
                return dominates(dom, d.bb, use_bb);
            }

            void verify_dominance_() {
                const auto dom = build_dom_info(m_, f_);
                if (dom.entry_index == UINT32_MAX) return;

                for (uint32_t bi = 0; bi < dom.blocks.size(); ++bi) {
                    const BlockId bbid = dom.blocks[bi];
                    if (!dom.reachable[bi]) {
                        if (opt_.require_reachable) {
                            std::ostringstream oss;
                            oss << "function " << f_.name << " has unreachable block bb#" << bbid;
                            push_error_(errs_, oss.str());
                        }
                        continue;
                    }

                    const auto& b = m_.blocks[bbid];
                    auto report = [&](ValueId v, const char* where) {
                        std::ostringstream oss;
                        oss << "block #" << bbid << " " << where << " uses v" << v
                            << " which does not dominate the use";
                        push_error_(errs_, oss.str());
                    };

                    for (uint32_t k = 0; k < b.insts.size(); ++k) {
                        const InstId iid = b.insts[k];
                        if ((size_t)iid >= m_.insts.size()) continue;
                        for_each_operand(m_.insts[iid].data, [&](ValueId v) {
                            if ((size_t)v >= m_.values.size()) return;
                            if (!available_(dom, v, bbid, k)) report(v, "inst");
                        });
                    }
                    if (b.has_term) {
                        const uint32_t end = static_cast<uint32_t>(b.insts.size());
                        for_each_term_operand(b.term, [&](ValueId v) {
                            if ((size_t)v >= m_.values.size()) return;
                            if (!available_(dom, v, bbid, end)) report(v, "terminator");
                        });
                    }
                }
            }

            const Module& m_;
            const Function& f_;
            const VerifyOptions& opt_;
            std::vector<VerifyError>& errs_;

            std::vector<uint8_t> owned_;
            std::vector<DefLoc> defs_;
        };

    } // namespace

    std::vector<VerifyError> verify_function(const Module& m, FuncId fid, const VerifyOptions& opt) {
        std::vector<VerifyError> errs;
        if (fid >= m.funcs.size()) {
            std::ostringstream oss;
            oss << "invalid function id f" << fid;
            push_error_(errs, oss.str());
            return errs;
        }
        if (m.funcs[fid].excluded) return errs;

        FunctionVerifier v(m, fid, opt, errs);
        v.run();
        return errs;
    }

    std::vector<VerifyError> verify(const Module& m, const VerifyOptions& opt) {
        std::vector<VerifyError> errs;

        // block 소속(owner) 계산: 하나의 블록은 정확히 하나의 함수에 소속되어야 한다.
        std::vector<uint32_t> block_owner(m.blocks.size(), kInvalidId);
        for (uint32_t fi = 0; fi < (uint32_t)m.funcs.size(); ++fi) {
            for (auto bb : m.funcs[fi].blocks) {
                if (bb == kInvalidId || (size_t)bb >= m.blocks.size()) continue;
                if (block_owner[bb] == kInvalidId) block_owner[bb] = fi;
                else if (block_owner[bb] != fi) {
                    std::ostringstream oss;
                    oss << "block #" << bb << " is owned by multiple functions (#"
                        << block_owner[bb] << ", #" << fi << ")";
                    push_error_(errs, oss.str());
                }
            }
        }

        for (FuncId fi = 0; fi < m.funcs.size(); ++fi) {
            auto fe = verify_function(m, fi, opt);
            errs.insert(errs.end(), fe.begin(), fe.end());
        }
        return errs;
    }

} // namespace vellum::ssa
