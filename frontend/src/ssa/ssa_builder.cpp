// frontend/src/ssa/ssa_builder.cpp
#include <vellum/ssa/Builder.hpp>

#include <algorithm>
#include <utility>
#include <vector>


namespace vellum::ssa {

    namespace {

        using hir::SymbolId;

        /// @brief join으로 들어오는 간선 하나: 선행 블록과 그 시점의 바인딩 값.
        struct Edge {
            BlockId pred = kInvalidId;
            std::vector<ValueId> env;
            std::vector<ValueId> extra;   // select / && / || 결과값
        };

        struct LoopFrame {
            BlockId header = kInvalidId;
            BlockId exit = kInvalidId;
            std::vector<SymbolId> syms;   // header param 순서
            std::vector<SymbolId> exit_syms;   // exit param 순서. 루프 뒤에서 읽히는 syms만
            std::vector<SymbolId> uses;   // 조건식 + 본문에서 읽는 바인딩
        };

        /// @brief 아직 남은 문장 범위(liveness 질의용).
        struct ContFrame {
            hir::BlockId block = hir::kInvalidId;
            uint32_t next = 0;
        };

        BinOp map_binop_(hir::BinaryOp op) {
            switch (op) {
                case hir::BinaryOp::kAdd: return BinOp::Add;
                case hir::BinaryOp::kSub: return BinOp::Sub;
                case hir::BinaryOp::kMul: return BinOp::Mul;
                case hir::BinaryOp::kDiv: return BinOp::Div;
                case hir::BinaryOp::kRem: return BinOp::Rem;
                case hir::BinaryOp::kShl: return BinOp::Shl;
                case hir::BinaryOp::kShr: return BinOp::Shr;
                case hir::BinaryOp::kBitAnd: return BinOp::And;
                case hir::BinaryOp::kBitOr: return BinOp::Or;
                case hir::BinaryOp::kBitXor: return BinOp::Xor;
                case hir::BinaryOp::kEq: return BinOp::Eq;
                case hir::BinaryOp::kNe: return BinOp::Ne;
                case hir::BinaryOp::kLt: return BinOp::Lt;
                case hir::BinaryOp::kLe: return BinOp::Le;
                case hir::BinaryOp::kGt: return BinOp::Gt;
                case hir::BinaryOp::kGe: return BinOp::Ge;
                case hir::BinaryOp::kLogicalAnd:
                case hir::BinaryOp::kLogicalOr:
                    break;
            }
            return BinOp::Eq;
        }

        ArithMode map_mode_(hir::ArithMode m) {
            switch (m) {
                case hir::ArithMode::kDefault: return ArithMode::Trap;
                case hir::ArithMode::kWrapping: return ArithMode::Wrapping;
                case hir::ArithMode::kSaturating: return ArithMode::Saturating;
                case hir::ArithMode::kChecked: return ArithMode::Checked;
            }
            return ArithMode::Trap;
        }

        bool is_compare_(BinOp op) {
            return op == BinOp::Eq || op == BinOp::Ne || op == BinOp::Lt ||
                   op == BinOp::Le || op == BinOp::Gt || op == BinOp::Ge;
        }

        bool is_bitwise_(BinOp op) {
            return op == BinOp::And || op == BinOp::Or || op == BinOp::Xor;
        }

        Effect binop_effect_(BinOp op, ArithMode mode) {
            if (is_compare_(op) || is_bitwise_(op)) return Effect::Pure;
            if (mode == ArithMode::Checked) return Effect::Pure;
            if (mode == ArithMode::Trap) return Effect::MayTrap;
            // wrapping/saturating은 검사가 없지만 0으로 나누기는 네이티브 trap이다.
            return (op == BinOp::Div || op == BinOp::Rem) ? Effect::MayTrap : Effect::Pure;
        }

        void sort_unique_(std::vector<SymbolId>& v) {
            std::sort(v.begin(), v.end());
            v.erase(std::unique(v.begin(), v.end()), v.end());
        }

        bool contains_(const std::vector<SymbolId>& sorted, SymbolId s) {
            return std::binary_search(sorted.begin(), sorted.end(), s);
        }

        /// @brief edge가 target으로 갈 때 넘기는 인자를 덧붙인다.
        void append_edge_arg_(Module& m, BlockId pred, BlockId target, ValueId arg) {
            auto& b = m.blocks[pred];
            if (auto* br = std::get_if<TermBr>(&b.term)) {
                if (br->target == target) br->args.push_back(arg);
            } else if (auto* cb = std::get_if<TermCondBr>(&b.term)) {
                if (cb->then_bb == target) cb->then_args.push_back(arg);
                if (cb->else_bb == target) cb->else_args.push_back(arg);
            }
        }

        /// @brief 함수 하나를 SSA로 낮춘다.
        class FnBuilder final {
        public:
            FnBuilder(const hir::Module& hm, ty::TypePool& types, Module& m, FuncId fid)
                : hm_(hm), types_(types), m_(m), fid_(fid),
                  env_(hm.symbols.size(), kInvalidId),
                  uses_(hm.stmts.size()), uses_done_(hm.stmts.size(), 0) {}

            void build() {
                const auto& hf = hm_.funcs[fid_];

                const BlockId entry = new_block_();
                m_.funcs[fid_].entry = entry;
                cur_ = entry;

                for (uint32_t i = 0; i < hf.param_count; ++i) {
                    const auto& p = hm_.param(hf, i);
                    const ValueId v = add_param_(entry, m_.funcs[fid_].param_tys[i]);
                    m_.values[v].span = p.span;
                    env_[p.sym] = v;
                }

                lower_block_(hf.body);

                if (open_()) {
                    if (types_.is_unit(hf.ret)) terminate_(TermRet{});
                    else terminate_(TermUnreachable{});
                }
            }

            uint32_t phi_params() const { return phi_params_; }

        private:
            // ---------------- block / value helpers ----------------
            bool open_() const { return cur_ != kInvalidId; }

            BlockId new_block_() {
                const BlockId b = m_.add_block(Block{});
                m_.funcs[fid_].blocks.push_back(b);
                return b;
            }

            ValueId add_param_(BlockId bb, TypeId t) {
                Value v{};
                v.ty = t;
                v.def_a = bb;
                v.def_b = static_cast<uint32_t>(m_.blocks[bb].params.size());
                const ValueId id = m_.add_value(v);
                m_.blocks[bb].params.push_back(id);
                return id;
            }

            ValueId emit_(InstData data, TypeId t, Effect eff, Span sp) {
                Inst inst{};
                inst.data = std::move(data);
                inst.eff = eff;
                inst.span = sp;

                ValueId r = kInvalidId;
                if (t != ty::kInvalidType && !types_.is_unit(t)) {
                    Value v{};
                    v.ty = t;
                    v.eff = eff;
                    v.span = sp;
                    r = m_.add_value(v);
                }
                inst.result = r;

                const InstId iid = m_.add_inst(inst);
                if (r != kInvalidId) m_.values[r].def_a = iid;
                m_.blocks[cur_].insts.push_back(iid);
                return r;
            }

            void terminate_(Terminator t) {
                auto& b = m_.blocks[cur_];
                b.term = std::move(t);
                b.has_term = true;
                cur_ = kInvalidId;
            }

            bool is_ref_sym_(SymbolId s) const {
                const auto& sym = hm_.symbols[s];
                return sym.is_param && sym.pass == hir::PassMode::kMut;
            }

            // ---------------- liveness pre-scan ----------------
            void expr_uses_(hir::ExprId eid, std::vector<SymbolId>& out) const {
                if (eid == hir::kInvalidId) return;
                const auto& e = hm_.exprs[eid];
                if (e.kind == hir::ExprKind::kLocal) {
                    out.push_back(e.sym);
                    return;
                }
                expr_uses_(e.a, out);
                expr_uses_(e.b, out);
                expr_uses_(e.c, out);
                if (e.kind == hir::ExprKind::kCall || e.kind == hir::ExprKind::kStructLit ||
                    e.kind == hir::ExprKind::kEmit) {
                    for (uint32_t i = 0; i < e.arg_count; ++i) expr_uses_(hm_.arg(e, i), out);
                }
            }

            void block_uses_(hir::BlockId bid, std::vector<SymbolId>& out) {
                if (bid == hir::kInvalidId) return;
                const auto& b = hm_.blocks[bid];
                for (uint32_t i = 0; i < b.stmt_count; ++i) {
                    const auto& u = stmt_uses_(hm_.block_stmt(b, i));
                    out.insert(out.end(), u.begin(), u.end());
                }
            }

            /// @brief 문장(하위 블록 포함)이 읽는 바인딩 집합. 정렬되어 있다.
            const std::vector<SymbolId>& stmt_uses_(hir::StmtId sid) {
                if (uses_done_[sid]) return uses_[sid];
                std::vector<SymbolId> out;
                const auto& s = hm_.stmts[sid];
                expr_uses_(s.expr, out);
                if (s.kind == hir::StmtKind::kAssign && s.has_field) out.push_back(s.sym);
                block_uses_(s.a, out);
                block_uses_(s.b, out);
                sort_unique_(out);
                uses_[sid] = std::move(out);
                uses_done_[sid] = 1;
                return uses_[sid];
            }

            void expr_defs_(hir::ExprId eid, std::vector<SymbolId>& out) const {
                if (eid == hir::kInvalidId) return;
                const auto& e = hm_.exprs[eid];
                expr_defs_(e.a, out);
                expr_defs_(e.b, out);
                expr_defs_(e.c, out);
                if (e.kind == hir::ExprKind::kCall) {
                    const auto& callee = hm_.funcs[e.callee];
                    for (uint32_t i = 0; i < e.arg_count; ++i) {
                        const auto aid = hm_.arg(e, i);
                        if (hm_.param(callee, i).pass == hir::PassMode::kMut) {
                            out.push_back(hm_.exprs[aid].sym);
                        } else {
                            expr_defs_(aid, out);
                        }
                    }
                } else if (e.kind == hir::ExprKind::kStructLit || e.kind == hir::ExprKind::kEmit) {
                    for (uint32_t i = 0; i < e.arg_count; ++i) expr_defs_(hm_.arg(e, i), out);
                }
            }

            /// @brief 블록 안에서 다시 묶이는 바인딩(대입, `mut` 인자).
            void block_defs_(hir::BlockId bid, std::vector<SymbolId>& out) const {
                if (bid == hir::kInvalidId) return;
                const auto& b = hm_.blocks[bid];
                for (uint32_t i = 0; i < b.stmt_count; ++i) {
                    const auto& s = hm_.stmts[hm_.block_stmt(b, i)];
                    if (s.kind == hir::StmtKind::kAssign) out.push_back(s.sym);
                    expr_defs_(s.expr, out);
                    block_defs_(s.a, out);
                    block_defs_(s.b, out);
                }
            }

            bool live_after_(SymbolId s) {
                for (const auto& lf : loops_) {
                    if (std::find(lf.syms.begin(), lf.syms.end(), s) != lf.syms.end()) return true;
                    if (contains_(lf.uses, s)) return true;
                }
                for (const auto& cf : cont_) {
                    const auto& b = hm_.blocks[cf.block];
                    for (uint32_t i = cf.next; i < b.stmt_count; ++i) {
                        if (contains_(stmt_uses_(hm_.block_stmt(b, i)), s)) return true;
                    }
                }
                return false;
            }

            // ---------------- joins ----------------
            /// @brief join 블록의 param을 정하고 각 간선에 인자를 붙인 뒤 join으로 이동한다.
            std::vector<ValueId> seal_join_(
                BlockId join,
                const std::vector<Edge>& edges,
                const std::vector<TypeId>& extra_tys,
                bool live_filter
            ) {
                std::vector<ValueId> merged = edges.front().env;

                for (SymbolId s = 0; s < merged.size(); ++s) {
                    const ValueId v0 = edges.front().env[s];
                    bool differ = false;
                    bool undefined = (v0 == kInvalidId);
                    for (size_t i = 1; i < edges.size(); ++i) {
                        const ValueId vi = edges[i].env[s];
                        if (vi != v0) differ = true;
                        if (vi == kInvalidId) undefined = true;
                    }
                    if (!differ) continue;
                    if (undefined || (live_filter && !live_after_(s))) {
                        merged[s] = kInvalidId;
                        continue;
                    }

                    const ValueId p = add_param_(join, m_.values[v0].ty);
                    ++phi_params_;
                    for (const auto& e : edges) append_edge_arg_(m_, e.pred, join, e.env[s]);
                    merged[s] = p;
                }

                std::vector<ValueId> extras;
                for (size_t k = 0; k < extra_tys.size(); ++k) {
                    const ValueId p = add_param_(join, extra_tys[k]);
                    ++phi_params_;
                    for (const auto& e : edges) append_edge_arg_(m_, e.pred, join, e.extra[k]);
                    extras.push_back(p);
                }

                env_ = std::move(merged);
                cur_ = join;
                return extras;
            }

            // ---------------- statements ----------------
            void lower_block_(hir::BlockId bid) {
                if (bid == hir::kInvalidId) return;
                const auto& b = hm_.blocks[bid];

                cont_.push_back(ContFrame{bid, 0});
                for (uint32_t i = 0; i < b.stmt_count; ++i) {
                    if (!open_()) break;   // terminator 이후 문장은 도달 불가
                    cont_.back().next = i + 1;
                    lower_stmt_(hm_.block_stmt(b, i));
                }
                cont_.pop_back();
            }

            void lower_stmt_(hir::StmtId sid) {
                const auto& s = hm_.stmts[sid];

                switch (s.kind) {
                    case hir::StmtKind::kExpr:
                        (void)lower_expr_(s.expr);
                        return;

                    case hir::StmtKind::kLet:
                        env_[s.sym] = lower_expr_(s.expr);
                        return;

                    case hir::StmtKind::kAssign:
                        lower_assign_(s);
                        return;

                    case hir::StmtKind::kIf:
                        lower_if_(s);
                        return;

                    case hir::StmtKind::kWhile:
                        lower_while_(s);
                        return;

                    case hir::StmtKind::kReturn: {
                        TermRet r{};
                        if (s.expr != hir::kInvalidId) {
                            r.value = lower_expr_(s.expr);
                            r.has_value = (r.value != kInvalidId);
                        }
                        terminate_(std::move(r));
                        return;
                    }

                    case hir::StmtKind::kBreak: {
                        const auto& lf = loops_.back();
                        TermBr br{};
                        br.target = lf.exit;
                        for (auto x : lf.exit_syms) br.args.push_back(env_[x]);
                        terminate_(std::move(br));
                        return;
                    }

                    case hir::StmtKind::kContinue: {
                        const auto& lf = loops_.back();
                        TermBr br{};
                        br.target = lf.header;
                        for (auto x : lf.syms) br.args.push_back(env_[x]);
                        terminate_(std::move(br));
                        return;
                    }

                    case hir::StmtKind::kRequire: {
                        const ValueId c = lower_expr_(s.expr);
                        const BlockId ok_bb = new_block_();
                        const BlockId fail_bb = new_block_();

                        TermCondBr cb{};
                        cb.cond = c;
                        cb.then_bb = ok_bb;
                        cb.else_bb = fail_bb;
                        terminate_(std::move(cb));

                        cur_ = fail_bb;
                        terminate_(TermRevert{RevertKind::Recoverable, s.message});
                        cur_ = ok_bb;
                        return;
                    }

                    case hir::StmtKind::kRevert:
                        terminate_(TermRevert{RevertKind::Recoverable, s.message});
                        return;

                    case hir::StmtKind::kPanic:
                        terminate_(TermRevert{RevertKind::Abort, s.message});
                        return;
                }
            }

            void lower_assign_(const hir::Stmt& s) {
                const ValueId v = lower_expr_(s.expr);
                const TypeId target_ty = hm_.symbols[s.sym].type;

                if (is_ref_sym_(s.sym)) {
                    const ValueId ref = env_[s.sym];
                    ValueId stored = v;
                    if (s.has_field) {
                        const ValueId old = emit_(InstRefLoad{ref}, target_ty, Effect::MayReadMem, s.span);
                        stored = emit_(InstInsertField{old, s.field_index, v}, target_ty, Effect::Pure, s.span);
                    }
                    (void)emit_(InstRefStore{ref, stored}, ty::kInvalidType, Effect::MayWriteMem, s.span);
                    return;
                }

                if (s.has_field) {
                    env_[s.sym] = emit_(InstInsertField{env_[s.sym], s.field_index, v}, target_ty, Effect::Pure, s.span);
                } else {
                    env_[s.sym] = v;
                }
            }

            void lower_if_(const hir::Stmt& s) {
                const ValueId c = lower_expr_(s.expr);
                if (!open_()) return;

                const bool has_else = (s.b != hir::kInvalidId);
                const BlockId then_bb = new_block_();
                const BlockId else_bb = has_else ? new_block_() : kInvalidId;
                BlockId join = has_else ? kInvalidId : new_block_();

                const BlockId pred = cur_;
                const std::vector<ValueId> env_before = env_;

                TermCondBr cb{};
                cb.cond = c;
                cb.then_bb = then_bb;
                cb.else_bb = has_else ? else_bb : join;
                terminate_(std::move(cb));

                std::vector<Edge> edges;
                if (!has_else) edges.push_back(Edge{pred, env_before, {}});

                // 각 arm의 끝 블록은 join이 정해진 뒤에 닫는다.
                std::vector<BlockId> open_ends;

                cur_ = then_bb;
                lower_block_(s.a);
                if (open_()) {
                    edges.push_back(Edge{cur_, env_, {}});
                    open_ends.push_back(cur_);
                }

                if (has_else) {
                    env_ = env_before;
                    cur_ = else_bb;
                    lower_block_(s.b);
                    if (open_()) {
                        edges.push_back(Edge{cur_, env_, {}});
                        open_ends.push_back(cur_);
                    }
                }

                if (edges.empty()) {
                    cur_ = kInvalidId;
                    return;
                }
                if (join == kInvalidId) join = new_block_();

                for (auto bb : open_ends) {
                    cur_ = bb;
                    terminate_(TermBr{join, {}});
                }
                (void)seal_join_(join, edges, {}, /*live_filter=*/true);
            }

            void lower_while_(const hir::Stmt& s) {
                // header param: 루프 안에서 다시 묶이는, 루프 이전에 정의된 바인딩
                std::vector<SymbolId> defs;
                expr_defs_(s.expr, defs);
                block_defs_(s.a, defs);
                sort_unique_(defs);

                LoopFrame lf{};
                for (auto x : defs) {
                    if (env_[x] == kInvalidId || is_ref_sym_(x)) continue;
                    lf.syms.push_back(x);
                }
                expr_uses_(s.expr, lf.uses);
                block_uses_(s.a, lf.uses);
                sort_unique_(lf.uses);
                // 바깥 루프와 남은 문장 기준. 이 루프의 frame은 아직 올라가지 않았다.
                for (auto x : lf.syms) {
                    if (live_after_(x)) lf.exit_syms.push_back(x);
                }

                lf.header = new_block_();
                {
                    TermBr br{};
                    br.target = lf.header;
                    for (auto x : lf.syms) br.args.push_back(env_[x]);
                    terminate_(std::move(br));
                }

                cur_ = lf.header;
                for (auto x : lf.syms) {
                    env_[x] = add_param_(lf.header, m_.values[env_[x]].ty);
                    ++phi_params_;
                }

                // 조건식 평가 중 back-edge 바인딩이 필요할 수 있으므로 frame을 먼저 올린다.
                loops_.push_back(lf);
                const ValueId c = lower_expr_(s.expr);

                const BlockId body = new_block_();
                const BlockId exit = new_block_();
                loops_.back().exit = exit;

                std::vector<ValueId> exit_params;
                for (auto x : lf.exit_syms) {
                    exit_params.push_back(add_param_(exit, m_.values[env_[x]].ty));
                    ++phi_params_;
                }

                TermCondBr cb{};
                cb.cond = c;
                cb.then_bb = body;
                cb.else_bb = exit;
                for (auto x : lf.exit_syms) cb.else_args.push_back(env_[x]);
                terminate_(std::move(cb));

                std::vector<ValueId> env_after = env_;

                cur_ = body;
                lower_block_(s.a);
                if (open_()) {
                    TermBr br{};
                    br.target = lf.header;
                    for (auto x : lf.syms) br.args.push_back(env_[x]);
                    terminate_(std::move(br));
                }
                loops_.pop_back();

                for (auto x : lf.syms) env_after[x] = kInvalidId;
                for (size_t i = 0; i < lf.exit_syms.size(); ++i) env_after[lf.exit_syms[i]] = exit_params[i];
                env_ = std::move(env_after);
                cur_ = exit;
            }

            // ---------------- expressions ----------------
            ValueId lower_expr_(hir::ExprId eid) {
                if (eid == hir::kInvalidId) return kInvalidId;
                const auto& e = hm_.exprs[eid];
                const Span sp = e.span;

                switch (e.kind) {
                    case hir::ExprKind::kIntLit:
                        return emit_(InstConstInt{e.int_bits}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kBoolLit:
                        return emit_(InstConstBool{e.bool_value}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kBytesLit:
                        return emit_(InstConstBytes{e.text}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kUnitLit:
                        return kInvalidId;

                    case hir::ExprKind::kLocal:
                        if (is_ref_sym_(e.sym)) {
                            return emit_(InstRefLoad{env_[e.sym]}, e.type, Effect::MayReadMem, sp);
                        }
                        return env_[e.sym];

                    case hir::ExprKind::kUnary: {
                        const ValueId src = lower_expr_(e.a);
                        const auto op = static_cast<hir::UnaryOp>(e.op);
                        if (op == hir::UnaryOp::kNeg) {
                            const ArithMode mode = map_mode_(e.mode);
                            const Effect eff = (mode == ArithMode::Trap) ? Effect::MayTrap : Effect::Pure;
                            return emit_(InstUnary{UnOp::Neg, mode, src}, e.type, eff, sp);
                        }
                        const UnOp uop = (op == hir::UnaryOp::kNot) ? UnOp::Not : UnOp::BitNot;
                        return emit_(InstUnary{uop, ArithMode::Wrapping, src}, e.type, Effect::Pure, sp);
                    }

                    case hir::ExprKind::kBinary: {
                        const auto op = static_cast<hir::BinaryOp>(e.op);
                        if (op == hir::BinaryOp::kLogicalAnd || op == hir::BinaryOp::kLogicalOr) {
                            return lower_short_circuit_(e, op == hir::BinaryOp::kLogicalAnd);
                        }
                        const ValueId l = lower_expr_(e.a);
                        const ValueId r = lower_expr_(e.b);
                        const BinOp bop = map_binop_(op);
                        const ArithMode mode = map_mode_(e.mode);
                        return emit_(InstBinOp{bop, mode, l, r}, e.type, binop_effect_(bop, mode), sp);
                    }

                    case hir::ExprKind::kCast: {
                        const ValueId src = lower_expr_(e.a);
                        const CastMode mode = (e.mode == hir::ArithMode::kWrapping) ? CastMode::Wrapping : CastMode::Trap;
                        const Effect eff = (mode == CastMode::Trap) ? Effect::MayTrap : Effect::Pure;
                        return emit_(InstCast{mode, e.type, src}, e.type, eff, sp);
                    }

                    case hir::ExprKind::kCall:
                        return lower_call_(e);

                    case hir::ExprKind::kField: {
                        const ValueId base = lower_expr_(e.a);
                        return emit_(InstExtractField{base, e.field_index}, e.type, Effect::Pure, sp);
                    }

                    case hir::ExprKind::kStructLit: {
                        InstMakeStruct ms{};
                        for (uint32_t i = 0; i < e.arg_count; ++i) ms.fields.push_back(lower_expr_(hm_.arg(e, i)));
                        return emit_(std::move(ms), e.type, Effect::Pure, sp);
                    }

                    case hir::ExprKind::kSelect:
                        return lower_select_(e);

                    case hir::ExprKind::kResultOk:
                        return emit_(InstMakeResult{true, lower_expr_(e.a)}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kResultErr:
                        return emit_(InstMakeResult{false, lower_expr_(e.a)}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kIsOk:
                        return emit_(InstResultIsOk{lower_expr_(e.a)}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kUnwrap:
                        return emit_(InstResultValue{lower_expr_(e.a)}, e.type, Effect::MayTrap, sp);

                    case hir::ExprKind::kResultCode:
                        return emit_(InstResultCode{lower_expr_(e.a)}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kBytesLen:
                        return emit_(InstBytesLen{lower_expr_(e.a)}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kStateGet: {
                        const ValueId key = lower_expr_(e.a);
                        const TypeId vt = types_.get(e.type).elem;
                        return emit_(InstStateRead{e.text, key, vt}, e.type, Effect::MayReadMem, sp);
                    }

                    case hir::ExprKind::kStatePut: {
                        const ValueId key = lower_expr_(e.a);
                        const ValueId val = lower_expr_(e.b);
                        return emit_(InstStateWrite{e.text, key, val}, ty::kInvalidType, Effect::MayWriteMem, sp);
                    }

                    case hir::ExprKind::kStateHas:
                        return emit_(InstStateHas{e.text, lower_expr_(e.a)}, e.type, Effect::MayReadMem, sp);

                    case hir::ExprKind::kContext: {
                        ContextQuery q = ContextQuery::Caller;
                        switch (e.ctx) {
                            case hir::ContextKind::kCaller: q = ContextQuery::Caller; break;
                            case hir::ContextKind::kSelf: q = ContextQuery::Self; break;
                            case hir::ContextKind::kBlockHeight: q = ContextQuery::BlockHeight; break;
                            case hir::ContextKind::kTimestamp: q = ContextQuery::Timestamp; break;
                            case hir::ContextKind::kCallValue: q = ContextQuery::CallValue; break;
                        }
                        return emit_(InstContext{q}, e.type, Effect::MayReadMem, sp);
                    }

                    case hir::ExprKind::kDigest:
                        return emit_(InstDigest{lower_expr_(e.a)}, e.type, Effect::Pure, sp);

                    case hir::ExprKind::kEmit: {
                        InstEmit em{};
                        em.topic = e.text;
                        for (uint32_t i = 0; i < e.arg_count; ++i) em.args.push_back(lower_expr_(hm_.arg(e, i)));
                        return emit_(std::move(em), ty::kInvalidType, Effect::MayWriteMem, sp);
                    }
                }
                return kInvalidId;
            }

            /// @brief `mut` 인자는 참조 셀로 넘기고, 호출 뒤 셀 값을 바인딩에 다시 묶는다.
            ValueId lower_call_(const hir::Expr& e) {
                const auto& callee = hm_.funcs[e.callee];

                InstCall call{};
                call.callee = e.callee;
                std::vector<std::pair<SymbolId, ValueId>> rebinds;

                for (uint32_t i = 0; i < e.arg_count; ++i) {
                    const hir::ExprId aid = hm_.arg(e, i);
                    const auto& p = hm_.param(callee, i);
                    if (p.pass != hir::PassMode::kMut) {
                        call.args.push_back(lower_expr_(aid));
                        continue;
                    }

                    const SymbolId sym = hm_.exprs[aid].sym;
                    if (is_ref_sym_(sym)) {
                        call.args.push_back(env_[sym]);
                        continue;
                    }
                    const TypeId ref_ty = types_.make_ref(hm_.symbols[sym].type);
                    const ValueId cell = emit_(InstRefNew{env_[sym]}, ref_ty, Effect::Pure, hm_.exprs[aid].span);
                    call.args.push_back(cell);
                    rebinds.emplace_back(sym, cell);
                }

                const ValueId r = emit_(std::move(call), e.type, Effect::Call, e.span);
                for (const auto& [sym, cell] : rebinds) {
                    env_[sym] = emit_(InstRefLoad{cell}, hm_.symbols[sym].type, Effect::MayReadMem, e.span);
                }
                return r;
            }

            ValueId lower_select_(const hir::Expr& e) {
                const ValueId c = lower_expr_(e.a);
                const BlockId then_bb = new_block_();
                const BlockId else_bb = new_block_();
                const BlockId join = new_block_();
                const bool has_value = !types_.is_unit(e.type);

                TermCondBr cb{};
                cb.cond = c;
                cb.then_bb = then_bb;
                cb.else_bb = else_bb;
                terminate_(std::move(cb));

                const std::vector<ValueId> env_before = env_;
                std::vector<Edge> edges;

                cur_ = then_bb;
                const ValueId tv = lower_expr_(e.b);
                edges.push_back(Edge{cur_, env_, has_value ? std::vector<ValueId>{tv} : std::vector<ValueId>{}});
                terminate_(TermBr{join, {}});

                env_ = env_before;
                cur_ = else_bb;
                const ValueId ev = lower_expr_(e.c);
                edges.push_back(Edge{cur_, env_, has_value ? std::vector<ValueId>{ev} : std::vector<ValueId>{}});
                terminate_(TermBr{join, {}});

                std::vector<TypeId> extra_tys;
                if (has_value) extra_tys.push_back(e.type);
                const auto extras = seal_join_(join, edges, extra_tys, /*live_filter=*/false);
                return has_value ? extras.front() : kInvalidId;
            }

            /// @brief `a && b`, `a || b`: rhs는 필요한 경우에만 평가한다.
            ValueId lower_short_circuit_(const hir::Expr& e, bool is_and) {
                const ValueId l = lower_expr_(e.a);
                const ValueId shortcut = emit_(InstConstBool{!is_and}, e.type, Effect::Pure, e.span);

                const BlockId rhs_bb = new_block_();
                const BlockId join = new_block_();
                const BlockId pred = cur_;

                TermCondBr cb{};
                cb.cond = l;
                cb.then_bb = is_and ? rhs_bb : join;
                cb.else_bb = is_and ? join : rhs_bb;
                terminate_(std::move(cb));

                std::vector<Edge> edges;
                edges.push_back(Edge{pred, env_, {shortcut}});

                cur_ = rhs_bb;
                const ValueId r = lower_expr_(e.b);
                edges.push_back(Edge{cur_, env_, {r}});
                terminate_(TermBr{join, {}});

                const auto extras = seal_join_(join, edges, {e.type}, /*live_filter=*/false);
                return extras.front();
            }

            const hir::Module& hm_;
            ty::TypePool& types_;
            Module& m_;
            FuncId fid_ = kInvalidId;

            BlockId cur_ = kInvalidId;
            std::vector<ValueId> env_;       // SymbolId -> 현재 값
            std::vector<LoopFrame> loops_;
            std::vector<ContFrame> cont_;

            std::vector<std::vector<SymbolId>> uses_;
            std::vector<uint8_t> uses_done_;

            uint32_t phi_params_ = 0;
        };

    } // namespace

    BuildResult build_module(
        const hir::Module& hm,
        ty::TypePool& types,
        Module& out,
        const BuildOptions& opt
    ) {
        BuildResult res{};
        out.unit_id = hm.unit_id;

        // 1) 시그니처: 모든 함수를 먼저 등록해 FuncId를 HIR과 맞춘다.
        for (hir::FuncId fid = 0; fid < hm.funcs.size(); ++fid) {
            const auto& hf = hm.funcs[fid];
            Function f{};
            f.name = hf.name;
            f.span = hf.span;
            f.ret_ty = hf.ret;
            f.is_public = hf.is_public;
            f.is_payable = hf.is_payable;
            for (uint32_t i = 0; i < hf.param_count; ++i) {
                const auto& p = hm.param(hf, i);
                f.param_tys.push_back(p.pass == hir::PassMode::kMut ? types.make_ref(p.type) : p.type);
                f.param_modes.push_back(p.pass);
            }
            for (uint32_t i = 0; i < hf.attr_count; ++i) f.attrs.push_back(hm.attrs[hf.attr_begin + i]);
            f.excluded = (fid < opt.skip.size() && opt.skip[fid]) || hf.body == hir::kInvalidId;
            out.add_func(f);
        }

        // 2) 본문
        for (FuncId fid = 0; fid < out.funcs.size(); ++fid) {
            if (out.funcs[fid].excluded) continue;
            FnBuilder b(hm, types, out, fid);
            b.build();
            res.phi_params += b.phi_params();
            ++res.built;
        }

        res.ok = true;
        return res;
    }

} // namespace vellum::ssa
