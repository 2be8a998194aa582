// frontend/src/hir/ownership_check.cpp
#include <vellum/hir/Ownership.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>


namespace vellum::hir {

    namespace {

        /// @brief 식이 놓인 문맥이 요구하는 capability.
        enum class Use : uint8_t {
            kValue,       // by-value: copy 타입이면 copy, move 타입이면 move
            kShared,      // 읽기 전용 borrow(`self`, builtin 읽기)
            kExclusive,   // 배타 borrow(`mut self`)
        };

        struct ActiveBorrow {
            SymbolId sym = kInvalidSymbol;
            bool is_mut = false;
            Span span{};
        };

        struct FlowState {
            std::unordered_map<SymbolId, Span> moved;   // 존재하면 moved, 값은 move 지점
            bool diverged = false;                      // return/break/continue/revert/panic 이후
        };

        struct LoopCtx {
            std::vector<FlowState> breaks;
            std::vector<FlowState> continues;
        };

        /// @brief 합류점 병합: 한 경로에서라도 move된 바인딩은 move로 본다. 발산 경로는 제외한다.
        FlowState merge_flow_(const FlowState& a, const FlowState& b) {
            if (a.diverged) return b;
            if (b.diverged) return a;
            FlowState out = a;
            for (const auto& [sym, sp] : b.moved) {
                out.moved.emplace(sym, sp);
            }
            return out;
        }

        class OwnershipChecker final {
        public:
            OwnershipChecker(Module& m, const ty::TypePool& types, diag::Bag& bag, const OwnershipOptions& opt)
                : m_(m), types_(types), bag_(bag), opt_(opt) {}

            OwnershipResult run() {
                OwnershipResult out{};
                out.fn_ok.assign(m_.funcs.size(), true);
                out.drops.assign(m_.funcs.size(), 0);

                for (FuncId fid = 0; fid < m_.funcs.size(); ++fid) {
                    check_func_(fid);
                    out.fn_ok[fid] = !fn_failed_;
                    out.drops[fid] = drops_;
                }

                out.error_count = error_count_;
                out.ok = (error_count_ == 0);
                return out;
            }

        private:
            // ---------------- diagnostics ----------------
            void report_(diag::Code code, Span sp, SymbolId sym,
                         std::string_view a1 = {}, std::string_view a2 = {},
                         const Span* related = nullptr) {
                if (fn_failed_) return;
                diag::Diagnostic d(diag::Severity::kError, code, sp);
                d.add_arg(m_.symbols[sym].name);
                if (!a1.empty()) d.add_arg(a1);
                if (!a2.empty()) d.add_arg(a2);
                if (related != nullptr) d.set_related(*related);
                bag_.add(std::move(d));
                ++error_count_;
                fn_failed_ = true;
            }

            // ---------------- borrow bookkeeping ----------------
            const ActiveBorrow* find_borrow_(SymbolId sym, bool mut_only) const {
                for (const auto& b : borrows_) {
                    if (b.sym != sym) continue;
                    if (mut_only && !b.is_mut) continue;
                    return &b;
                }
                return nullptr;
            }

            BorrowState borrow_state_(SymbolId sym) const {
                BorrowState st = BorrowState::kUnborrowed;
                for (const auto& b : borrows_) {
                    if (b.sym != sym) continue;
                    if (b.is_mut) return BorrowState::kMutably;
                    st = BorrowState::kShared;
                }
                return st;
            }

            static std::string_view state_text_(BorrowState st) {
                return (st == BorrowState::kMutably) ? "mutably borrowed" : "borrowed";
            }

            // ---------------- function ----------------
            void check_func_(FuncId fid) {
                fn_failed_ = false;
                drops_ = 0;
                counting_ = opt_.count_drops;
                state_ = FlowState{};
                borrows_.clear();
                loops_.clear();
                scopes_.clear();

                const auto& f = m_.funcs[fid];
                if (f.body == kInvalidId) return;

                // 매개변수 scope: 소유(by-value) move 타입 매개변수만 drop 대상이다.
                scopes_.emplace_back();
                for (uint32_t i = 0; i < f.param_count; ++i) {
                    const auto& p = m_.param(f, i);
                    if (p.sym == kInvalidSymbol) continue;
                    if (p.pass == PassMode::kOwn && !types_.is_copy(p.type)) scopes_.back().push_back(p.sym);
                }

                check_block_(f.body);

                if (!state_.diverged) count_drops_(scopes_.back());
                scopes_.pop_back();
            }

            void count_drops_(const std::vector<SymbolId>& syms) {
                if (!counting_) return;
                for (auto sym : syms) {
                    if (state_.moved.count(sym) == 0) ++drops_;
                }
            }

            void count_all_scopes_() {
                for (const auto& sc : scopes_) count_drops_(sc);
            }

            // ---------------- statements ----------------
            void check_block_(BlockId bid) {
                if (bid == kInvalidId) return;
                const auto& b = m_.blocks[bid];

                scopes_.emplace_back();
                for (uint32_t i = 0; i < b.stmt_count; ++i) {
                    if (fn_failed_ || state_.diverged) break;
                    check_stmt_(m_.block_stmt(b, i));
                }
                if (!fn_failed_ && !state_.diverged) count_drops_(scopes_.back());
                scopes_.pop_back();
            }

            void check_stmt_(StmtId sid) {
                const Stmt& s = m_.stmts[sid];

                switch (s.kind) {
                    case StmtKind::kExpr:
                        use_expr_(s.expr, Use::kValue);
                        return;

                    case StmtKind::kLet: {
                        use_expr_(s.expr, Use::kValue);
                        state_.moved.erase(s.sym);
                        if (!types_.is_copy(m_.symbols[s.sym].type)) scopes_.back().push_back(s.sym);
                        return;
                    }

                    case StmtKind::kAssign: {
                        use_expr_(s.expr, Use::kValue);
                        if (fn_failed_) return;

                        const auto& sym = m_.symbols[s.sym];
                        if (!sym.is_mut) {
                            report_(diag::Code::kOwnAssignToImmutable, s.span, s.sym, {}, {}, &sym.decl_span);
                            return;
                        }
                        auto it = state_.moved.find(s.sym);
                        if (s.has_field) {
                            // 부분 대입으로는 move된 바인딩을 되살릴 수 없다.
                            if (it != state_.moved.end()) {
                                const Span moved_at = it->second;
                                report_(diag::Code::kOwnUseAfterMove, s.span, s.sym, {}, {}, &moved_at);
                            }
                            return;
                        }
                        if (it != state_.moved.end()) state_.moved.erase(it);
                        return;
                    }

                    case StmtKind::kIf: {
                        use_expr_(s.expr, Use::kValue);
                        if (fn_failed_) return;
                        const FlowState in = state_;
                        check_block_(s.a);
                        const FlowState then_out = state_;
                        state_ = in;
                        if (s.b != kInvalidId) check_block_(s.b);
                        state_ = merge_flow_(then_out, state_);
                        return;
                    }

                    case StmtKind::kWhile:
                        check_while_(s);
                        return;

                    case StmtKind::kReturn:
                        if (s.expr != kInvalidId) use_expr_(s.expr, Use::kValue);
                        if (fn_failed_) return;
                        count_all_scopes_();
                        state_.diverged = true;
                        return;

                    case StmtKind::kBreak:
                        loops_.back().breaks.push_back(state_);
                        state_.diverged = true;
                        return;

                    case StmtKind::kContinue:
                        loops_.back().continues.push_back(state_);
                        state_.diverged = true;
                        return;

                    case StmtKind::kRequire:
                        use_expr_(s.expr, Use::kValue);
                        return;

                    case StmtKind::kRevert:
                    case StmtKind::kPanic:
                        // 상태 효과가 폐기되므로 drop 대상도 없다.
                        state_.diverged = true;
                        return;
                }
            }

            /// @brief 루프 본문을 두 번 검사한다: 진입 상태, 그 다음 back-edge 병합 상태.
            void check_while_(const Stmt& s) {
                const FlowState pre = state_;
                FlowState back{};
                back.diverged = true;
                FlowState exit{};

                const bool saved_counting = counting_;
                for (int pass = 0; pass < 2; ++pass) {
                    // drop 집계는 마지막 pass에서만 한다.
                    counting_ = saved_counting && (pass == 1);

                    state_ = merge_flow_(pre, back);
                    use_expr_(s.expr, Use::kValue);
                    if (fn_failed_) break;
                    const FlowState cond_out = state_;

                    loops_.emplace_back();
                    check_block_(s.a);
                    LoopCtx ctx = std::move(loops_.back());
                    loops_.pop_back();
                    if (fn_failed_) break;

                    back = state_;
                    for (const auto& c : ctx.continues) back = merge_flow_(back, c);

                    exit = cond_out;
                    for (const auto& b : ctx.breaks) exit = merge_flow_(exit, b);
                }
                counting_ = saved_counting;
                state_ = exit;
            }

            // ---------------- expressions ----------------
            void use_local_(ExprId eid, Use u, bool persist) {
                Expr& e = m_.exprs[eid];
                const SymbolId sid = e.sym;
                const Symbol& sym = m_.symbols[sid];

                if (auto it = state_.moved.find(sid); it != state_.moved.end()) {
                    e.access = AccessKind::kMove;
                    const Span moved_at = it->second;
                    report_(diag::Code::kOwnUseAfterMove, e.span, sid, {}, {}, &moved_at);
                    return;
                }

                switch (u) {
                    case Use::kValue: {
                        if (types_.is_copy(sym.type)) {
                            e.access = AccessKind::kCopy;
                            if (const auto* b = find_borrow_(sid, /*mut_only=*/true)) {
                                report_(diag::Code::kOwnBorrowConflict, e.span, sid, "read", "mutably borrowed", &b->span);
                            }
                            return;
                        }

                        e.access = AccessKind::kMove;
                        if (sym.is_param && sym.pass != PassMode::kOwn) {
                            report_(diag::Code::kOwnMoveOutOfBorrowed, e.span, sid, {}, {}, &sym.decl_span);
                            return;
                        }
                        if (const auto* b = find_borrow_(sid, /*mut_only=*/false)) {
                            report_(diag::Code::kOwnMoveWhileBorrowed, e.span, sid,
                                    state_text_(borrow_state_(sid)), {}, &b->span);
                            return;
                        }
                        state_.moved.emplace(sid, e.span);
                        return;
                    }

                    case Use::kShared: {
                        e.access = AccessKind::kShared;
                        if (const auto* b = find_borrow_(sid, /*mut_only=*/true)) {
                            report_(diag::Code::kOwnBorrowConflict, e.span, sid, "borrow", "mutably borrowed", &b->span);
                            return;
                        }
                        if (persist) borrows_.push_back(ActiveBorrow{sid, false, e.span});
                        return;
                    }

                    case Use::kExclusive: {
                        e.access = AccessKind::kExclusive;
                        if (!sym.is_mut) {
                            report_(diag::Code::kOwnMutBorrowOfImmutable, e.span, sid, {}, {}, &sym.decl_span);
                            return;
                        }
                        if (const auto* b = find_borrow_(sid, /*mut_only=*/false)) {
                            report_(diag::Code::kOwnBorrowConflict, e.span, sid, "mutably borrow",
                                    state_text_(borrow_state_(sid)), &b->span);
                            return;
                        }
                        if (persist) borrows_.push_back(ActiveBorrow{sid, true, e.span});
                        return;
                    }
                }
            }

            /// @brief 조건부로 평가되는 하위 식: 평가되지 않은 경로와 병합한다.
            void use_conditional_(ExprId eid, Use u) {
                const FlowState skipped = state_;
                use_expr_(eid, u);
                state_ = merge_flow_(skipped, state_);
            }

            void use_expr_(ExprId eid, Use u) {
                if (eid == kInvalidId || fn_failed_) return;
                const Expr& e = m_.exprs[eid];

                switch (e.kind) {
                    case ExprKind::kIntLit:
                    case ExprKind::kBoolLit:
                    case ExprKind::kBytesLit:
                    case ExprKind::kUnitLit:
                    case ExprKind::kContext:
                        return;

                    case ExprKind::kLocal:
                        use_local_(eid, u, /*persist=*/false);
                        return;

                    case ExprKind::kUnary:
                    case ExprKind::kCast:
                        use_expr_(e.a, Use::kValue);
                        return;

                    case ExprKind::kBinary: {
                        const auto op = static_cast<BinaryOp>(e.op);
                        use_expr_(e.a, Use::kValue);
                        if (op == BinaryOp::kLogicalAnd || op == BinaryOp::kLogicalOr) {
                            use_conditional_(e.b, Use::kValue);
                        } else {
                            use_expr_(e.b, Use::kValue);
                        }
                        return;
                    }

                    case ExprKind::kCall:
                        use_call_(e);
                        return;

                    case ExprKind::kField: {
                        // move 타입 필드를 값으로 꺼내면 바인딩 전체가 move된다.
                        const bool shared = (u != Use::kValue) || types_.is_copy(e.type);
                        use_expr_(e.a, shared ? Use::kShared : Use::kValue);
                        return;
                    }

                    case ExprKind::kStructLit:
                        for (uint32_t i = 0; i < e.arg_count; ++i) use_expr_(m_.arg(e, i), Use::kValue);
                        return;

                    case ExprKind::kSelect: {
                        use_expr_(e.a, Use::kValue);
                        if (fn_failed_) return;
                        const FlowState in = state_;
                        use_expr_(e.b, u);
                        const FlowState then_out = state_;
                        state_ = in;
                        use_expr_(e.c, u);
                        state_ = merge_flow_(then_out, state_);
                        return;
                    }

                    case ExprKind::kResultOk:
                    case ExprKind::kResultErr:
                        use_expr_(e.a, Use::kValue);
                        return;

                    case ExprKind::kIsOk:
                    case ExprKind::kResultCode:
                    case ExprKind::kBytesLen:
                    case ExprKind::kDigest:
                        use_expr_(e.a, Use::kShared);
                        return;

                    case ExprKind::kUnwrap:
                        use_expr_(e.a, u);
                        return;

                    case ExprKind::kStateGet:
                    case ExprKind::kStateHas:
                        use_expr_(e.a, Use::kShared);
                        return;

                    case ExprKind::kStatePut:
                        use_expr_(e.a, Use::kShared);
                        use_expr_(e.b, Use::kShared);
                        return;

                    case ExprKind::kEmit:
                        for (uint32_t i = 0; i < e.arg_count; ++i) use_expr_(m_.arg(e, i), Use::kShared);
                        return;
                }
            }

            /// @brief 호출 인자는 왼쪽부터 평가되고, 참조 전달 borrow는 호출이 끝날 때까지 유지된다.
            void use_call_(const Expr& e) {
                const auto& callee = m_.funcs[e.callee];
                const size_t mark = borrows_.size();

                for (uint32_t i = 0; i < e.arg_count; ++i) {
                    if (fn_failed_) break;
                    const ExprId aid = m_.arg(e, i);
                    const PassMode pass = m_.param(callee, i).pass;
                    const bool direct_local = (m_.exprs[aid].kind == ExprKind::kLocal);

                    switch (pass) {
                        case PassMode::kOwn:
                            use_expr_(aid, Use::kValue);
                            break;
                        case PassMode::kRef:
                            if (direct_local) use_local_(aid, Use::kShared, /*persist=*/true);
                            else use_expr_(aid, Use::kShared);
                            break;
                        case PassMode::kMut:
                            use_local_(aid, Use::kExclusive, /*persist=*/true);
                            break;
                    }
                }

                borrows_.resize(mark);
            }

            Module& m_;
            const ty::TypePool& types_;
            diag::Bag& bag_;
            const OwnershipOptions& opt_;

            FlowState state_{};
            std::vector<ActiveBorrow> borrows_;
            std::vector<LoopCtx> loops_;
            std::vector<std::vector<SymbolId>> scopes_;

            bool fn_failed_ = false;
            bool counting_ = true;
            uint32_t drops_ = 0;
            uint32_t error_count_ = 0;
        };

    } // namespace

    OwnershipResult check_ownership(
        Module& m,
        const ty::TypePool& types,
        diag::Bag& bag,
        const OwnershipOptions& opt
    ) {
        OwnershipChecker c(m, types, bag, opt);
        return c.run();
    }

} // namespace vellum::hir
