// frontend/src/ssa/ssa_fold.cpp
#include <vellum/ssa/Fold.hpp>


namespace vellum::ssa {

    namespace {

        ty::ArithOp to_arith_(BinOp op) {
            switch (op) {
                case BinOp::Add: return ty::ArithOp::kAdd;
                case BinOp::Sub: return ty::ArithOp::kSub;
                case BinOp::Mul: return ty::ArithOp::kMul;
                case BinOp::Div: return ty::ArithOp::kDiv;
                case BinOp::Rem: return ty::ArithOp::kRem;
                case BinOp::Shl: return ty::ArithOp::kShl;
                case BinOp::Shr: return ty::ArithOp::kShr;
                case BinOp::And: return ty::ArithOp::kAnd;
                case BinOp::Or:  return ty::ArithOp::kOr;
                case BinOp::Xor: return ty::ArithOp::kXor;
                default: return ty::ArithOp::kAdd;
            }
        }

        Folded value_(uint64_t v) { return Folded{FoldStatus::kValue, v}; }

    } // namespace

    ty::IntKind int_kind_of(const ty::TypePool& types, TypeId t) {
        if (types.is_bool(t)) return ty::IntKind{false, 1};
        if (!types.is_integer(t)) return {};
        return ty::int_kind(types.get(t).builtin);
    }

    bool is_compare(BinOp op) {
        return op == BinOp::Eq || op == BinOp::Ne || op == BinOp::Lt ||
               op == BinOp::Le || op == BinOp::Gt || op == BinOp::Ge;
    }

    bool is_bitwise(BinOp op) {
        return op == BinOp::And || op == BinOp::Or || op == BinOp::Xor;
    }

    Folded fold_binop(BinOp op, ArithMode mode, ty::IntKind k, uint64_t a, uint64_t b) {
        if (is_compare(op)) {
            const int c = ty::compare(k, a, b);
            bool r = false;
            switch (op) {
                case BinOp::Eq: r = (c == 0); break;
                case BinOp::Ne: r = (c != 0); break;
                case BinOp::Lt: r = (c < 0); break;
                case BinOp::Le: r = (c <= 0); break;
                case BinOp::Gt: r = (c > 0); break;
                case BinOp::Ge: r = (c >= 0); break;
                default: break;
            }
            return value_(r ? 1 : 0);
        }

        const auto aop = to_arith_(op);
        const auto out = ty::eval_arith(aop, k, a, b);
        if (is_bitwise(op)) return value_(out.value);

        if (out.div_by_zero) {
            return Folded{mode == ArithMode::Checked ? FoldStatus::kCheckedErr : FoldStatus::kDivByZero, 0};
        }

        switch (mode) {
            case ArithMode::Trap:
                return out.overflow ? Folded{FoldStatus::kOverflow, 0} : value_(out.value);
            case ArithMode::Checked:
                return out.overflow ? Folded{FoldStatus::kCheckedErr, 0} : value_(out.value);
            case ArithMode::Wrapping:
                return value_(out.value);
            case ArithMode::Saturating:
                return value_(ty::eval_saturating(aop, k, a, b));
        }
        return value_(out.value);
    }

    Folded fold_neg(ArithMode mode, ty::IntKind k, uint64_t a) {
        // -a == 0 - a
        return fold_binop(BinOp::Sub, mode, k, 0, a);
    }

    Folded fold_cast(CastMode mode, ty::IntKind from, ty::IntKind to, uint64_t w) {
        const auto out = ty::eval_cast(from, to, w);
        if (mode == CastMode::Trap && out.overflow) return Folded{FoldStatus::kOverflow, 0};
        return value_(out.value);
    }

} // namespace vellum::ssa
