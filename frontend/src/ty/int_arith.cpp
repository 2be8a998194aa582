// frontend/src/ty/int_arith.cpp
#include <vellum/ty/IntArith.hpp>

#include <limits>


namespace vellum::ty {

    IntKind int_kind(Builtin b) {
        switch (b) {
            case Builtin::kI8:  return {true, 8};
            case Builtin::kI16: return {true, 16};
            case Builtin::kI32: return {true, 32};
            case Builtin::kI64: return {true, 64};
            case Builtin::kU8:  return {false, 8};
            case Builtin::kU16: return {false, 16};
            case Builtin::kU32: return {false, 32};
            case Builtin::kU64: return {false, 64};
            default: return {};
        }
    }

    uint64_t normalize(IntKind k, uint64_t w) {
        if (k.bits == 0 || k.bits >= 64) return w;
        const uint32_t sh = 64 - k.bits;
        if (k.is_signed) {
            return static_cast<uint64_t>(static_cast<int64_t>(w << sh) >> sh);
        }
        return w & ((uint64_t{1} << k.bits) - 1);
    }

    uint64_t min_word(IntKind k) {
        if (!k.is_signed) return 0;
        if (k.bits >= 64) return static_cast<uint64_t>(std::numeric_limits<int64_t>::min());
        return static_cast<uint64_t>(-(int64_t{1} << (k.bits - 1)));
    }

    uint64_t max_word(IntKind k) {
        if (k.is_signed) {
            if (k.bits >= 64) return static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            return (uint64_t{1} << (k.bits - 1)) - 1;
        }
        if (k.bits >= 64) return std::numeric_limits<uint64_t>::max();
        return (uint64_t{1} << k.bits) - 1;
    }

    namespace {

        ArithOutcome eval_narrow_(ArithOp op, IntKind k, uint64_t a, uint64_t b) {
            ArithOutcome out{};
            if (k.is_signed) {
                // |a|,|b| < 2^31 이므로 int64에서 정확하다.
                const int64_t x = as_signed(a);
                const int64_t y = as_signed(b);
                int64_t r = 0;
                switch (op) {
                    case ArithOp::kAdd: r = x + y; break;
                    case ArithOp::kSub: r = x - y; break;
                    case ArithOp::kMul: r = x * y; break;
                    default: return out;
                }
                out.value = normalize(k, static_cast<uint64_t>(r));
                out.overflow = (as_signed(out.value) != r);
                return out;
            }

            uint64_t r = 0;
            bool borrow = false;
            switch (op) {
                case ArithOp::kAdd: r = a + b; break;
                case ArithOp::kSub: r = a - b; borrow = (a < b); break;
                case ArithOp::kMul: r = a * b; break;
                default: return out;
            }
            out.value = normalize(k, r);
            out.overflow = borrow || (out.value != r);
            return out;
        }

        ArithOutcome eval_wide_(ArithOp op, IntKind k, uint64_t a, uint64_t b) {
            ArithOutcome out{};
            if (k.is_signed) {
                const int64_t x = as_signed(a);
                const int64_t y = as_signed(b);
                int64_t r = 0;
                switch (op) {
                    case ArithOp::kAdd: out.overflow = __builtin_add_overflow(x, y, &r); break;
                    case ArithOp::kSub: out.overflow = __builtin_sub_overflow(x, y, &r); break;
                    case ArithOp::kMul: out.overflow = __builtin_mul_overflow(x, y, &r); break;
                    default: return out;
                }
                out.value = static_cast<uint64_t>(r);
                return out;
            }

            uint64_t r = 0;
            switch (op) {
                case ArithOp::kAdd: out.overflow = __builtin_add_overflow(a, b, &r); break;
                case ArithOp::kSub: out.overflow = __builtin_sub_overflow(a, b, &r); break;
                case ArithOp::kMul: out.overflow = __builtin_mul_overflow(a, b, &r); break;
                default: return out;
            }
            out.value = r;
            return out;
        }

    } // namespace

    ArithOutcome eval_arith(ArithOp op, IntKind k, uint64_t a, uint64_t b) {
        ArithOutcome out{};
        switch (op) {
            case ArithOp::kAdd:
            case ArithOp::kSub:
            case ArithOp::kMul:
                return (k.bits < 64) ? eval_narrow_(op, k, a, b) : eval_wide_(op, k, a, b);

            case ArithOp::kDiv:
            case ArithOp::kRem: {
                if (b == 0) {
                    out.div_by_zero = true;
                    return out;
                }
                if (k.is_signed) {
                    const int64_t x = as_signed(a);
                    const int64_t y = as_signed(b);
                    if (y == -1) {
                        // MIN / -1 은 표현 불가, MIN % -1 은 0.
                        if (op == ArithOp::kRem) return out;
                        out.overflow = (a == min_word(k));
                        out.value = out.overflow ? min_word(k) : normalize(k, static_cast<uint64_t>(-x));
                        return out;
                    }
                    out.value = normalize(k, static_cast<uint64_t>(op == ArithOp::kDiv ? x / y : x % y));
                    return out;
                }
                out.value = (op == ArithOp::kDiv) ? a / b : a % b;
                return out;
            }

            case ArithOp::kShl:
            case ArithOp::kShr: {
                const uint64_t amount = b;
                out.overflow = (k.is_signed && as_signed(b) < 0) || amount >= k.bits;
                const uint32_t sh = static_cast<uint32_t>(amount & (k.bits - 1));
                if (op == ArithOp::kShl) {
                    out.value = normalize(k, a << sh);
                } else if (k.is_signed) {
                    out.value = normalize(k, static_cast<uint64_t>(as_signed(a) >> sh));
                } else {
                    out.value = a >> sh;
                }
                return out;
            }

            case ArithOp::kAnd: out.value = normalize(k, a & b); return out;
            case ArithOp::kOr:  out.value = normalize(k, a | b); return out;
            case ArithOp::kXor: out.value = normalize(k, a ^ b); return out;
        }
        return out;
    }

    uint64_t eval_saturating(ArithOp op, IntKind k, uint64_t a, uint64_t b) {
        const auto r = eval_arith(op, k, a, b);
        if (!r.overflow) return r.value;

        switch (op) {
            case ArithOp::kAdd:
                if (!k.is_signed) return max_word(k);
                return (as_signed(b) < 0) ? min_word(k) : max_word(k);
            case ArithOp::kSub:
                if (!k.is_signed) return min_word(k);
                return (as_signed(b) < 0) ? max_word(k) : min_word(k);
            case ArithOp::kMul:
                if (!k.is_signed) return max_word(k);
                return ((as_signed(a) < 0) != (as_signed(b) < 0)) ? min_word(k) : max_word(k);
            case ArithOp::kDiv:
                return max_word(k);
            default:
                return r.value;
        }
    }

    int compare(IntKind k, uint64_t a, uint64_t b) {
        if (k.is_signed) {
            const int64_t x = as_signed(a);
            const int64_t y = as_signed(b);
            return (x < y) ? -1 : (x > y) ? 1 : 0;
        }
        return (a < b) ? -1 : (a > b) ? 1 : 0;
    }

    CastOutcome eval_cast(IntKind from, IntKind to, uint64_t w) {
        CastOutcome out{};
        out.value = normalize(to, w);

        // u64 상위 비트가 켜진 값(>= 2^63)은 u64로만 표현된다.
        const bool huge_unsigned = (!from.is_signed && from.bits >= 64 && as_signed(w) < 0);
        if (huge_unsigned) {
            out.overflow = !(to.bits >= 64 && !to.is_signed);
            return out;
        }

        if (!to.is_signed && to.bits >= 64) {
            out.overflow = as_signed(w) < 0;
            return out;
        }

        out.overflow = (out.value != w);
        return out;
    }

} // namespace vellum::ty
