// frontend/include/vellum/ty/IntArith.hpp
#pragma once
#include <vellum/ty/Type.hpp>

#include <cstdint>


namespace vellum::ty {

    /// @brief 정수 타입의 부호/폭. 값은 항상 64비트 워드로 다룬다.
    ///
    /// 워드 표현 규칙:
    /// - signed N비트: 하위 N비트를 부호 확장한 값
    /// - unsigned N비트: 하위 N비트를 0 확장한 값
    /// - 64비트: 비트 그대로
    struct IntKind {
        bool is_signed = false;
        uint32_t bits = 0; // 0이면 정수 타입이 아님
    };

    IntKind int_kind(Builtin b);

    enum class ArithOp : uint8_t {
        kAdd,
        kSub,
        kMul,
        kDiv,
        kRem,
        kShl,
        kShr,
        kAnd,
        kOr,
        kXor,
    };

    struct ArithOutcome {
        uint64_t value = 0;       // wrapped result (word representation)
        bool overflow = false;    // true two's-complement overflow, or shift amount out of range
        bool div_by_zero = false;
    };

    struct CastOutcome {
        uint64_t value = 0;
        bool overflow = false;    // source value not representable in target
    };

    uint64_t normalize(IntKind k, uint64_t w);
    inline int64_t as_signed(uint64_t w) { return static_cast<int64_t>(w); }

    uint64_t min_word(IntKind k);
    uint64_t max_word(IntKind k);

    /// @brief 래핑 결과와 함께 실제 오버플로 여부를 계산한다.
    ArithOutcome eval_arith(ArithOp op, IntKind k, uint64_t a, uint64_t b);

    /// @brief 포화 산술. 시프트/비트 연산은 래핑 결과와 같다. div_by_zero는 호출 전에 배제해야 한다.
    uint64_t eval_saturating(ArithOp op, IntKind k, uint64_t a, uint64_t b);

    /// @brief -1 / 0 / 1
    int compare(IntKind k, uint64_t a, uint64_t b);

    CastOutcome eval_cast(IntKind from, IntKind to, uint64_t w);

} // namespace vellum::ty
