// frontend/include/vellum/ssa/Fold.hpp
#pragma once
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/IntArith.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>


namespace vellum::ssa {

    enum class FoldStatus : uint8_t {
        kValue,
        kOverflow,      // Trap 모드: host abort 경로
        kDivByZero,     // 네이티브 trap
        kCheckedErr,    // Checked 모드: err(Status::kArithmetic)
    };

    /// @brief 정수 연산 하나의 결과(워드 표현).
    struct Folded {
        FoldStatus status = FoldStatus::kValue;
        uint64_t value = 0;
    };

    /// @brief 정수/bool 타입의 IntKind. bool은 1비트 unsigned로 본다.
    ty::IntKind int_kind_of(const ty::TypePool& types, TypeId t);

    bool is_compare(BinOp op);
    bool is_bitwise(BinOp op);

    Folded fold_binop(BinOp op, ArithMode mode, ty::IntKind k, uint64_t a, uint64_t b);
    Folded fold_neg(ArithMode mode, ty::IntKind k, uint64_t a);
    Folded fold_cast(CastMode mode, ty::IntKind from, ty::IntKind to, uint64_t w);

} // namespace vellum::ssa
