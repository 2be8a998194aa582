// frontend/include/vellum/hir/Ownership.hpp
#pragma once
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/hir/HIR.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>
#include <vector>


namespace vellum::hir {

    /// @brief 바인딩 하나의 borrow 상태. Mutably와 Shared(n)은 공존하지 않는다.
    enum class BorrowState : uint8_t {
        kUnborrowed,
        kShared,
        kMutably,
    };

    struct OwnershipOptions {
        bool count_drops = true;
    };

    struct OwnershipResult {
        bool ok = false;
        uint32_t error_count = 0;

        std::vector<bool> fn_ok;        // FuncId -> 위반 없음
        std::vector<uint32_t> drops;    // FuncId -> scope 종료 시 소유 중이던 move 바인딩 수
    };

    /// @brief 함수 단위 ownership/borrow 검사.
    ///
    /// 모든 kLocal 식에 AccessKind를 기록한다(SSA builder가 참조 전달 여부를 결정한다).
    /// 한 함수에서 첫 위반을 만나면 그 함수 분석을 멈추고 다음 함수로 넘어간다.
    OwnershipResult check_ownership(
        Module& m,
        const ty::TypePool& types,
        diag::Bag& bag,
        const OwnershipOptions& opt = {}
    );

} // namespace vellum::hir
