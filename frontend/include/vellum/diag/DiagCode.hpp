// frontend/include/vellum/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace vellum::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kNote,    // informational only
        kFatal,   // internal compiler limit / invariant
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        // HIR interchange
        kHirMalformed,
        kHirUnknownName,
        kHirUnknownType,
        kHirTypeMismatch,
        kHirDuplicateName,
        kHirArgCountMismatch,
        kHirNotAPlace,

        // ownership
        kOwnUseAfterMove,
        kOwnMoveWhileBorrowed,
        kOwnBorrowConflict,
        kOwnMutBorrowOfImmutable,
        kOwnAssignToImmutable,
        kOwnMoveOutOfBorrowed,

        // annotations / conflict domains
        kAttrMalformed,
        kDomainWildcardFallback,
        kDomainDynamicKeyRejected,
        kDomainUnderDeclared,
        kDomainOverDeclared,

        // backend limits (internal tooling class)
        kBackendTooManyLocals,
        kBackendValueTooLarge,
        kBackendUnsupported,

        // pipeline
        kFnExcluded,
        kSsaVerifyFailed,
        kTooManyErrors,
    };

} // namespace vellum::diag
