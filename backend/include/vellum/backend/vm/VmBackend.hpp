// backend/include/vellum/backend/vm/VmBackend.hpp
#pragma once
#include <vellum/backend/Backend.hpp>


namespace vellum::backend::vm {

    /// @brief 스택+locals bytecode VM 백엔드.
    ///
    /// - 기본 산술에는 overflow 검사를 넣고 실패하면 host panic으로 간다.
    /// - wrapping/saturating/checked는 검사 대신 정의된 대체 값을 인라인으로 계산한다.
    /// - 0으로 나누기는 VM의 네이티브 trap에 맡긴다.
    /// - 상태/컨텍스트/로그/해시/중단은 host interface 테이블을 따라 marshal한다.
    class VmBackend final : public vellum::backend::Backend {
    public:
        BackendKind kind() const override;

        CompileResult compile(
            const ssa::Module& m,
            const ty::TypePool& types,
            diag::Bag& bag,
            const CompileOptions& opt
        ) override;
    };

} // namespace vellum::backend::vm
