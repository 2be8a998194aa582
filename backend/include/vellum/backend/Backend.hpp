// backend/include/vellum/backend/Backend.hpp
#pragma once
#include <vellum/backend/meta/Gas.hpp>
#include <vellum/backend/vm/Bytecode.hpp>
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::backend {

    /// @brief 백엔드 종류 식별자.
    enum class BackendKind : uint8_t {
        kVm,
    };

    /// @brief 백엔드 컴파일 옵션. 한도를 넘으면 해당 함수만 제외된다.
    struct CompileOptions {
        uint32_t max_locals = 1024;
        uint32_t max_aggregate_fields = 64;
        uint64_t max_data_bytes = 64 * 1024;
        uint32_t memory_pages = 16;

        std::string unit_id{};   // 비어 있으면 module.unit_id
        meta::GasTable gas{};
    };

    inline constexpr uint32_t kNoFunction = 0xFFFF'FFFFu;

    /// @brief lowering된 함수 하나의 요약.
    struct FunctionInfo {
        ssa::FuncId fid = ssa::kInvalidId;
        uint32_t index = kNoFunction;   // bytecode 함수 인덱스
        std::string mangled{};
        bool exported = false;

        uint32_t num_locals = 0;
        uint32_t stack_values = 0;      // 평가 스택에 남긴 값 수
        uint64_t gas = 0;
    };

    /// @brief 백엔드 실행 결과.
    struct CompileResult {
        bool ok = false;

        vm::Module module{};
        std::vector<FunctionInfo> functions{};   // FuncId로 인덱싱
        std::vector<bool> fn_ok{};               // 한도 초과(또는 그 caller)면 false
    };

    /// @brief SSA 모듈을 타깃 산출물로 변환하는 백엔드 공통 인터페이스.
    class Backend {
    public:
        virtual ~Backend() = default;

        /// @brief 백엔드 종류를 반환한다.
        virtual BackendKind kind() const = 0;

        /// @brief 최적화된 SSA 모듈을 받아 bytecode 모듈을 만든다.
        virtual CompileResult compile(
            const ssa::Module& m,
            const ty::TypePool& types,
            diag::Bag& bag,
            const CompileOptions& opt
        ) = 0;
    };

    /// @brief 안정적인 export 이름 `_VL<len><unit><len><name>_<param codes>`.
    std::string mangle(std::string_view unit, const ssa::Function& f, const ty::TypePool& types);

} // namespace vellum::backend
