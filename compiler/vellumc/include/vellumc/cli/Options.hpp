// compiler/vellumc/include/vellumc/cli/Options.hpp
#pragma once

#include <vellum/backend/Backend.hpp>
#include <vellum/diag/DiagCode.hpp>
#include <vellum/domain/Analyzer.hpp>
#include <vellum/hir/Ownership.hpp>
#include <vellum/ssa/Passes.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace vellumc::cli {

    /// @brief `vellumc` 실행 모드.
    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kCompile,
    };

    /// @brief CLI 진단 출력 포맷.
    enum class DiagFormat : uint8_t {
        kText,
        kJson,
    };

    /// @brief `-Xvellum`로만 접근 가능한 내부 개발 옵션.
    struct InternalOptions {
        bool hir_dump = false;
        bool ssa_dump = false;
        bool domain_dump = false;
        bool bytecode_dump = false;
    };

    /// @brief `vellumc` 최종 실행 옵션.
    struct Options {
        Mode mode = Mode::kUsage;

        std::vector<std::string> inputs{};
        std::string bytecode_path{};    // --emit-bytecode
        std::string manifest_path{};    // --emit-manifest
        std::string unit_id{};          // --unit: 문서의 unit을 덮어쓴다
        DiagFormat diag_format = DiagFormat::kText;

        bool has_xvellum = false;
        InternalOptions internal{};

        vellum::diag::Language lang = vellum::diag::Language::kEn;
        uint32_t max_errors = 64;

        vellum::hir::OwnershipOptions ownership{};
        vellum::ssa::PassOptions pass_opt{};
        vellum::domain::Options domain{};
        vellum::backend::CompileOptions backend{};

        bool ok = true;
        std::string error{};
    };

    /// @brief `vellumc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

} // namespace vellumc::cli
