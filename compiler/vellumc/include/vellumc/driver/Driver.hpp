// compiler/vellumc/include/vellumc/driver/Driver.hpp
#pragma once

#include <vellumc/cli/Options.hpp>

#include <vellum/backend/Backend.hpp>
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/domain/Analyzer.hpp>
#include <vellum/hir/HIR.hpp>
#include <vellum/hir/Ownership.hpp>
#include <vellum/ssa/SSA.hpp>
#include <vellum/text/SourceManager.hpp>
#include <vellum/ty/TypePool.hpp>

#include <llvm/Support/JSON.h>

#include <string>
#include <string_view>

namespace vellumc::driver {

    /// @brief 파이프라인 한 번의 모든 중간 산출물.
    struct Compilation {
        bool ok = false;

        vellum::SourceManager sm{};
        vellum::diag::Bag bag{};
        vellum::ty::TypePool types{};

        vellum::hir::Module hir{};
        vellum::hir::OwnershipResult ownership{};
        vellum::ssa::Module ssa{};
        vellum::domain::AnalysisResult domains{};
        vellum::backend::CompileResult compiled{};
        llvm::json::Value manifest = nullptr;

        std::string unit{};
        bool reached_backend = false;
    };

    /// @brief HIR 문서 하나를 읽어 bytecode와 manifest까지 만든다.
    ///
    /// 1) HIR 읽기 2) ownership 3) SSA 구성/검증 4) 최적화/재검증
    /// 5) 도메인 분석 6) VM lowering 7) manifest
    /// 함수 단위 실패는 해당 함수(와 호출자)만 제외하고 계속 진행한다.
    void compile_document(
        std::string_view json_text,
        std::string_view doc_name,
        const cli::Options& opt,
        Compilation& out
    );

    /// @brief 제외된 함수를 부르는 함수를 전이적으로 제외한다. 제외한 수를 돌려준다.
    uint32_t exclude_callers(vellum::ssa::Module& m, vellum::diag::Bag& bag, std::string_view reason);

    /// @brief 단일 입력 파일에 대해 파이프라인을 실행하고 산출물을 쓴다.
    int run(const cli::Options& opt);

} // namespace vellumc::driver
