// compiler/vellumc/include/vellumc/dump/Dump.hpp
#pragma once

#include <vellum/backend/Backend.hpp>
#include <vellum/domain/Analyzer.hpp>
#include <vellum/hir/HIR.hpp>
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <ostream>

namespace vellumc::dump {

    /// @brief HIR 모듈의 함수/문장 트리를 출력한다.
    void dump_hir_module(const vellum::hir::Module& m, const vellum::ty::TypePool& types, std::ostream& os);

    /// @brief SSA 모듈 전체를 사람이 읽기 쉬운 형태로 출력한다.
    void dump_ssa_module(const vellum::ssa::Module& m, const vellum::ty::TypePool& types, std::ostream& os);

    /// @brief 함수별 read/write 도메인 집합과 분석 통계.
    void dump_domains(const vellum::ssa::Module& m, const vellum::domain::AnalysisResult& r, std::ostream& os);

    /// @brief bytecode 디스어셈블과 함수별 slot/gas 요약.
    void dump_bytecode(const vellum::backend::CompileResult& r, std::ostream& os);

} // namespace vellumc::dump
