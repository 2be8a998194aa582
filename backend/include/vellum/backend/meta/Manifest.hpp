// backend/include/vellum/backend/meta/Manifest.hpp
#pragma once
#include <vellum/backend/Backend.hpp>
#include <vellum/domain/Analyzer.hpp>
#include <vellum/ssa/SSA.hpp>

#include <llvm/Support/JSON.h>

#include <cstdint>
#include <string>
#include <string_view>


namespace vellum::backend::meta {

    inline constexpr std::string_view kManifestFormat = "vellum-manifest";
    inline constexpr int64_t kManifestVersion = 1;

    /// @brief 스케줄러가 읽는 함수별 도메인/gas 요약을 만든다.
    ///
    /// lowering에 성공한 함수만 싣는다. 키는 mangled 이름이다.
    llvm::json::Value build_manifest(
        const ssa::Module& m,
        const domain::AnalysisResult& domains,
        const CompileResult& compiled,
        std::string_view unit
    );

    /// @brief 사람이 읽을 수 있게 들여쓰기한 JSON 문자열.
    std::string manifest_to_string(const llvm::json::Value& v);

    /// @brief 파일로 쓴다. 실패하면 err에 이유를 담고 false.
    bool write_manifest(const llvm::json::Value& v, const std::string& path, std::string& err);

    const char* domain_source_name(domain::DomainSource s);

} // namespace vellum::backend::meta
