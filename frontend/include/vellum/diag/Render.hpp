// frontend/include/vellum/diag/Render.hpp
#pragma once
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/text/SourceManager.hpp>

#include <string>
#include <string_view>


namespace vellum::diag {

    std::string_view code_name(Code c);

    /// @brief 템플릿에 인자를 채운 메시지 본문만 만든다.
    std::string render_message(const Diagnostic& d, Language lang);

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

    /// @brief Bag 전체를 JSON 배열 문자열로 직렬화한다(`--diag-format json`).
    std::string render_json(const Bag& bag, Language lang, const SourceManager& sm);

} // namespace vellum::diag
