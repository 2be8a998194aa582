// frontend/include/vellum/text/SourceManager.hpp
#pragma once
#include <vellum/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace vellum {

    struct LineCol {
        uint32_t line = 0; // 1-based, 0 when no source text is attached
        uint32_t col  = 0; // 1-based, code points
    };

    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 0;
        uint32_t caret_cols_before = 0; // number of spaces before '^'
        uint32_t caret_cols_len = 1;    // number of '^'
    };

    /// @brief 계약 원본 소스(또는 HIR 문서)를 file_id로 보관하고 span 위치를 계산한다.
    class SourceManager {
    public:
        uint32_t add(std::string name, std::string content);

        bool has(uint32_t file_id) const { return file_id < files_.size(); }

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;

        // byte_off -> (line, col)
        LineCol line_col(uint32_t file_id, uint32_t byte_off) const;

        // single-line snippet for span. 텍스트가 없으면 line_no == 0.
        Snippet snippet_for_span(const Span& sp) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts; // byte offsets, includes 0
        };

        static std::vector<uint32_t> build_line_starts_(std::string_view s);
        static uint32_t count_code_points_(std::string_view s);
        static uint32_t line_index_(const File& f, uint32_t byte_off);

        std::vector<File> files_;
    };

} // namespace vellum
