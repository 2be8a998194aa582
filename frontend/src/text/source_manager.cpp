// frontend/src/text/source_manager.cpp
#include <vellum/text/SourceManager.hpp>

#include <algorithm>


namespace vellum {

    std::vector<uint32_t> SourceManager::build_line_starts_(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);
        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    // UTF-8 continuation byte(10xxxxxx)를 제외하고 센다.
    uint32_t SourceManager::count_code_points_(std::string_view s) {
        uint32_t n = 0;
        for (char ch : s) {
            const auto c = static_cast<unsigned char>(ch);
            if ((c & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    uint32_t SourceManager::line_index_(const File& f, uint32_t byte_off) {
        const auto& starts = f.line_starts;
        auto it = std::upper_bound(starts.begin(), starts.end(), byte_off);
        return (it == starts.begin()) ? 0 : static_cast<uint32_t>((it - starts.begin()) - 1);
    }

    uint32_t SourceManager::add(std::string name, std::string content) {
        File f;
        f.name = std::move(name);
        f.content = std::move(content);
        f.line_starts = build_line_starts_(f.content);
        files_.push_back(std::move(f));
        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        if (!has(file_id)) return "<unknown>";
        return files_[file_id].name;
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        if (!has(file_id)) return {};
        return files_[file_id].content;
    }

    LineCol SourceManager::line_col(uint32_t file_id, uint32_t byte_off) const {
        LineCol lc{};
        if (!has(file_id)) return lc;

        const auto& f = files_[file_id];
        if (f.content.empty()) return lc;

        const uint32_t off = std::min<uint32_t>(byte_off, static_cast<uint32_t>(f.content.size()));
        const uint32_t idx = line_index_(f, off);
        const uint32_t line_start = f.line_starts[idx];

        lc.line = idx + 1;
        lc.col = count_code_points_(std::string_view(f.content).substr(line_start, off - line_start)) + 1;
        return lc;
    }

    Snippet SourceManager::snippet_for_span(const Span& sp) const {
        Snippet sn{};
        if (!has(sp.file_id)) return sn;

        const auto& f = files_[sp.file_id];
        if (f.content.empty()) return sn;

        const uint32_t size = static_cast<uint32_t>(f.content.size());
        const uint32_t lo = std::min(sp.lo, size);
        const uint32_t hi = std::min(std::max(sp.hi, lo), size);

        const uint32_t idx = line_index_(f, lo);
        const uint32_t line_start = f.line_starts[idx];
        const uint32_t line_end = (idx + 1 < f.line_starts.size())
            ? (f.line_starts[idx + 1] - 1)
            : size;

        const std::string_view all = f.content;
        sn.line_text = all.substr(line_start, line_end - line_start);
        sn.line_no = idx + 1;

        // v0: 여러 줄에 걸친 span은 첫 줄까지만 밑줄을 긋는다.
        const uint32_t hi_clamped = std::min(hi, line_end);
        sn.caret_cols_before = count_code_points_(all.substr(line_start, lo - line_start));
        sn.caret_cols_len = count_code_points_(all.substr(lo, hi_clamped - lo));
        if (sn.caret_cols_len == 0) sn.caret_cols_len = 1;
        return sn;
    }

} // namespace vellum
