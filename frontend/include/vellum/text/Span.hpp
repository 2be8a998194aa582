// frontend/include/vellum/text/Span.hpp
#pragma once
#include <cstdint>


namespace vellum {

    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive

        bool empty() const { return lo == hi; }
    };

    /// @brief 두 span을 덮는 최소 span을 만든다(file이 다르면 a를 유지).
    inline Span join_span(Span a, Span b) {
        if (a.file_id != b.file_id) return a;
        if (a.empty()) return b;
        if (b.empty()) return a;
        Span out = a;
        out.lo = (a.lo < b.lo) ? a.lo : b.lo;
        out.hi = (a.hi > b.hi) ? a.hi : b.hi;
        return out;
    }

} // namespace vellum
