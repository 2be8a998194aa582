// frontend/include/vellum/diag/Diagnostic.hpp
#pragma once
#include <vellum/text/Span.hpp>
#include <vellum/diag/DiagCode.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace vellum::diag {

    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span)
            : severity_(severity), code_(code), span_(span) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }
        void add_arg_int(int64_t v)      {  args_.emplace_back(std::to_string(v));  }

        /// @brief 충돌하는 이전 접근 위치 등 보조 span을 붙인다.
        void set_related(Span sp) {
            related_ = sp;
            has_related_ = true;
        }

        Severity severity() const   {  return severity_;    }
        Code code() const           {  return code_;        }
        Span span() const           {  return span_;        }
        bool has_related() const    {  return has_related_; }
        Span related() const        {  return related_;     }
        const std::vector<std::string>& args() const {  return args_;  }

    private:
        Severity severity_{Severity::kError};
        Code code_{Code::kHirMalformed};
        Span span_{};
        Span related_{};
        bool has_related_ = false;
        std::vector<std::string> args_;
    };

    class Bag {
    public:
        void add(Diagnostic d) {
            switch (d.severity()) {
                case Severity::kError:   ++error_count_; break;
                case Severity::kFatal:   ++fatal_count_; break;
                case Severity::kWarning: ++warning_count_; break;
                case Severity::kNote:    break;
            }
            diags_.push_back(std::move(d));
        }

        bool has_error() const {
            return error_count_ != 0 || fatal_count_ != 0;
        }

        bool has_fatal() const {
            return fatal_count_ != 0;
        }

        bool has_code(Code c) const {
            for (const auto& d : diags_) {
                if (d.code() == c) return true;
            }
            return false;
        }

        uint32_t count_code(Code c) const {
            uint32_t n = 0;
            for (const auto& d : diags_) {
                if (d.code() == c) ++n;
            }
            return n;
        }

        const std::vector<Diagnostic>& diags() const {  return diags_;  }

        uint32_t error_count() const   {  return error_count_;  }
        uint32_t fatal_count() const   {  return fatal_count_;  }
        uint32_t warning_count() const {  return warning_count_;  }

        uint32_t issue_count() const {  return error_count_ + fatal_count_;  }

    private:
        std::vector<Diagnostic> diags_;
        uint32_t error_count_ = 0;
        uint32_t fatal_count_ = 0;
        uint32_t warning_count_ = 0;
    };

} // namespace vellum::diag
