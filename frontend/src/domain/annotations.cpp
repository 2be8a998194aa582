// frontend/src/domain/annotations.cpp
#include <vellum/domain/Annotations.hpp>

#include <cctype>
#include <string_view>


namespace vellum::domain {

    namespace {

        class AttrParser final {
        public:
            explicit AttrParser(std::string_view text) : s_(text) {}

            void skip_ws() {
                while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
            }

            bool eof() {
                skip_ws();
                return pos_ >= s_.size();
            }

            bool eat(char c) {
                skip_ws();
                if (pos_ < s_.size() && s_[pos_] == c) {
                    ++pos_;
                    return true;
                }
                return false;
            }

            std::string_view ident() {
                skip_ws();
                const size_t b = pos_;
                while (pos_ < s_.size()) {
                    const char c = s_[pos_];
                    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') break;
                    ++pos_;
                }
                return s_.substr(b, pos_ - b);
            }

            /// @brief `"..."` 문자열. `\"`, `\\` 이스케이프만 허용한다.
            bool string_lit(std::string& out) {
                skip_ws();
                if (pos_ >= s_.size() || s_[pos_] != '"') return false;
                ++pos_;
                out.clear();
                while (pos_ < s_.size()) {
                    const char c = s_[pos_++];
                    if (c == '"') return true;
                    if (c == '\\') {
                        if (pos_ >= s_.size()) return false;
                        const char e = s_[pos_++];
                        if (e != '"' && e != '\\') return false;
                        out.push_back(e);
                        continue;
                    }
                    out.push_back(c);
                }
                return false;
            }

        private:
            std::string_view s_;
            size_t pos_ = 0;
        };

        void malformed_(diag::Bag& bag, const hir::Attr& a, std::string_view why) {
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kAttrMalformed, a.span);
            d.add_arg(a.text);
            d.add_arg(why);
            bag.add(std::move(d));
        }

        bool parse_declared_key_(std::string_view text, DeclaredKey& out, std::string& why) {
            const size_t colon = text.find(':');
            const std::string_view ns = text.substr(0, colon);
            if (ns.empty()) {
                why = "empty state namespace";
                return false;
            }
            if (ns.find_first_of("*.") != std::string_view::npos) {
                why = "state namespace must not contain '*' or '.'";
                return false;
            }
            out.ns = std::string(ns);

            if (colon == std::string_view::npos) {
                out.wildcard = true;
                return true;
            }
            const std::string_view key = text.substr(colon + 1);
            if (key == "*") {
                out.wildcard = true;
                return true;
            }
            if (key.empty()) {
                why = "empty state key";
                return false;
            }
            if (key.find('*') != std::string_view::npos) {
                why = "'*' is only allowed as a whole key";
                return false;
            }
            out.key = std::string(key);
            return true;
        }

        /// @brief `( "a", "b" )` 인자 목록. 괄호가 없으면 빈 목록.
        bool parse_args_(AttrParser& p, std::vector<std::string>& args, bool& has_parens) {
            has_parens = p.eat('(');
            if (!has_parens) return true;
            if (p.eat(')')) return true;
            for (;;) {
                std::string s;
                if (!p.string_lit(s)) return false;
                args.push_back(std::move(s));
                if (p.eat(',')) continue;
                return p.eat(')');
            }
        }

        /// @brief 앞뒤 공백과 `#[...]` 표기를 벗긴 본문.
        std::string_view strip_attr_(std::string_view text) {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
            if (text.size() >= 3 && text.substr(0, 2) == "#[" && text.back() == ']') {
                text = text.substr(2, text.size() - 3);
            }
            return text;
        }

    } // namespace

    bool overrides_domains(const std::vector<hir::Attr>& attrs) {
        for (const auto& a : attrs) {
            AttrParser p(strip_attr_(a.text));
            const std::string_view name = p.ident();
            if (name == "reads" || name == "writes" || name == "no_state") return true;
        }
        return false;
    }

    bool parse_annotations(const std::vector<hir::Attr>& attrs, FnAnnotations& out, diag::Bag& bag) {
        bool ok = true;

        for (const auto& a : attrs) {
            // `#[...]` 표기도 받는다.
            AttrParser p(strip_attr_(a.text));
            const std::string_view name = p.ident();
            if (name.empty()) {
                malformed_(bag, a, "expected an annotation name");
                ok = false;
                continue;
            }

            std::vector<std::string> args;
            bool has_parens = false;
            if (!parse_args_(p, args, has_parens) || !p.eof()) {
                malformed_(bag, a, "expected a parenthesized list of string literals");
                ok = false;
                continue;
            }

            if (name == "reads" || name == "writes") {
                const bool is_reads = (name == "reads");
                if (!has_parens) {
                    malformed_(bag, a, "domain annotation needs a key list");
                    ok = false;
                    continue;
                }
                if ((is_reads && out.has_reads) || (!is_reads && out.has_writes)) {
                    malformed_(bag, a, "duplicate domain annotation");
                    ok = false;
                    continue;
                }

                std::vector<DeclaredKey> keys;
                bool keys_ok = true;
                for (const auto& s : args) {
                    DeclaredKey k{};
                    std::string why;
                    if (!parse_declared_key_(s, k, why)) {
                        malformed_(bag, a, why);
                        keys_ok = false;
                        break;
                    }
                    keys.push_back(std::move(k));
                }
                if (!keys_ok) {
                    ok = false;
                    continue;
                }

                if (is_reads) {
                    out.has_reads = true;
                    out.reads = std::move(keys);
                } else {
                    out.has_writes = true;
                    out.writes = std::move(keys);
                }
            } else if (name == "no_state") {
                if (has_parens) {
                    malformed_(bag, a, "no_state takes no arguments");
                    ok = false;
                    continue;
                }
                out.no_state = true;
            } else if (name == "proof") {
                if (args.size() != 1 || args[0].empty()) {
                    malformed_(bag, a, "proof takes exactly one non-empty id");
                    ok = false;
                    continue;
                }
                out.proofs.push_back(args[0]);
            }
        }

        if (out.no_state && (out.has_reads || out.has_writes)) {
            for (const auto& a : attrs) {
                if (a.text.find("no_state") == std::string::npos) continue;
                malformed_(bag, a, "no_state cannot be combined with reads/writes");
                break;
            }
            ok = false;
        }
        return ok;
    }

} // namespace vellum::domain
