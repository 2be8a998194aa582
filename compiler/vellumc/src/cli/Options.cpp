// compiler/vellumc/src/cli/Options.cpp
#include <vellumc/cli/Options.hpp>

#include <charconv>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace vellumc::cli {

    namespace {

        /// @brief `-Xvellum` 내부 옵션 하나를 파싱한다.
        bool parse_internal_opt_(Options& out, std::string_view token) {
            if (token == "-hir-dump") {
                out.internal.hir_dump = true;
                return true;
            }
            if (token == "-ssa-dump") {
                out.internal.ssa_dump = true;
                return true;
            }
            if (token == "-domain-dump") {
                out.internal.domain_dump = true;
                return true;
            }
            if (token == "-bytecode-dump") {
                out.internal.bytecode_dump = true;
                return true;
            }
            return false;
        }

        /// @brief 10진수 부호 없는 정수를 읽는다. 범위를 넘으면 nullopt.
        std::optional<uint64_t> parse_uint_(std::string_view s) {
            if (s.empty()) return std::nullopt;
            uint64_t v = 0;
            const auto* end = s.data() + s.size();
            const auto r = std::from_chars(s.data(), end, v);
            if (r.ec != std::errc{} || r.ptr != end) return std::nullopt;
            return v;
        }

        /// @brief 옵션 다음의 필수 값을 읽는다.
        std::optional<std::string_view> read_next_(
            const std::vector<std::string_view>& args,
            size_t& i
        ) {
            if (i + 1 >= args.size()) return std::nullopt;
            ++i;
            return args[i];
        }

        /// @brief `--name value` 또는 `--name=value`를 읽는다. 이 옵션이 아니면 false.
        bool read_value_opt_(
            Options& out,
            const std::vector<std::string_view>& args,
            size_t& i,
            std::string_view name,
            std::string_view& value
        ) {
            const auto a = args[i];
            if (a == name) {
                const auto v = read_next_(args, i);
                if (!v || v->empty()) {
                    out.ok = false;
                    out.error = std::string(name) + " requires a value";
                    return true;
                }
                value = *v;
                return true;
            }
            if (a.starts_with(name) && a.size() > name.size() && a[name.size()] == '=') {
                value = a.substr(name.size() + 1);
                if (value.empty()) {
                    out.ok = false;
                    out.error = std::string(name) + " requires a value";
                }
                return true;
            }
            return false;
        }

        /// @brief `-O0|-O1` 최적화 레벨을 읽는다.
        bool parse_opt_level_(Options& out, std::string_view arg) {
            if (arg.size() != 3) return false;
            if (arg[0] != '-' || arg[1] != 'O') return false;
            if (arg[2] < '0' || arg[2] > '9') return false;
            const uint32_t lv = static_cast<uint32_t>(arg[2] - '0');
            out.pass_opt.opt_level = (lv > 1) ? 1 : lv;
            return true;
        }

        /// @brief `-fmax-errors=N` 형식의 값을 읽는다.
        bool parse_max_errors_(Options& out, std::string_view arg) {
            constexpr std::string_view kPrefix = "-fmax-errors=";
            if (!arg.starts_with(kPrefix)) return false;
            const auto v = parse_uint_(arg.substr(kPrefix.size()));
            if (!v) {
                out.ok = false;
                out.error = "-fmax-errors requires a number";
                return true;
            }
            out.max_errors = (*v < 1) ? 1u
                : (*v > std::numeric_limits<uint32_t>::max()) ? std::numeric_limits<uint32_t>::max()
                : static_cast<uint32_t>(*v);
            return true;
        }

        /// @brief 한도 옵션(`--max-locals=N` 등)을 읽는다.
        bool parse_limit_opt_(Options& out, const std::vector<std::string_view>& args, size_t& i) {
            struct LimitMap {
                std::string_view name;
                uint32_t* field = nullptr;
            };
            LimitMap maps[] = {
                {"--max-locals", &out.backend.max_locals},
                {"--max-fields", &out.backend.max_aggregate_fields},
                {"--memory-pages", &out.backend.memory_pages},
                {"--max-enumerated-keys", &out.domain.max_enumerated_keys},
                {"--inline-max-insts", &out.pass_opt.inline_max_insts},
            };

            for (const auto& m : maps) {
                std::string_view value{};
                if (!read_value_opt_(out, args, i, m.name, value)) continue;
                if (!out.ok) return true;

                const auto v = parse_uint_(value);
                if (!v || *v > std::numeric_limits<uint32_t>::max()) {
                    out.ok = false;
                    out.error = std::string(m.name) + " requires a valid number";
                    return true;
                }
                *m.field = static_cast<uint32_t>(*v);
                return true;
            }
            return false;
        }

        bool validate_(Options& out) {
            if (out.backend.memory_pages == 0) {
                out.ok = false;
                out.error = "--memory-pages must be at least 1";
                return false;
            }
            if (out.backend.max_locals == 0) {
                out.ok = false;
                out.error = "--max-locals must be at least 1";
                return false;
            }
            return true;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "vellumc [options] <input.hir.json>\n"
            << "  vellumc token.hir.json --emit-bytecode token.vlbc --emit-manifest token.manifest.json\n"
            << "  vellumc --version\n"
            << "\n"
            << "General options:\n"
            << "  -h, --help\n"
            << "  --version\n"
            << "  --emit-bytecode <path>     Write the serialized bytecode module\n"
            << "  --emit-manifest <path>     Write the domain/gas manifest (JSON)\n"
            << "  --unit <id>                Override the compilation unit id\n"
            << "  --diag-format text|json\n"
            << "  -O0|-O1                    Optimization level\n"
            << "  --lang en|ko               Diagnostic language\n"
            << "  -fmax-errors=<N>\n"
            << "\n"
            << "Domain analysis:\n"
            << "  --wildcard-policy coarsen|reject\n"
            << "  --max-enumerated-keys <N>\n"
            << "\n"
            << "Backend limits:\n"
            << "  --max-locals <N>\n"
            << "  --max-fields <N>\n"
            << "  --memory-pages <N>\n"
            << "  --inline-max-insts <N>\n"
            << "\n"
            << "Developer-only options (must be passed through -Xvellum):\n"
            << "  -Xvellum -hir-dump\n"
            << "  -Xvellum -ssa-dump\n"
            << "  -Xvellum -domain-dump\n"
            << "  -Xvellum -bytecode-dump\n";
    }

    Options parse_options(int argc, char** argv) {
        Options out{};
        if (argc <= 1) {
            out.mode = Mode::kUsage;
            return out;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        out.mode = Mode::kCompile;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto a = args[i];

            if (a == "-h" || a == "--help") {
                out.mode = Mode::kUsage;
                return out;
            }

            if (a == "--version") {
                out.mode = Mode::kVersion;
                return out;
            }

            std::string_view value{};
            if (read_value_opt_(out, args, i, "--emit-bytecode", value)) {
                if (!out.ok) return out;
                out.bytecode_path = std::string(value);
                continue;
            }
            if (read_value_opt_(out, args, i, "--emit-manifest", value)) {
                if (!out.ok) return out;
                out.manifest_path = std::string(value);
                continue;
            }
            if (read_value_opt_(out, args, i, "--unit", value)) {
                if (!out.ok) return out;
                out.unit_id = std::string(value);
                continue;
            }

            if (read_value_opt_(out, args, i, "--lang", value)) {
                if (!out.ok) return out;
                if (value == "ko") out.lang = vellum::diag::Language::kKo;
                else if (value == "en") out.lang = vellum::diag::Language::kEn;
                else {
                    out.ok = false;
                    out.error = "--lang requires en or ko";
                    return out;
                }
                continue;
            }

            if (read_value_opt_(out, args, i, "--diag-format", value)) {
                if (!out.ok) return out;
                if (value == "text") out.diag_format = DiagFormat::kText;
                else if (value == "json") out.diag_format = DiagFormat::kJson;
                else {
                    out.ok = false;
                    out.error = "unsupported --diag-format value: " + std::string(value);
                    return out;
                }
                continue;
            }

            if (read_value_opt_(out, args, i, "--wildcard-policy", value)) {
                if (!out.ok) return out;
                if (value == "coarsen") out.domain.wildcard_policy = vellum::domain::WildcardPolicy::kCoarsen;
                else if (value == "reject") out.domain.wildcard_policy = vellum::domain::WildcardPolicy::kReject;
                else {
                    out.ok = false;
                    out.error = "unsupported --wildcard-policy value: " + std::string(value);
                    return out;
                }
                continue;
            }

            if (parse_limit_opt_(out, args, i)) {
                if (!out.ok) return out;
                continue;
            }

            if (a == "-Xvellum") {
                const auto v = read_next_(args, i);
                if (!v) {
                    out.ok = false;
                    out.error = "-Xvellum requires one internal argument";
                    return out;
                }
                out.has_xvellum = true;
                if (!parse_internal_opt_(out, *v)) {
                    out.ok = false;
                    out.error = "unknown -Xvellum argument: " + std::string(*v);
                    return out;
                }
                continue;
            }

            // 내부 옵션은 -Xvellum 없이 쓸 수 없다.
            if (a == "-hir-dump" || a == "-ssa-dump" || a == "-domain-dump" || a == "-bytecode-dump") {
                out.ok = false;
                out.error = std::string(a) + " must be passed through -Xvellum";
                return out;
            }

            if (parse_opt_level_(out, a)) continue;
            if (parse_max_errors_(out, a)) {
                if (!out.ok) return out;
                continue;
            }

            if (!a.empty() && a[0] == '-') {
                out.ok = false;
                out.error = "unknown option: " + std::string(a);
                return out;
            }

            out.inputs.push_back(std::string(a));
        }

        if (out.inputs.empty()) {
            out.ok = false;
            out.error = "no input file";
            return out;
        }

        if (out.inputs.size() > 1) {
            out.ok = false;
            out.error = "multiple input files are not supported";
            return out;
        }

        if (!out.unit_id.empty()) {
            out.domain.unit_id = out.unit_id;
            out.backend.unit_id = out.unit_id;
        }

        validate_(out);
        return out;
    }

} // namespace vellumc::cli
