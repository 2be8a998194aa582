#include <vellumc/cli/Options.hpp>

#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static vellumc::cli::Options parse_(std::initializer_list<std::string_view> args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("vellumc");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return vellumc::cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool test_emit_paths_parse_() {
        const auto opt = parse_({
            "token.hir.json",
            "--emit-bytecode", "token.vlbc",
            "--emit-manifest=token.manifest.json",
            "--unit", "token",
        });

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.mode == vellumc::cli::Mode::kCompile, "mode must be compile");
        ok &= require_(opt.inputs.size() == 1 && opt.inputs[0] == "token.hir.json", "input must be recorded");
        ok &= require_(opt.bytecode_path == "token.vlbc", "bytecode path (separate value) must parse");
        ok &= require_(opt.manifest_path == "token.manifest.json", "manifest path (= value) must parse");
        ok &= require_(opt.unit_id == "token", "unit override must parse");
        ok &= require_(opt.domain.unit_id == "token" && opt.backend.unit_id == "token",
                       "unit override must reach domain and backend options");
        return ok;
    }

    static bool test_limits_parse_() {
        const auto opt = parse_({
            "--max-locals=77",
            "--max-fields", "9",
            "--memory-pages=4",
            "--max-enumerated-keys=2",
            "--inline-max-insts=0",
            "main.hir.json",
        });

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.backend.max_locals == 77, "max_locals must parse");
        ok &= require_(opt.backend.max_aggregate_fields == 9, "max_fields must parse");
        ok &= require_(opt.backend.memory_pages == 4, "memory_pages must parse");
        ok &= require_(opt.domain.max_enumerated_keys == 2, "max_enumerated_keys must parse");
        ok &= require_(opt.pass_opt.inline_max_insts == 0, "inline_max_insts must parse");
        return ok;
    }

    static bool test_invalid_limits_rejected_() {
        bool ok = true;

        const auto bad_number = parse_({"--max-locals=12x", "main.hir.json"});
        ok &= require_(!bad_number.ok, "non-numeric limit must fail");

        const auto zero_pages = parse_({"--memory-pages=0", "main.hir.json"});
        ok &= require_(!zero_pages.ok, "zero memory pages must fail");

        const auto missing = parse_({"main.hir.json", "--max-locals"});
        ok &= require_(!missing.ok && !missing.error.empty(), "missing value must fail with a message");

        const auto too_big = parse_({"--max-locals=99999999999", "main.hir.json"});
        ok &= require_(!too_big.ok, "limit beyond 32 bits must fail");
        return ok;
    }

    static bool test_domain_and_diag_options_() {
        const auto opt = parse_({
            "--wildcard-policy", "reject",
            "--diag-format=json",
            "--lang", "ko",
            "-fmax-errors=0",
            "-O0",
            "main.hir.json",
        });

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.domain.wildcard_policy == vellum::domain::WildcardPolicy::kReject, "policy must parse");
        ok &= require_(opt.diag_format == vellumc::cli::DiagFormat::kJson, "diag format must parse");
        ok &= require_(opt.lang == vellum::diag::Language::kKo, "language must parse");
        ok &= require_(opt.max_errors == 1, "max errors must clamp to at least 1");
        ok &= require_(opt.pass_opt.opt_level == 0, "-O0 must disable the optimizer");

        const auto high = parse_({"-O3", "main.hir.json"});
        ok &= require_(high.ok && high.pass_opt.opt_level == 1, "-O3 must clamp to the highest level");

        const auto bad_policy = parse_({"--wildcard-policy=maybe", "main.hir.json"});
        ok &= require_(!bad_policy.ok, "unknown policy must fail");
        return ok;
    }

    static bool test_internal_flags_require_xvellum_() {
        bool ok = true;

        const auto opt = parse_({"-Xvellum", "-ssa-dump", "-Xvellum", "-domain-dump", "main.hir.json"});
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.has_xvellum, "has_xvellum must be set when internal option is used");
        ok &= require_(opt.internal.ssa_dump && opt.internal.domain_dump, "internal dump flags must be enabled");
        ok &= require_(!opt.internal.hir_dump && !opt.internal.bytecode_dump, "other dump flags stay off");

        const auto bare = parse_({"-ssa-dump", "main.hir.json"});
        ok &= require_(!bare.ok, "internal flag without -Xvellum must fail");

        const auto unknown = parse_({"-Xvellum", "-nope", "main.hir.json"});
        ok &= require_(!unknown.ok, "unknown internal flag must fail");
        return ok;
    }

    static bool test_modes_and_inputs_() {
        bool ok = true;
        ok &= require_(parse_({}).mode == vellumc::cli::Mode::kUsage, "no arguments prints usage");
        ok &= require_(parse_({"--help"}).mode == vellumc::cli::Mode::kUsage, "--help prints usage");
        ok &= require_(parse_({"--version"}).mode == vellumc::cli::Mode::kVersion, "--version mode");

        const auto none = parse_({"-O1"});
        ok &= require_(!none.ok, "options without input must fail");

        const auto two = parse_({"a.hir.json", "b.hir.json"});
        ok &= require_(!two.ok, "multiple inputs must fail");

        const auto unknown = parse_({"--frobnicate", "a.hir.json"});
        ok &= require_(!unknown.ok && unknown.error.find("--frobnicate") != std::string::npos,
                       "unknown option must be named in the error");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"emit_paths_parse", test_emit_paths_parse_},
        {"limits_parse", test_limits_parse_},
        {"invalid_limits_rejected", test_invalid_limits_rejected_},
        {"domain_and_diag_options", test_domain_and_diag_options_},
        {"internal_flags_require_xvellum", test_internal_flags_require_xvellum_},
        {"modes_and_inputs", test_modes_and_inputs_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
