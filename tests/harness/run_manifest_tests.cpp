#include <vellumc/driver/Driver.hpp>

#include <vellum/backend/meta/Manifest.hpp>

#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using vellum::diag::Code;
    using vellumc::driver::Compilation;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static void compile_(const std::string& json, Compilation& c, const vellumc::cli::Options& opt = {}) {
        vellumc::driver::compile_document(json, "manifest.json", opt, c);
    }

    static const llvm::json::Object* functions_(const Compilation& c) {
        const auto* root = c.manifest.getAsObject();
        return root ? root->getObject("functions") : nullptr;
    }

    /// @brief manifest에서 원래 이름으로 함수 항목을 찾는다.
    static const llvm::json::Object* entry_(const Compilation& c, const char* name) {
        const auto* fns = functions_(c);
        if (fns == nullptr) return nullptr;
        for (const auto& kv : *fns) {
            const auto* o = kv.second.getAsObject();
            if (o == nullptr) continue;
            const auto n = o->getString("name");
            if (n && *n == name) return o;
        }
        return nullptr;
    }

    static std::vector<std::string> keys_(const llvm::json::Object& fn, const char* set) {
        std::vector<std::string> out;
        if (const auto* arr = fn.getArray(set)) {
            for (const auto& v : *arr) {
                const auto* o = v.getAsObject();
                if (o == nullptr) continue;
                if (const auto k = o->getString("key")) out.push_back(k->str());
            }
        }
        return out;
    }

    static bool test_declared_writes_survive_under_declaration() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"pay","pub":true,
            "attrs":["#[writes(\"acct:alice\")]"],
            "body":[
                {"do":{"put":"acct","key":{"bytes":"alice"},"value":{"int":1,"type":"u64"}}},
                {"do":{"put":"acct","key":{"bytes":"bob"},"value":{"int":2,"type":"u64"}}}
            ]}]})JSON";

        Compilation c{};
        compile_(json, c);

        bool ok = true;
        ok &= require_(c.ok, "warnings do not fail the compilation");
        ok &= require_(c.bag.has_code(Code::kDomainUnderDeclared), "bob write is reported");

        const auto* fn = entry_(c, "pay");
        ok &= require_(fn != nullptr, "pay is in the manifest");
        if (fn == nullptr) return false;

        const auto writes = keys_(*fn, "writes");
        ok &= require_(writes.size() == 1 && writes[0] == "t.acct:alice", "manifest keeps the declared write set");
        ok &= require_(fn->getString("domain_source") && *fn->getString("domain_source") == "declared",
                       "domain source is declared");
        ok &= require_(fn->getBoolean("exported") && *fn->getBoolean("exported"), "pub function is exported");
        return ok;
    }

    static bool test_document_shape() {
        const std::string json = R"JSON({"unit":"vault","fns":[
            {"name":"get","pub":true,"ret":"u64","body":[
                {"return":{"unwrap":{"get":"bal","key":{"bytes":"alice"},"type":"u64"}}}
            ]},
            {"name":"helper","ret":"u64","body":[{"return":{"int":1,"type":"u64"}}]}
        ]})JSON";

        Compilation c{};
        compile_(json, c);

        const auto* root = c.manifest.getAsObject();
        bool ok = require_(root != nullptr, "manifest is an object");
        if (root == nullptr) return false;

        ok &= require_(root->getString("format") && *root->getString("format") == "vellum-manifest", "format tag");
        ok &= require_(root->getInteger("version") && *root->getInteger("version") == 1, "format version");
        ok &= require_(root->getString("unit") && *root->getString("unit") == "vault", "unit id");

        const auto* imports = root->getArray("imports");
        ok &= require_(imports != nullptr && imports->size() == c.compiled.module.imports.size(),
                       "imports mirror the bytecode module");

        const auto* get = entry_(c, "get");
        const auto* helper = entry_(c, "helper");
        ok &= require_(get != nullptr && helper != nullptr, "both functions are listed");
        if (get != nullptr) {
            const auto reads = keys_(*get, "reads");
            ok &= require_(reads.size() == 1 && reads[0] == "vault.bal:alice", "inferred read key");
            ok &= require_(*get->getString("domain_source") == "inferred", "inferred domain source");
            const auto* arr = get->getArray("reads");
            const auto* k = (arr && !arr->empty()) ? (*arr)[0].getAsObject() : nullptr;
            ok &= require_(k != nullptr && k->getString("hash") && k->getString("hash")->size() == 64, "hex hash");
            ok &= require_(k != nullptr && k->getBoolean("wildcard") && !*k->getBoolean("wildcard"), "exact key");
        }
        if (helper != nullptr) {
            ok &= require_(helper->getBoolean("exported") && !*helper->getBoolean("exported"), "private function");
        }
        return ok;
    }

    static bool test_excluded_functions_are_omitted() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"bad","body":[
                {"let":"a","init":{"bytes":"x"}},
                {"let":"b","init":"a"},
                {"let":"c","init":"a"}
            ]},
            {"name":"calls_bad","pub":true,"body":[{"do":{"call":"bad","args":[]}}]},
            {"name":"good","pub":true,"body":[]}
        ]})JSON";

        Compilation c{};
        compile_(json, c);

        bool ok = true;
        ok &= require_(!c.ok, "ownership error fails the compilation");
        ok &= require_(c.reached_backend, "remaining functions are still lowered");
        ok &= require_(entry_(c, "bad") == nullptr, "failing function is omitted");
        ok &= require_(entry_(c, "calls_bad") == nullptr, "its caller is omitted");
        ok &= require_(entry_(c, "good") != nullptr, "independent function is kept");
        return ok;
    }

    static bool test_unit_override_changes_keys() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","pub":true,"body":[
            {"do":{"put":"acct","key":{"bytes":"alice"},"value":{"int":1,"type":"u64"}}}
        ]}]})JSON";

        vellumc::cli::Options opt{};
        opt.unit_id = "other";

        Compilation c{};
        compile_(json, c, opt);

        const auto* fn = entry_(c, "f");
        bool ok = require_(fn != nullptr, "function is listed");
        if (fn == nullptr) return false;
        const auto writes = keys_(*fn, "writes");
        ok &= require_(writes.size() == 1 && writes[0] == "other.acct:alice", "keys use the overriding unit");
        ok &= require_(c.unit == "other", "compilation records the unit");
        return ok;
    }

    static bool test_rejected_dynamic_key_is_omitted() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"dyn","pub":true,"params":[["who","bytes"]],"body":[
                {"do":{"put":"acct","key":"who","value":{"int":1,"type":"u64"}}}
            ]},
            {"name":"fixed","pub":true,"body":[
                {"do":{"put":"acct","key":{"bytes":"x"},"value":{"int":1,"type":"u64"}}}
            ]}
        ]})JSON";

        bool ok = true;
        {
            Compilation c{};
            compile_(json, c);
            const auto* fn = entry_(c, "dyn");
            ok &= require_(c.ok, "coarsening is the default");
            ok &= require_(fn != nullptr && keys_(*fn, "writes") == std::vector<std::string>{"t.acct:*"},
                           "dynamic key becomes a namespace wildcard");
        }
        {
            vellumc::cli::Options opt{};
            opt.domain.wildcard_policy = vellum::domain::WildcardPolicy::kReject;
            Compilation c{};
            compile_(json, c, opt);
            ok &= require_(!c.ok, "rejection is an error");
            ok &= require_(entry_(c, "dyn") == nullptr, "rejected function is omitted");
            ok &= require_(entry_(c, "fixed") != nullptr, "other functions are kept");
        }
        return ok;
    }

    static bool test_gas_includes_callees() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"leaf","ret":"u64","params":[["x","u64"]],"body":[
                {"if":{"bin":"==","l":"x","r":0},"then":[{"revert":"zero"}]},
                {"return":{"bin":"*","l":"x","r":3}}
            ]},
            {"name":"top","pub":true,"ret":"u64","params":[["x","u64"]],"body":[
                {"return":{"bin":"+","l":{"call":"leaf","args":["x"]},"r":1}}
            ]}
        ]})JSON";

        Compilation c{};
        compile_(json, c);

        const auto* leaf = entry_(c, "leaf");
        const auto* top = entry_(c, "top");
        bool ok = require_(leaf != nullptr && top != nullptr, "both functions are listed");
        if (!ok) return false;

        const auto lg = leaf->getInteger("gas");
        const auto tg = top->getInteger("gas");
        ok &= require_(lg && *lg > 0, "leaf has a positive gas estimate");
        ok &= require_(tg && lg && *tg > *lg, "caller estimate covers the callee");
        return ok;
    }

    static bool test_trusted_and_proofs() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","pub":true,"payable":true,
            "attrs":["no_state","proof(\"solvency\")"],"body":[]}]})JSON";

        Compilation c{};
        compile_(json, c);

        const auto* fn = entry_(c, "f");
        bool ok = require_(fn != nullptr, "function is listed");
        if (fn == nullptr) return false;

        ok &= require_(*fn->getString("domain_source") == "trusted", "no_state is trusted");
        ok &= require_(fn->getBoolean("payable") && *fn->getBoolean("payable"), "payable flag");
        const auto* proofs = fn->getArray("proof_obligations");
        ok &= require_(proofs != nullptr && proofs->size() == 1 && (*proofs)[0].getAsString() &&
                       *(*proofs)[0].getAsString() == "solvency", "proof id is listed");
        return ok;
    }

    static bool test_rendered_manifest_parses_back() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","pub":true,"body":[
            {"do":{"has":"acct","key":{"bytes":"x"}}}
        ]}]})JSON";

        Compilation c{};
        compile_(json, c);

        const std::string text = vellum::backend::meta::manifest_to_string(c.manifest);
        auto parsed = llvm::json::parse(text);
        if (!parsed) {
            llvm::consumeError(parsed.takeError());
            return require_(false, "rendered manifest must be valid JSON");
        }
        return require_(*parsed == c.manifest, "rendered manifest reads back to the same value");
    }

    static bool test_caller_sets_do_not_depend_on_opt_level() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"pay","attrs":["writes(\"acct:alice\")"],"body":[
                {"do":{"put":"acct","key":{"bytes":"alice"},"value":{"int":1,"type":"u64"}}},
                {"do":{"put":"acct","key":{"bytes":"bob"},"value":{"int":2,"type":"u64"}}}
            ]},
            {"name":"log","attrs":["no_state"],"body":[
                {"do":{"put":"audit","key":{"bytes":"k"},"value":{"int":1,"type":"u64"}}}
            ]},
            {"name":"outer","pub":true,"body":[
                {"do":{"call":"pay","args":[]}},
                {"do":{"call":"log","args":[]}}
            ]}
        ]})JSON";

        bool ok = true;
        for (uint32_t level : {0u, 1u}) {
            vellumc::cli::Options opt{};
            opt.pass_opt.opt_level = level;
            Compilation c{};
            compile_(json, c, opt);

            const auto* outer = entry_(c, "outer");
            ok &= require_(outer != nullptr, "caller is listed");
            if (outer == nullptr) continue;
            ok &= require_(keys_(*outer, "writes") == std::vector<std::string>{"t.acct:alice"},
                           "caller sees the declared callee set at every level");
            ok &= require_(keys_(*outer, "reads").empty(), "caller reads nothing");
        }
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"declared_writes_survive_under_declaration", test_declared_writes_survive_under_declaration},
        {"document_shape", test_document_shape},
        {"excluded_functions_are_omitted", test_excluded_functions_are_omitted},
        {"unit_override_changes_keys", test_unit_override_changes_keys},
        {"rejected_dynamic_key_is_omitted", test_rejected_dynamic_key_is_omitted},
        {"gas_includes_callees", test_gas_includes_callees},
        {"trusted_and_proofs", test_trusted_and_proofs},
        {"rendered_manifest_parses_back", test_rendered_manifest_parses_back},
        {"caller_sets_do_not_depend_on_opt_level", test_caller_sets_do_not_depend_on_opt_level},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.fn();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL MANIFEST TESTS PASSED\n";
    return 0;
}
