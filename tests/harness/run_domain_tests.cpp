#include "support/Pipeline.hpp"

#include <vellum/domain/Analyzer.hpp>
#include <vellum/domain/DomainKey.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using vellum::diag::Code;
    using vellum::domain::AccessSet;
    using vellum::domain::AnalysisResult;
    using vellum::domain::DomainSource;
    using vellum::harness::Frontend;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool analyze_(const std::string& json, Frontend& fe, AnalysisResult& out,
                         bool optimize = true,
                         const vellum::domain::Options& opt = {}) {
        if (!vellum::harness::build_frontend(json, fe, optimize)) {
            std::cerr << vellum::harness::render_diags(fe.bag, fe.sm);
            return false;
        }
        out = vellum::domain::analyze(fe.ssa, fe.types, fe.bag, opt);
        return true;
    }

    static bool contains_(const AnalysisResult& r, const std::vector<uint32_t>& set, const char* canonical) {
        const uint32_t id = r.keys.find(canonical);
        if (id == vellum::domain::kInvalidKey) return false;
        return std::find(set.begin(), set.end(), id) != set.end();
    }

    static bool includes_(const std::vector<uint32_t>& outer, const std::vector<uint32_t>& inner) {
        return std::includes(outer.begin(), outer.end(), inner.begin(), inner.end());
    }

    static AccessSet set_(std::vector<const char*> reads, std::vector<const char*> writes) {
        AccessSet s{};
        for (const char* k : reads) s.reads.push_back(vellum::domain::entry_of(vellum::domain::make_key("u", "acct", k)));
        for (const char* k : writes) s.writes.push_back(vellum::domain::entry_of(vellum::domain::make_key("u", "acct", k)));
        return s;
    }

    static bool test_under_declared_write_warns_and_keeps_declaration() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"pay","pub":true,
            "attrs":["#[writes(\"acct:alice\")]"],
            "body":[
                {"do":{"put":"acct","key":{"bytes":"alice"},"value":{"int":1,"type":"u64"}}},
                {"do":{"put":"acct","key":{"bytes":"bob"},"value":{"int":2,"type":"u64"}}}
            ]}]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "pay");
        const auto& fd = r.fns[fid];

        bool ok = true;
        ok &= require_(fe.bag.count_code(Code::kDomainUnderDeclared) == 1, "exactly one under-declared warning (bob)");
        ok &= require_(!fe.bag.has_error(), "under-declaration is a warning, not an error");
        ok &= require_(r.fn_ok[fid], "function stays compilable");
        ok &= require_(fd.source == DomainSource::kDeclared, "declared set is authoritative");
        ok &= require_(fd.writes.size() == 1 && contains_(r, fd.writes, "t.acct:alice"), "writes keep only the declared key");
        ok &= require_(contains_(r, fd.computed_writes, "t.acct:bob"), "computed writes still record bob");
        return ok;
    }

    static bool test_over_declared_key_is_noted() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"peek",
            "attrs":["reads(\"acct:alice\", \"acct:carol\")"],
            "body":[{"do":{"get":"acct","key":{"bytes":"alice"},"type":"u64"}}]}]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r), "program must build")) return false;

        bool ok = true;
        ok &= require_(fe.bag.count_code(Code::kDomainOverDeclared) == 1, "carol is declared but never read");
        ok &= require_(!fe.bag.has_code(Code::kDomainUnderDeclared), "alice is covered");
        return ok;
    }

    static bool test_read_read_does_not_conflict() {
        const AccessSet a = set_({"x"}, {});
        const AccessSet b = set_({"x"}, {});
        const AccessSet c = set_({}, {"x"});
        const AccessSet d = set_({}, {"y"});

        bool ok = true;
        ok &= require_(!vellum::domain::conflicts(a, b), "reads/reads on x do not conflict");
        ok &= require_(vellum::domain::conflicts(a, c), "reads/writes on x conflict");
        ok &= require_(vellum::domain::conflicts(c, c), "writes/writes on x conflict");
        ok &= require_(!vellum::domain::conflicts(c, d), "writes on different keys do not conflict");
        return ok;
    }

    static bool test_wildcard_overlaps_namespace_only() {
        AccessSet wild{};
        wild.writes.push_back(vellum::domain::entry_of(vellum::domain::make_wildcard("u", "acct")));

        AccessSet other_ns{};
        other_ns.reads.push_back(vellum::domain::entry_of(vellum::domain::make_key("u", "meta", "x")));

        AccessSet other_unit{};
        other_unit.reads.push_back(vellum::domain::entry_of(vellum::domain::make_key("v", "acct", "x")));

        bool ok = true;
        ok &= require_(vellum::domain::conflicts(wild, set_({"x"}, {})), "namespace wildcard covers its keys");
        ok &= require_(vellum::domain::conflicts(set_({"x"}, {}), wild), "coverage is symmetric");
        ok &= require_(!vellum::domain::conflicts(wild, other_ns), "other namespace is untouched");
        ok &= require_(!vellum::domain::conflicts(wild, other_unit), "other unit is untouched");
        return ok;
    }

    static bool test_hash_is_deterministic() {
        const auto k1 = vellum::domain::make_key("t", "acct", "alice");
        const auto k2 = vellum::domain::make_key("t", "acct", "alice");
        const auto k3 = vellum::domain::make_key("t2", "acct", "alice");

        bool ok = true;
        ok &= require_(k1.canonical == "t.acct:alice", "canonical form is <unit>.<ns>:<key>");
        ok &= require_(k1.hash == k2.hash, "same canonical key hashes identically");
        ok &= require_(k1.hash == vellum::domain::hash_canonical(k1.canonical), "hash is over the canonical text");
        ok &= require_(k1.hash != k3.hash, "unit id is part of the key");
        ok &= require_(vellum::domain::hash_hex(k1.hash).size() == 64, "hex rendering is 64 characters");
        ok &= require_(vellum::domain::hash_hex(k1.hash) == vellum::domain::hash_hex(k2.hash), "hex rendering is stable");

        const auto w = vellum::domain::make_wildcard("t", "acct");
        ok &= require_(w.canonical == "t.acct:*", "wildcard canonical form");
        ok &= require_(k1.scope == w.hash, "key scope is its namespace wildcard");
        return ok;
    }

    static bool test_conflict_is_symmetric() {
        const std::vector<AccessSet> sets = {
            set_({}, {}),
            set_({"x"}, {}),
            set_({}, {"x"}),
            set_({"x", "y"}, {"z"}),
            set_({"z"}, {"y"}),
        };

        bool ok = true;
        for (size_t i = 0; i < sets.size(); ++i) {
            for (size_t j = 0; j < sets.size(); ++j) {
                ok &= require_(vellum::domain::conflicts(sets[i], sets[j]) == vellum::domain::conflicts(sets[j], sets[i]),
                               "conflicts(a, b) == conflicts(b, a)");
            }
        }
        ok &= require_(!vellum::domain::conflicts(sets[0], sets[3]), "empty set conflicts with nothing");
        return ok;
    }

    static bool test_callers_include_callee_sets() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"leaf","body":[{"do":{"put":"acct","key":{"bytes":"x"},"value":{"int":1,"type":"u64"}}}]},
            {"name":"mid","body":[
                {"do":{"get":"acct","key":{"bytes":"y"},"type":"u64"}},
                {"do":{"call":"leaf","args":[]}}
            ]},
            {"name":"top","pub":true,"body":[
                {"do":{"has":"meta","key":7}},
                {"do":{"call":"mid","args":[]}}
            ]}
        ]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r, /*optimize=*/false), "program must build")) return false;

        bool ok = true;
        for (vellum::ssa::FuncId f = 0; f < r.fns.size(); ++f) {
            for (auto c : r.graph.callees[f]) {
                ok &= require_(includes_(r.fns[f].reads, r.fns[c].reads), "caller reads include callee reads");
                ok &= require_(includes_(r.fns[f].writes, r.fns[c].writes), "caller writes include callee writes");
            }
        }

        const auto top = vellum::harness::find_fn(fe.ssa, "top");
        ok &= require_(contains_(r, r.fns[top].writes, "t.acct:x"), "leaf write reaches top");
        ok &= require_(contains_(r, r.fns[top].reads, "t.acct:y"), "mid read reaches top");
        ok &= require_(contains_(r, r.fns[top].reads, "t.meta:7"), "integer keys render in decimal");
        ok &= require_(r.fns[top].local_writes.empty(), "top itself writes nothing");
        return ok;
    }

    static bool test_dynamic_key_coarsens_by_default() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","params":[["who","bytes"]],"body":[
            {"do":{"put":"acct","key":"who","value":{"int":1,"type":"u64"}}}
        ]}]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        bool ok = true;
        ok &= require_(fe.bag.has_code(Code::kDomainWildcardFallback), "fallback is noted");
        ok &= require_(!fe.bag.has_error(), "fallback is not an error");
        ok &= require_(r.fn_ok[fid], "function is kept");
        ok &= require_(contains_(r, r.fns[fid].writes, "t.acct:*"), "write set holds the namespace wildcard");
        ok &= require_(r.stats.wildcard_fallbacks == 1, "one fallback counted");
        return ok;
    }

    static bool test_dynamic_key_rejected_on_request() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","params":[["who","bytes"]],"body":[
            {"do":{"put":"acct","key":"who","value":{"int":1,"type":"u64"}}}
        ]}]})JSON";

        vellum::domain::Options opt{};
        opt.wildcard_policy = vellum::domain::WildcardPolicy::kReject;

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r, true, opt), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        bool ok = true;
        ok &= require_(fe.bag.has_code(Code::kDomainDynamicKeyRejected), "dynamic key is an error");
        ok &= require_(!r.fn_ok[fid] && r.fns[fid].rejected, "function is rejected");
        ok &= require_(!r.ok, "analysis reports failure");
        return ok;
    }

    static bool test_selected_keys_are_enumerated() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","params":[["c","bool"]],"body":[
            {"let":"k","init":{"select":"c","then":{"bytes":"a"},"else":{"bytes":"b"}}},
            {"do":{"get":"acct","key":"k","type":"u64"}}
        ]}]})JSON";

        bool ok = true;
        {
            Frontend fe{};
            AnalysisResult r{};
            if (!require_(analyze_(json, fe, r), "program must build")) return false;
            const auto fid = vellum::harness::find_fn(fe.ssa, "f");
            const auto& reads = r.fns[fid].reads;
            ok &= require_(reads.size() == 2, "both candidates are listed");
            ok &= require_(contains_(r, reads, "t.acct:a") && contains_(r, reads, "t.acct:b"), "candidates a and b");
            ok &= require_(!fe.bag.has_code(Code::kDomainWildcardFallback), "no fallback for two candidates");
        }
        {
            vellum::domain::Options opt{};
            opt.max_enumerated_keys = 1;
            Frontend fe{};
            AnalysisResult r{};
            if (!require_(analyze_(json, fe, r, true, opt), "program must build")) return false;
            const auto fid = vellum::harness::find_fn(fe.ssa, "f");
            ok &= require_(contains_(r, r.fns[fid].reads, "t.acct:*"), "too many candidates widen to wildcard");
        }
        return ok;
    }

    static bool test_no_state_is_trusted_and_proofs_recorded() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f",
            "attrs":["no_state","proof(\"inv-1\")"],
            "body":[{"do":{"put":"acct","key":{"bytes":"x"},"value":{"int":1,"type":"u64"}}}]}]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        const auto& fd = r.fns[fid];
        bool ok = true;
        ok &= require_(fd.source == DomainSource::kTrusted, "no_state is trusted");
        ok &= require_(fd.reads.empty() && fd.writes.empty(), "trusted function has empty sets");
        ok &= require_(fd.proofs.size() == 1 && fd.proofs[0] == "inv-1", "proof id is recorded");
        ok &= require_(!fe.bag.has_code(Code::kDomainUnderDeclared), "trusted function is not reconciled");
        return ok;
    }

    static bool test_malformed_annotation_fails_function() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f",
            "attrs":["no_state","writes(\"acct:x\")"],"body":[]}]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r), "program must build")) return false;

        bool ok = true;
        ok &= require_(fe.bag.has_code(Code::kAttrMalformed), "no_state with writes is malformed");
        ok &= require_(!r.fn_ok[0], "function fails");
        return ok;
    }

    static bool test_recursive_scc_reaches_fixpoint() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"even","ret":"bool","params":[["n","u64"]],"body":[
                {"do":{"put":"acct","key":{"bytes":"e"},"value":"n"}},
                {"if":{"bin":"==","l":"n","r":0},"then":[{"return":true}]},
                {"return":{"call":"odd","args":[{"bin":"-","l":"n","r":1}]}}
            ]},
            {"name":"odd","ret":"bool","params":[["n","u64"]],"body":[
                {"do":{"get":"acct","key":{"bytes":"o"},"type":"u64"}},
                {"if":{"bin":"==","l":"n","r":0},"then":[{"return":false}]},
                {"return":{"call":"even","args":[{"bin":"-","l":"n","r":1}]}}
            ]}
        ]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r), "program must build")) return false;

        const auto e = vellum::harness::find_fn(fe.ssa, "even");
        const auto o = vellum::harness::find_fn(fe.ssa, "odd");

        bool ok = true;
        ok &= require_(r.stats.cyclic_sccs == 1, "even/odd form one cycle");
        ok &= require_(r.stats.fixpoint_passes > r.stats.scc_count, "cycle needs more than one pass");
        ok &= require_(r.fns[e].reads == r.fns[o].reads, "reads agree across the cycle");
        ok &= require_(r.fns[e].writes == r.fns[o].writes, "writes agree across the cycle");
        ok &= require_(contains_(r, r.fns[o].writes, "t.acct:e"), "odd inherits even's write");
        ok &= require_(contains_(r, r.fns[e].reads, "t.acct:o"), "even inherits odd's read");
        return ok;
    }

    static bool test_inliner_keeps_override_boundaries() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"pay","attrs":["writes(\"acct:alice\")"],"body":[
                {"do":{"put":"acct","key":{"bytes":"alice"},"value":{"int":1,"type":"u64"}}},
                {"do":{"put":"acct","key":{"bytes":"bob"},"value":{"int":2,"type":"u64"}}}
            ]},
            {"name":"log","attrs":["no_state"],"body":[
                {"do":{"put":"audit","key":{"bytes":"k"},"value":{"int":1,"type":"u64"}}}
            ]},
            {"name":"bump","body":[
                {"do":{"put":"acct","key":{"bytes":"carol"},"value":{"int":3,"type":"u64"}}}
            ]},
            {"name":"outer","pub":true,"body":[
                {"do":{"call":"pay","args":[]}},
                {"do":{"call":"log","args":[]}},
                {"do":{"call":"bump","args":[]}}
            ]}
        ]})JSON";

        Frontend fe{};
        AnalysisResult r{};
        if (!require_(analyze_(json, fe, r, /*optimize=*/true), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "outer");
        const auto& fd = r.fns[fid];

        bool ok = true;
        ok &= require_(fe.ssa.opt_stats.calls_inlined == 1, "only the plain callee is inlined");
        ok &= require_(contains_(r, fd.writes, "t.acct:alice"), "declared callee write reaches the caller");
        ok &= require_(!contains_(r, fd.writes, "t.acct:bob"), "undeclared callee write stays hidden");
        ok &= require_(!contains_(r, fd.writes, "t.audit:k"), "trusted callee contributes nothing");
        ok &= require_(contains_(r, fd.writes, "t.acct:carol"), "inlined callee write is still inferred");
        ok &= require_(fd.writes.size() == 2, "caller writes alice and carol only");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"under_declared_write_warns_and_keeps_declaration", test_under_declared_write_warns_and_keeps_declaration},
        {"over_declared_key_is_noted", test_over_declared_key_is_noted},
        {"read_read_does_not_conflict", test_read_read_does_not_conflict},
        {"wildcard_overlaps_namespace_only", test_wildcard_overlaps_namespace_only},
        {"hash_is_deterministic", test_hash_is_deterministic},
        {"conflict_is_symmetric", test_conflict_is_symmetric},
        {"callers_include_callee_sets", test_callers_include_callee_sets},
        {"dynamic_key_coarsens_by_default", test_dynamic_key_coarsens_by_default},
        {"dynamic_key_rejected_on_request", test_dynamic_key_rejected_on_request},
        {"selected_keys_are_enumerated", test_selected_keys_are_enumerated},
        {"no_state_is_trusted_and_proofs_recorded", test_no_state_is_trusted_and_proofs_recorded},
        {"malformed_annotation_fails_function", test_malformed_annotation_fails_function},
        {"recursive_scc_reaches_fixpoint", test_recursive_scc_reaches_fixpoint},
        {"inliner_keeps_override_boundaries", test_inliner_keeps_override_boundaries},
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

    std::cout << "ALL DOMAIN TESTS PASSED\n";
    return 0;
}
