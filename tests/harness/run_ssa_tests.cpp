#include "support/Pipeline.hpp"
#include "support/SsaEval.hpp"

#include <vellum/ssa/Builder.hpp>
#include <vellum/ssa/Verify.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using vellum::harness::Exit;
    using vellum::harness::Frontend;
    using vellum::harness::RunResult;
    using vellum::harness::TestHost;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool build_(const std::string& json, Frontend& fe, bool optimize) {
        if (vellum::harness::build_frontend(json, fe, optimize)) return true;
        std::cerr << vellum::harness::render_diags(fe.bag, fe.sm);
        return false;
    }

    static RunResult run_(const Frontend& fe, const char* fn, const std::vector<uint64_t>& args) {
        TestHost host{};
        const auto fid = vellum::harness::find_fn(fe.ssa, fn);
        return vellum::harness::eval_function(fe.ssa, fe.types, fid, args, host, fe.ssa.unit_id);
    }

    static bool returned_(const RunResult& r, uint64_t v) {
        return r.exit == Exit::kReturned && r.has_value && r.value == v;
    }

    static size_t count_calls_(const vellum::ssa::Module& m, vellum::ssa::FuncId fid) {
        size_t n = 0;
        for (auto bb : m.funcs[fid].blocks) {
            for (auto iid : m.blocks[bb].insts) {
                if (std::holds_alternative<vellum::ssa::InstCall>(m.insts[iid].data)) ++n;
            }
        }
        return n;
    }

    const char* kLoopSum = R"JSON({"unit":"t","fns":[{"name":"sum","ret":"u64","params":[["n","u64"]],"body":[
        {"var":"i","init":{"int":0,"type":"u64"}},
        {"var":"acc","init":{"int":0,"type":"u64"}},
        {"while":{"bin":"<","l":"i","r":"n"},"body":[
            {"set":"acc","value":{"bin":"+","l":"acc","r":"i"}},
            {"set":"i","value":{"bin":"+","l":"i","r":1}}
        ]},
        {"return":"acc"}
    ]}]})JSON";

    static bool test_loop_builds_block_params() {
        Frontend fe{};
        bool ok = require_(build_(kLoopSum, fe, /*optimize=*/false), "loop program must build and verify");
        if (!ok) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "sum");
        ok &= require_(fid != vellum::ssa::kInvalidId, "function must exist");

        size_t params = 0;
        for (auto bb : fe.ssa.funcs[fid].blocks) {
            if (bb != fe.ssa.funcs[fid].entry) params += fe.ssa.blocks[bb].params.size();
        }
        ok &= require_(params >= 2, "loop header needs params for i and acc");
        ok &= require_(returned_(run_(fe, "sum", {5}), 10), "sum(5) == 0+1+2+3+4");
        ok &= require_(returned_(run_(fe, "sum", {0}), 0), "sum(0) == 0");
        return ok;
    }

    static bool test_join_params_only_for_divergent_bindings() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"i64","params":[["c","bool"]],"body":[
            {"var":"x","init":0},
            {"var":"y","init":5},
            {"if":"c","then":[{"set":"x","value":1}]},
            {"return":{"bin":"+","l":"x","r":"y"}}
        ]}]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, false), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        size_t params = 0;
        for (auto bb : fe.ssa.funcs[fid].blocks) {
            if (bb != fe.ssa.funcs[fid].entry) params += fe.ssa.blocks[bb].params.size();
        }

        bool ok = true;
        ok &= require_(params == 1, "only x differs between the two paths");
        ok &= require_(returned_(run_(fe, "f", {1}), 6), "f(true) == 6");
        ok &= require_(returned_(run_(fe, "f", {0}), 5), "f(false) == 5");
        return ok;
    }

    static bool test_loop_exit_params_only_for_live_bindings() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"u64","params":[["n","u64"]],"body":[
            {"var":"i","init":{"int":0,"type":"u64"}},
            {"var":"y","init":{"int":1,"type":"u64"}},
            {"while":{"bin":"<","l":"i","r":"n"},"body":[
                {"set":"y","value":{"bin":"+","l":"y","r":"i"}},
                {"if":{"bin":"==","l":"i","r":3},"then":[{"break":null}]},
                {"set":"i","value":{"bin":"+","l":"i","r":1}}
            ]},
            {"return":"i"}
        ]}]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, false), "program must build and verify")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        size_t params = 0;
        for (auto bb : fe.ssa.funcs[fid].blocks) {
            if (bb != fe.ssa.funcs[fid].entry) params += fe.ssa.blocks[bb].params.size();
        }

        bool ok = true;
        // header: i, y / exit: i
        ok &= require_(params == 3, "y is not carried out of the loop");
        ok &= require_(returned_(run_(fe, "f", {10}), 3), "break leaves with i == 3");
        ok &= require_(returned_(run_(fe, "f", {2}), 2), "condition exit leaves with i == n");
        return ok;
    }

    static bool test_const_fold_arithmetic() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"i64","body":[
            {"return":{"bin":"+","l":2,"r":{"bin":"*","l":3,"r":4}}}
        ]}]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, /*optimize=*/true), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        const auto& f = fe.ssa.funcs[fid];
        bool ok = true;
        ok &= require_(fe.ssa.opt_stats.consts_folded >= 2, "both operations fold");
        ok &= require_(f.blocks.size() == 1, "straight-line function stays a single block");

        const auto& b = fe.ssa.blocks[f.entry];
        const auto* ret = std::get_if<vellum::ssa::TermRet>(&b.term);
        ok &= require_(ret != nullptr && ret->has_value, "entry must return a value");
        if (ret != nullptr && ret->has_value) {
            const auto& def = fe.ssa.insts[fe.ssa.values[ret->value].def_a];
            const auto* ci = std::get_if<vellum::ssa::InstConstInt>(&def.data);
            ok &= require_(ci != nullptr && ci->bits == 14, "returned value must be the constant 14");
        }
        return ok;
    }

    static bool test_constant_branch_is_folded() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"i64","body":[
            {"if":true,"then":[{"return":1}],"else":[{"return":2}]}
        ]}]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, true), "program must build")) return false;

        bool ok = true;
        ok &= require_(fe.ssa.opt_stats.condbr_folded >= 1, "constant condition folds to a jump");
        ok &= require_(fe.ssa.opt_stats.blocks_removed >= 1, "the dead arm is removed");
        ok &= require_(returned_(run_(fe, "f", {}), 1), "f() == 1");
        return ok;
    }

    static bool test_small_callee_is_inlined() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"add1","ret":"i64","params":[["x","i64"]],"body":[{"return":{"bin":"+","l":"x","r":1}}]},
            {"name":"f","ret":"i64","params":[["a","i64"]],"body":[{"return":{"call":"add1","args":["a"]}}]}
        ]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, true), "program must build")) return false;

        const auto fid = vellum::harness::find_fn(fe.ssa, "f");
        bool ok = true;
        ok &= require_(fe.ssa.opt_stats.calls_inlined >= 1, "single-block callee is inlined");
        ok &= require_(count_calls_(fe.ssa, fid) == 0, "no call left in caller");
        ok &= require_(returned_(run_(fe, "f", {41}), 42), "f(41) == 42");
        return ok;
    }

    static bool test_overflow_is_not_folded_away() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"i64","body":[
            {"return":{"bin":"+","l":{"int":9223372036854775807,"type":"i64"},"r":1}}
        ]}]})JSON";

        bool ok = true;
        for (int opt = 0; opt < 2; ++opt) {
            Frontend fe{};
            if (!require_(build_(json, fe, opt == 1), "program must build")) return false;
            const auto r = run_(fe, "f", {});
            ok &= require_(r.exit == Exit::kPanicked, "MAX + 1 must abort before and after optimization");
            ok &= require_(r.message == "arithmetic overflow", "abort message names the overflow");
        }
        return ok;
    }

    static bool test_dead_pure_code_removed() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"i64","params":[["a","i64"]],"body":[
            {"let":"unused","init":{"bin":"&","l":"a","r":3}},
            {"return":"a"}
        ]}]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, true), "program must build")) return false;

        bool ok = true;
        ok &= require_(fe.ssa.opt_stats.insts_removed >= 1, "unused pure instruction is removed");
        ok &= require_(returned_(run_(fe, "f", {7}), 7), "f(7) == 7");
        return ok;
    }

    static bool test_checked_division_yields_error_code() {
        const std::string json = R"JSON({"unit":"t","fns":[{"name":"f","ret":"i32","params":[["a","i64"],["b","i64"]],"body":[
            {"let":"q","init":{"bin":"/","l":"a","r":"b","mode":"checked"}},
            {"return":{"code":"q"}}
        ]}]})JSON";

        Frontend fe{};
        if (!require_(build_(json, fe, true), "program must build")) return false;

        bool ok = true;
        ok &= require_(returned_(run_(fe, "f", {10, 0}), static_cast<uint64_t>(int64_t{-16})),
                       "division by zero in checked mode is err(-16)");
        ok &= require_(returned_(run_(fe, "f", {10, 2}), 0), "successful checked division is ok");
        return ok;
    }

    static bool test_mut_parameter_round_trips() {
        const std::string json = R"JSON({"unit":"t","fns":[
            {"name":"bump","params":[["n","i64","mut"]],"body":[{"set":"n","value":{"bin":"+","l":"n","r":1}}]},
            {"name":"f","ret":"i64","body":[
                {"var":"x","init":1},
                {"do":{"call":"bump","args":["x"]}},
                {"do":{"call":"bump","args":["x"]}},
                {"return":"x"}
            ]}
        ]})JSON";

        bool ok = true;
        for (int opt = 0; opt < 2; ++opt) {
            Frontend fe{};
            if (!require_(build_(json, fe, opt == 1), "program must build")) return false;
            ok &= require_(returned_(run_(fe, "f", {}), 3), "two bumps through a mut parameter");
        }
        return ok;
    }

    static bool test_verifier_rejects_missing_terminator() {
        vellum::ty::TypePool types{};
        vellum::ssa::Module m{};

        vellum::ssa::Block b{};
        const auto bb = m.add_block(b);

        vellum::ssa::Function f{};
        f.name = "bad";
        f.ret_ty = types.builtin(vellum::ty::Builtin::kI64);
        f.blocks.push_back(bb);
        f.entry = bb;
        m.add_func(f);

        const auto errs = vellum::ssa::verify(m);
        return require_(!errs.empty(), "block without terminator must be rejected");
    }

    static bool test_verifier_rejects_edge_arity_mismatch() {
        Frontend fe{};
        if (!require_(build_(kLoopSum, fe, false), "program must build")) return false;

        bool mutated = false;
        for (auto& b : fe.ssa.blocks) {
            if (auto* br = std::get_if<vellum::ssa::TermBr>(&b.term); br != nullptr && !br->args.empty()) {
                br->args.push_back(br->args.front());
                mutated = true;
                break;
            }
        }

        bool ok = require_(mutated, "loop program must contain a branch with arguments");
        ok &= require_(!vellum::ssa::verify(fe.ssa).empty(), "extra edge argument must be rejected");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"loop_builds_block_params", test_loop_builds_block_params},
        {"join_params_only_for_divergent_bindings", test_join_params_only_for_divergent_bindings},
        {"loop_exit_params_only_for_live_bindings", test_loop_exit_params_only_for_live_bindings},
        {"const_fold_arithmetic", test_const_fold_arithmetic},
        {"constant_branch_is_folded", test_constant_branch_is_folded},
        {"small_callee_is_inlined", test_small_callee_is_inlined},
        {"overflow_is_not_folded_away", test_overflow_is_not_folded_away},
        {"dead_pure_code_removed", test_dead_pure_code_removed},
        {"checked_division_yields_error_code", test_checked_division_yields_error_code},
        {"mut_parameter_round_trips", test_mut_parameter_round_trips},
        {"verifier_rejects_missing_terminator", test_verifier_rejects_missing_terminator},
        {"verifier_rejects_edge_arity_mismatch", test_verifier_rejects_edge_arity_mismatch},
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

    std::cout << "ALL SSA TESTS PASSED\n";
    return 0;
}
