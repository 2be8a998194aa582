#include <vellum/diag/Diagnostic.hpp>
#include <vellum/hir/Ownership.hpp>
#include <vellum/hir/Reader.hpp>
#include <vellum/text/SourceManager.hpp>
#include <vellum/ty/TypePool.hpp>

#include <iostream>
#include <string>

namespace {

    using vellum::diag::Code;

    struct Checked {
        vellum::SourceManager sm;
        vellum::diag::Bag bag;
        vellum::ty::TypePool types;
        vellum::hir::Module hir;
        vellum::hir::OwnershipResult own;
        bool read_ok = false;
    };

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static void check_(const std::string& json, Checked& out) {
        const auto rr = vellum::hir::read_module_json(json, "own.json", out.hir, out.types, out.sm, out.bag);
        out.read_ok = rr.ok;
        if (!rr.ok) return;
        out.own = vellum::hir::check_ownership(out.hir, out.types, out.bag);
    }

    static bool test_use_after_move_reported() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","body":[
            {"let":"a","init":{"bytes":"x"}},
            {"let":"b","init":"a"},
            {"let":"c","init":"a"}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.bag.has_code(Code::kOwnUseAfterMove), "second move of bytes binding must be reported");
        ok &= require_(c.own.fn_ok.size() == 1 && !c.own.fn_ok[0], "function must be marked failed");
        ok &= require_(c.own.error_count == 1, "analysis stops after the first violation in a function");
        return ok;
    }

    static bool test_copy_types_are_not_moved() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","ret":"u64","params":[["n","u64"]],"body":[
            {"let":"a","init":"n"},
            {"let":"b","init":"n"},
            {"return":{"bin":"+","l":"a","r":"b"}}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.own.ok, "integer bindings are copied, not moved");
        ok &= require_(!c.bag.has_error(), "no diagnostics expected");
        return ok;
    }

    static bool test_reassignment_revives_moved_binding() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","body":[
            {"var":"a","init":{"bytes":"x"}},
            {"let":"b","init":"a"},
            {"set":"a","value":{"bytes":"y"}},
            {"let":"c","init":"a"}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.own.ok, "assigning a fresh value makes the binding usable again");
        return ok;
    }

    static bool test_assign_to_immutable() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","body":[
            {"let":"x","init":1},
            {"set":"x","value":2}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.bag.has_code(Code::kOwnAssignToImmutable), "assignment to let binding must be reported");
        return ok;
    }

    static bool test_exclusive_borrow_rules() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[
            {"name":"touch","params":[["n","u64","mut"]],"body":[
                {"set":"n","value":{"bin":"+","l":"n","r":1}}
            ]},
            {"name":"both","params":[["a","bytes","ref"],["b","bytes","mut"]],"body":[]},
            {"name":"immutable_arg","body":[
                {"let":"x","init":{"int":1,"type":"u64"}},
                {"do":{"call":"touch","args":["x"]}}
            ]},
            {"name":"aliasing","body":[
                {"var":"v","init":{"bytes":"v"}},
                {"do":{"call":"both","args":["v","v"]}}
            ]},
            {"name":"fine","body":[
                {"var":"y","init":{"int":1,"type":"u64"}},
                {"do":{"call":"touch","args":["y"]}},
                {"do":{"call":"touch","args":["y"]}}
            ]}
        ]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.bag.has_code(Code::kOwnMutBorrowOfImmutable), "mut argument from let binding must be reported");
        ok &= require_(c.bag.has_code(Code::kOwnBorrowConflict), "shared + exclusive borrow in one call must conflict");
        ok &= require_(c.own.fn_ok.size() == 5, "one verdict per function");
        if (c.own.fn_ok.size() == 5) {
            ok &= require_(c.own.fn_ok[0] && c.own.fn_ok[1], "callees themselves are fine");
            ok &= require_(!c.own.fn_ok[2] && !c.own.fn_ok[3], "violating callers fail");
            ok &= require_(c.own.fn_ok[4], "sequential exclusive borrows end with each call");
        }
        return ok;
    }

    static bool test_move_out_of_borrowed_param() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","params":[["p","bytes","ref"]],"body":[
            {"let":"q","init":"p"}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.bag.has_code(Code::kOwnMoveOutOfBorrowed), "moving a ref parameter must be reported");
        return ok;
    }

    static bool test_move_on_one_branch_counts() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","params":[["c","bool"]],"body":[
            {"let":"a","init":{"bytes":"x"}},
            {"if":"c","then":[{"let":"b","init":"a"}]},
            {"let":"d","init":"a"}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.bag.has_code(Code::kOwnUseAfterMove), "move on either branch must be visible after the join");
        return ok;
    }

    static bool test_move_inside_loop() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","body":[
            {"let":"a","init":{"bytes":"x"}},
            {"var":"i","init":{"int":0,"type":"u64"}},
            {"while":{"bin":"<","l":"i","r":2},"body":[
                {"let":"b","init":"a"},
                {"set":"i","value":{"bin":"+","l":"i","r":1}}
            ]}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.bag.has_code(Code::kOwnUseAfterMove), "second iteration sees the move from the back edge");
        return ok;
    }

    static bool test_diverging_branch_does_not_poison_join() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","params":[["c","bool"]],"body":[
            {"let":"a","init":{"bytes":"x"}},
            {"if":"c","then":[{"let":"b","init":"a"},{"revert":"stop"}]},
            {"let":"d","init":"a"}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.own.ok, "a branch that reverts does not reach the join");
        return ok;
    }

    static bool test_drop_counts() {
        Checked c{};
        check_(R"JSON({"unit":"t","fns":[{"name":"f","body":[
            {"let":"a","init":{"bytes":"x"}},
            {"let":"b","init":{"bytes":"y"}},
            {"let":"c","init":"a"}
        ]}]})JSON", c);

        bool ok = true;
        ok &= require_(c.read_ok, "document must read");
        ok &= require_(c.own.ok, "no violation expected");
        ok &= require_(c.own.drops.size() == 1 && c.own.drops[0] == 2, "b and c are still owned at scope end");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"use_after_move_reported", test_use_after_move_reported},
        {"copy_types_are_not_moved", test_copy_types_are_not_moved},
        {"reassignment_revives_moved_binding", test_reassignment_revives_moved_binding},
        {"assign_to_immutable", test_assign_to_immutable},
        {"exclusive_borrow_rules", test_exclusive_borrow_rules},
        {"move_out_of_borrowed_param", test_move_out_of_borrowed_param},
        {"move_on_one_branch_counts", test_move_on_one_branch_counts},
        {"move_inside_loop", test_move_inside_loop},
        {"diverging_branch_does_not_poison_join", test_diverging_branch_does_not_poison_join},
        {"drop_counts", test_drop_counts},
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

    std::cout << "ALL OWNERSHIP TESTS PASSED\n";
    return 0;
}
