// tests/harness/support/Pipeline.cpp
#include "Pipeline.hpp"

#include <vellum/diag/Render.hpp>
#include <vellum/hir/Reader.hpp>
#include <vellum/ssa/Builder.hpp>
#include <vellum/ssa/Verify.hpp>


namespace vellum::harness {

    bool build_frontend(std::string_view json_text, Frontend& out, bool optimize, const ssa::PassOptions& popt) {
        out.ok = false;

        const auto rr = hir::read_module_json(json_text, "test.json", out.hir, out.types, out.sm, out.bag);
        out.read_ok = rr.ok;
        if (!rr.ok) return false;

        out.ownership = hir::check_ownership(out.hir, out.types, out.bag);

        ssa::BuildOptions bopt{};
        bopt.skip.resize(out.hir.funcs.size(), false);
        for (size_t i = 0; i < out.hir.funcs.size() && i < out.ownership.fn_ok.size(); ++i) {
            bopt.skip[i] = !out.ownership.fn_ok[i];
        }
        const auto br = ssa::build_module(out.hir, out.types, out.ssa, bopt);
        out.ssa.unit_id = out.hir.unit_id;
        if (!br.ok || !ssa::verify(out.ssa).empty()) return false;

        if (optimize) {
            ssa::run_passes(out.ssa, out.types, popt);
            ssa::VerifyOptions vopt{};
            vopt.require_reachable = true;
            if (!ssa::verify(out.ssa, vopt).empty()) return false;
        }

        out.ok = !out.bag.has_error();
        return out.ok;
    }

    ssa::FuncId find_fn(const ssa::Module& m, std::string_view name) {
        for (ssa::FuncId i = 0; i < m.funcs.size(); ++i) {
            if (m.funcs[i].name == name) return i;
        }
        return ssa::kInvalidId;
    }

    std::string render_diags(const diag::Bag& bag, const SourceManager& sm) {
        std::string s;
        for (const auto& d : bag.diags()) {
            s += "    ";
            s += diag::render_one(d, diag::Language::kEn, sm);
            s += "\n";
        }
        return s;
    }

} // namespace vellum::harness
