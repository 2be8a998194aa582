// compiler/vellumc/src/driver/Driver.cpp
#include <vellumc/driver/Driver.hpp>

#include <vellumc/dump/Dump.hpp>

#include <vellum/backend/meta/Manifest.hpp>
#include <vellum/backend/vm/Bytecode.hpp>
#include <vellum/backend/vm/VmBackend.hpp>
#include <vellum/diag/Render.hpp>
#include <vellum/hir/Reader.hpp>
#include <vellum/ssa/Builder.hpp>
#include <vellum/ssa/Passes.hpp>
#include <vellum/ssa/Verify.hpp>

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/raw_ostream.h>

#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace vellumc::driver {

    namespace {

        using vellum::diag::Code;
        using vellum::diag::Diagnostic;
        using vellum::diag::Severity;

        /// @brief 검증 오류를 내부 fatal 진단으로 옮긴다.
        bool report_verify_(
            const std::vector<vellum::ssa::VerifyError>& errs,
            std::string_view stage,
            vellum::diag::Bag& bag
        ) {
            for (const auto& e : errs) {
                Diagnostic d(Severity::kFatal, Code::kSsaVerifyFailed, vellum::Span{});
                d.add_arg(stage);
                d.add_arg(e.msg);
                bag.add(std::move(d));
            }
            return errs.empty();
        }

        /// @brief 분석 단계에서 실패한 함수를 SSA에서 제외한다.
        void exclude_failed_(
            vellum::ssa::Module& m,
            const std::vector<bool>& fn_ok,
            vellum::diag::Bag& bag,
            std::string_view reason
        ) {
            for (vellum::ssa::FuncId fid = 0; fid < m.funcs.size(); ++fid) {
                auto& f = m.funcs[fid];
                if (f.excluded) continue;
                if (fid < fn_ok.size() && fn_ok[fid]) continue;

                f.excluded = true;
                Diagnostic d(Severity::kNote, Code::kFnExcluded, f.span);
                d.add_arg(f.name);
                d.add_arg(reason);
                bag.add(std::move(d));
            }
        }

        /// @brief 진단을 선택한 포맷으로 출력한다. 오류가 있으면 1.
        int flush_diags_(const Compilation& c, const cli::Options& opt) {
            if (c.bag.diags().empty()) return 0;

            if (opt.diag_format == cli::DiagFormat::kJson) {
                std::cerr << vellum::diag::render_json(c.bag, opt.lang, c.sm) << "\n";
                return c.bag.has_error() ? 1 : 0;
            }

            uint32_t errors = 0;
            for (const auto& d : c.bag.diags()) {
                const bool is_error = d.severity() == Severity::kError || d.severity() == Severity::kFatal;
                if (is_error && errors >= opt.max_errors) {
                    Diagnostic cap(Severity::kError, Code::kTooManyErrors, vellum::Span{});
                    std::cerr << vellum::diag::render_one(cap, opt.lang, c.sm) << "\n";
                    break;
                }
                if (is_error) ++errors;
                std::cerr << vellum::diag::render_one(d, opt.lang, c.sm) << "\n";
            }
            return c.bag.has_error() ? 1 : 0;
        }

        bool write_file_(const std::string& path, std::string_view bytes, std::string& err) {
            std::error_code ec;
            llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_None);
            if (ec) {
                err = ec.message();
                return false;
            }
            os << bytes;
            os.close();
            if (os.has_error()) {
                err = os.error().message();
                os.clear_error();
                return false;
            }
            return true;
        }

    } // namespace

    uint32_t exclude_callers(vellum::ssa::Module& m, vellum::diag::Bag& bag, std::string_view reason) {
        uint32_t excluded = 0;
        bool changed = true;
        while (changed) {
            changed = false;
            for (auto& f : m.funcs) {
                if (f.excluded) continue;

                vellum::ssa::FuncId bad = vellum::ssa::kInvalidId;
                for (auto bb : f.blocks) {
                    for (auto iid : m.blocks[bb].insts) {
                        const auto* call = std::get_if<vellum::ssa::InstCall>(&m.insts[iid].data);
                        if (call == nullptr || call->callee >= m.funcs.size()) continue;
                        if (m.funcs[call->callee].excluded) {
                            bad = call->callee;
                            break;
                        }
                    }
                    if (bad != vellum::ssa::kInvalidId) break;
                }
                if (bad == vellum::ssa::kInvalidId) continue;

                f.excluded = true;
                Diagnostic d(Severity::kNote, Code::kFnExcluded, f.span);
                d.add_arg(f.name);
                d.add_arg(std::string(reason) + " '" + m.funcs[bad].name + "'");
                bag.add(std::move(d));
                ++excluded;
                changed = true;
            }
        }
        return excluded;
    }

    void compile_document(
        std::string_view json_text,
        std::string_view doc_name,
        const cli::Options& opt,
        Compilation& out
    ) {
        out.ok = false;

        // 1) HIR
        const auto rr = vellum::hir::read_module_json(json_text, doc_name, out.hir, out.types, out.sm, out.bag);
        if (!rr.ok) return;
        out.unit = opt.unit_id.empty() ? out.hir.unit_id : opt.unit_id;

        // 2) ownership: 위반한 함수만 SSA 구성에서 뺀다.
        out.ownership = vellum::hir::check_ownership(out.hir, out.types, out.bag, opt.ownership);

        // 3) SSA
        vellum::ssa::BuildOptions bopt{};
        bopt.skip.resize(out.hir.funcs.size(), false);
        for (size_t i = 0; i < out.hir.funcs.size(); ++i) {
            bopt.skip[i] = i < out.ownership.fn_ok.size() && !out.ownership.fn_ok[i];
        }
        const auto br = vellum::ssa::build_module(out.hir, out.types, out.ssa, bopt);
        out.ssa.unit_id = out.unit;
        exclude_callers(out.ssa, out.bag, "calls excluded function");

        if (!report_verify_(vellum::ssa::verify(out.ssa), "ssa-build", out.bag) || !br.ok) return;

        // 4) 최적화 후에는 도달 불가 블록이 없어야 한다.
        vellum::ssa::run_passes(out.ssa, out.types, opt.pass_opt);
        vellum::ssa::VerifyOptions vopt{};
        vopt.require_reachable = true;
        if (!report_verify_(vellum::ssa::verify(out.ssa, vopt), "ssa-opt", out.bag)) return;

        // 5) 도메인
        vellum::domain::Options dopt = opt.domain;
        if (dopt.unit_id.empty()) dopt.unit_id = out.unit;
        out.domains = vellum::domain::analyze(out.ssa, out.types, out.bag, dopt);
        exclude_failed_(out.ssa, out.domains.fn_ok, out.bag, "conflict domain analysis failed");
        exclude_callers(out.ssa, out.bag, "calls excluded function");

        // 6) backend
        vellum::backend::CompileOptions copt = opt.backend;
        if (copt.unit_id.empty()) copt.unit_id = out.unit;
        vellum::backend::vm::VmBackend backend{};
        out.compiled = backend.compile(out.ssa, out.types, out.bag, copt);
        out.reached_backend = true;

        // 7) manifest
        out.manifest = vellum::backend::meta::build_manifest(out.ssa, out.domains, out.compiled, out.unit);

        out.ok = !out.bag.has_error();
    }

    int run(const cli::Options& opt) {
        if (opt.inputs.empty()) {
            std::cerr << "error: no input file\n";
            return 1;
        }
        const auto& input = opt.inputs.front();

        auto buf = llvm::MemoryBuffer::getFile(input, /*IsText=*/true);
        if (!buf) {
            std::cerr << "error: cannot open '" << input << "': " << buf.getError().message() << "\n";
            return 1;
        }

        Compilation c{};
        compile_document((*buf)->getBuffer(), input, opt, c);

        if (opt.internal.hir_dump && !c.hir.funcs.empty()) dump::dump_hir_module(c.hir, c.types, std::cout);
        if (opt.internal.ssa_dump && !c.ssa.funcs.empty()) dump::dump_ssa_module(c.ssa, c.types, std::cout);
        if (opt.internal.domain_dump && c.reached_backend) dump::dump_domains(c.ssa, c.domains, std::cout);
        if (opt.internal.bytecode_dump && c.reached_backend) dump::dump_bytecode(c.compiled, std::cout);

        int rc = flush_diags_(c, opt);
        if (!c.reached_backend) return 1;

        std::string err;
        if (!opt.bytecode_path.empty()) {
            const auto bytes = vellum::backend::vm::serialize(c.compiled.module);
            if (!write_file_(opt.bytecode_path, bytes, err)) {
                std::cerr << "error: cannot write '" << opt.bytecode_path << "': " << err << "\n";
                rc = 1;
            }
        }
        if (!opt.manifest_path.empty()) {
            if (!vellum::backend::meta::write_manifest(c.manifest, opt.manifest_path, err)) {
                std::cerr << "error: cannot write '" << opt.manifest_path << "': " << err << "\n";
                rc = 1;
            }
        }

        if (rc == 0) {
            uint32_t lowered = 0;
            for (bool ok : c.compiled.fn_ok) lowered += ok ? 1u : 0u;
            std::cout << "vellumc: " << c.unit << ": " << lowered << " function(s), "
                      << c.compiled.module.imports.size() << " import(s), "
                      << c.bag.warning_count() << " warning(s)\n";
        }
        return rc;
    }

} // namespace vellumc::driver
