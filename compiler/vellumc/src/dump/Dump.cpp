// compiler/vellumc/src/dump/Dump.cpp
#include <vellumc/dump/Dump.hpp>

#include <vellum/backend/vm/Bytecode.hpp>
#include <vellum/ssa/Dump.hpp>

#include <string>

namespace vellumc::dump {

    using namespace vellum;

    namespace {

        const char* stmt_kind_name_(hir::StmtKind k) {
            switch (k) {
                case hir::StmtKind::kExpr: return "expr";
                case hir::StmtKind::kLet: return "let";
                case hir::StmtKind::kAssign: return "set";
                case hir::StmtKind::kIf: return "if";
                case hir::StmtKind::kWhile: return "while";
                case hir::StmtKind::kReturn: return "return";
                case hir::StmtKind::kBreak: return "break";
                case hir::StmtKind::kContinue: return "continue";
                case hir::StmtKind::kRequire: return "require";
                case hir::StmtKind::kRevert: return "revert";
                case hir::StmtKind::kPanic: return "panic";
            }
            return "?";
        }

        const char* access_name_(hir::AccessKind a) {
            switch (a) {
                case hir::AccessKind::kNone: return "none";
                case hir::AccessKind::kCopy: return "copy";
                case hir::AccessKind::kMove: return "move";
                case hir::AccessKind::kShared: return "shared";
                case hir::AccessKind::kExclusive: return "exclusive";
            }
            return "?";
        }

        const char* pass_name_(hir::PassMode p) {
            switch (p) {
                case hir::PassMode::kOwn: return "own";
                case hir::PassMode::kRef: return "ref";
                case hir::PassMode::kMut: return "mut";
            }
            return "?";
        }

        void indent_(std::ostream& os, int n) {
            for (int i = 0; i < n; ++i) os << "  ";
        }

        void dump_block_(const hir::Module& m, const ty::TypePool& types, hir::BlockId bid, int depth, std::ostream& os);

        void dump_stmt_(const hir::Module& m, const ty::TypePool& types, hir::StmtId sid, int depth, std::ostream& os) {
            const auto& s = m.stmts[sid];
            indent_(os, depth);
            os << stmt_kind_name_(s.kind);
            if (s.sym != hir::kInvalidSymbol && (size_t)s.sym < m.symbols.size()) {
                const auto& sym = m.symbols[s.sym];
                os << " " << sym.name << ": " << types.to_string(sym.type);
                if (sym.is_mut) os << " mut";
            }
            if (s.expr != hir::kInvalidId && (size_t)s.expr < m.exprs.size()) {
                const auto& e = m.exprs[s.expr];
                os << " expr#" << s.expr << " ty=" << types.to_string(e.type);
                if (e.access != hir::AccessKind::kNone) os << " access=" << access_name_(e.access);
            }
            if (!s.message.empty()) os << " msg=\"" << s.message << "\"";
            os << "\n";

            if (s.a != hir::kInvalidId) dump_block_(m, types, s.a, depth + 1, os);
            if (s.b != hir::kInvalidId) {
                indent_(os, depth);
                os << "else\n";
                dump_block_(m, types, s.b, depth + 1, os);
            }
        }

        void dump_block_(const hir::Module& m, const ty::TypePool& types, hir::BlockId bid, int depth, std::ostream& os) {
            if ((size_t)bid >= m.blocks.size()) return;
            const auto& b = m.blocks[bid];
            for (uint32_t i = 0; i < b.stmt_count; ++i) {
                dump_stmt_(m, types, m.block_stmt(b, i), depth, os);
            }
        }

        void dump_keys_(const domain::InternTable& keys, const std::vector<uint32_t>& ids, std::ostream& os) {
            os << "[";
            for (size_t i = 0; i < ids.size(); ++i) {
                if (i != 0) os << ", ";
                os << keys.get(ids[i]).canonical;
            }
            os << "]";
        }

    } // namespace

    void dump_hir_module(const hir::Module& m, const ty::TypePool& types, std::ostream& os) {
        os << "\nHIR unit=" << m.unit_id
           << " funcs=" << m.funcs.size()
           << " stmts=" << m.stmts.size()
           << " exprs=" << m.exprs.size()
           << "\n";

        for (size_t fi = 0; fi < m.funcs.size(); ++fi) {
            const auto& f = m.funcs[fi];
            os << "\n  fn #" << fi << " " << f.name << "(";
            for (uint32_t i = 0; i < f.param_count; ++i) {
                const auto& p = m.param(f, i);
                if (i != 0) os << ", ";
                os << p.name << ": " << types.to_string(p.type);
                if (p.pass != hir::PassMode::kOwn) os << " " << pass_name_(p.pass);
            }
            os << ") -> " << types.to_string(f.ret);
            if (f.is_public) os << " pub";
            if (f.is_payable) os << " payable";
            os << "\n";

            for (uint32_t i = 0; i < f.attr_count; ++i) {
                os << "    #[" << m.attrs[f.attr_begin + i].text << "]\n";
            }
            if (f.body != hir::kInvalidId) dump_block_(m, types, f.body, 2, os);
        }
    }

    void dump_ssa_module(const ssa::Module& m, const ty::TypePool& types, std::ostream& os) {
        ssa::dump(m, types, os);
    }

    void dump_domains(const ssa::Module& m, const domain::AnalysisResult& r, std::ostream& os) {
        os << "\nDOMAINS keys=" << r.keys.size()
           << " sccs=" << r.stats.scc_count
           << " cyclic=" << r.stats.cyclic_sccs
           << " fixpoint_passes=" << r.stats.fixpoint_passes
           << " wildcard_fallbacks=" << r.stats.wildcard_fallbacks
           << "\n";

        for (size_t fi = 0; fi < m.funcs.size() && fi < r.fns.size(); ++fi) {
            const auto& f = m.funcs[fi];
            const auto& d = r.fns[fi];
            os << "  fn " << f.name;
            if (f.excluded) {
                os << " <excluded>\n";
                continue;
            }
            switch (d.source) {
                case domain::DomainSource::kInferred: os << " inferred"; break;
                case domain::DomainSource::kDeclared: os << " declared"; break;
                case domain::DomainSource::kTrusted: os << " trusted"; break;
            }
            os << "\n    reads=";
            dump_keys_(r.keys, d.reads, os);
            os << "\n    writes=";
            dump_keys_(r.keys, d.writes, os);
            if (!d.proofs.empty()) {
                os << "\n    proofs=";
                for (const auto& p : d.proofs) os << p << " ";
            }
            os << "\n";
        }
    }

    void dump_bytecode(const backend::CompileResult& r, std::ostream& os) {
        os << "\nBYTECODE\n";
        for (const auto& info : r.functions) {
            if (info.index == backend::kNoFunction) continue;
            os << "  #" << info.index << " " << info.mangled
               << " locals=" << info.num_locals
               << " stack_values=" << info.stack_values
               << " gas=" << info.gas
               << (info.exported ? " export" : "")
               << "\n";
        }
        backend::vm::disassemble(r.module, os);
    }

} // namespace vellumc::dump
