// backend/src/meta/manifest.cpp
#include <vellum/backend/meta/Manifest.hpp>

#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/raw_ostream.h>

#include <system_error>


namespace vellum::backend::meta {

    namespace {

        llvm::json::Array key_list_(const domain::InternTable& keys, const std::vector<uint32_t>& ids) {
            llvm::json::Array out;
            for (auto id : ids) {
                const auto& k = keys.get(id);
                out.push_back(llvm::json::Object{
                    {"hash", domain::hash_hex(k.hash)},
                    {"scope", domain::hash_hex(k.scope)},
                    {"key", k.canonical},
                    {"wildcard", k.wildcard},
                });
            }
            return out;
        }

    } // namespace

    const char* domain_source_name(domain::DomainSource s) {
        switch (s) {
            case domain::DomainSource::kInferred: return "inferred";
            case domain::DomainSource::kDeclared: return "declared";
            case domain::DomainSource::kTrusted: return "trusted";
        }
        return "inferred";
    }

    llvm::json::Value build_manifest(
        const ssa::Module& m,
        const domain::AnalysisResult& domains,
        const CompileResult& compiled,
        std::string_view unit
    ) {
        llvm::json::Object fns;
        for (ssa::FuncId fid = 0; fid < m.funcs.size(); ++fid) {
            if (fid >= compiled.fn_ok.size() || !compiled.fn_ok[fid]) continue;
            const auto& f = m.funcs[fid];
            const auto& info = compiled.functions[fid];

            llvm::json::Object o{
                {"name", f.name},
                {"exported", info.exported},
                {"payable", f.is_payable},
                {"gas", static_cast<int64_t>(info.gas)},
            };

            if (fid < domains.fns.size()) {
                const auto& d = domains.fns[fid];
                o["reads"] = key_list_(domains.keys, d.reads);
                o["writes"] = key_list_(domains.keys, d.writes);
                o["domain_source"] = domain_source_name(d.source);

                llvm::json::Array proofs;
                for (const auto& p : d.proofs) proofs.push_back(p);
                o["proof_obligations"] = std::move(proofs);
            } else {
                o["reads"] = llvm::json::Array{};
                o["writes"] = llvm::json::Array{};
                o["domain_source"] = domain_source_name(domain::DomainSource::kInferred);
                o["proof_obligations"] = llvm::json::Array{};
            }

            fns[info.mangled] = std::move(o);
        }

        llvm::json::Array imports;
        for (const auto& im : compiled.module.imports) {
            imports.push_back(llvm::json::Object{
                {"module", im.module},
                {"version", static_cast<int64_t>(im.version)},
                {"name", im.name},
            });
        }

        return llvm::json::Object{
            {"format", std::string(kManifestFormat)},
            {"version", kManifestVersion},
            {"unit", std::string(unit)},
            {"functions", std::move(fns)},
            {"imports", std::move(imports)},
        };
    }

    std::string manifest_to_string(const llvm::json::Value& v) {
        std::string s;
        llvm::raw_string_ostream os(s);
        os << llvm::formatv("{0:2}", v);
        os.flush();
        return s;
    }

    bool write_manifest(const llvm::json::Value& v, const std::string& path, std::string& err) {
        std::error_code ec;
        llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_Text);
        if (ec) {
            err = ec.message();
            return false;
        }
        os << manifest_to_string(v) << "\n";
        os.close();
        if (os.has_error()) {
            err = os.error().message();
            os.clear_error();
            return false;
        }
        return true;
    }

} // namespace vellum::backend::meta
