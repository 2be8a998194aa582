// backend/src/mangle.cpp
#include <vellum/backend/Backend.hpp>


namespace vellum::backend {

    namespace {

        void append_len_name_(std::string& out, std::string_view s) {
            out += std::to_string(s.size());
            out += s;
        }

        void append_type_code_(std::string& out, const ty::TypePool& types, ty::TypeId t) {
            const auto& ty = types.get(t);
            switch (ty.kind) {
                case ty::Kind::kBuiltin:
                    switch (ty.builtin) {
                        case ty::Builtin::kUnit:  out += 'v'; return;
                        case ty::Builtin::kBool:  out += 'b'; return;
                        case ty::Builtin::kI8:    out += 'a'; return;
                        case ty::Builtin::kI16:   out += 's'; return;
                        case ty::Builtin::kI32:   out += 'i'; return;
                        case ty::Builtin::kI64:   out += 'l'; return;
                        case ty::Builtin::kU8:    out += 'h'; return;
                        case ty::Builtin::kU16:   out += 't'; return;
                        case ty::Builtin::kU32:   out += 'j'; return;
                        case ty::Builtin::kU64:   out += 'm'; return;
                        case ty::Builtin::kBytes: out += 'y'; return;
                    }
                    out += '?';
                    return;
                case ty::Kind::kStruct: {
                    out += 'S';
                    const auto* sd = types.struct_decl(t);
                    append_len_name_(out, sd != nullptr ? std::string_view(sd->name) : std::string_view("?"));
                    return;
                }
                case ty::Kind::kResult:
                    out += 'R';
                    append_type_code_(out, types, ty.elem);
                    return;
                case ty::Kind::kRef:
                    out += 'M';
                    append_type_code_(out, types, ty.elem);
                    return;
                case ty::Kind::kError:
                    out += '?';
                    return;
            }
        }

    } // namespace

    std::string mangle(std::string_view unit, const ssa::Function& f, const ty::TypePool& types) {
        std::string out = "_VL";
        append_len_name_(out, unit);
        append_len_name_(out, f.name);
        out += '_';
        if (f.param_tys.empty()) {
            out += 'v';
            return out;
        }
        for (auto t : f.param_tys) append_type_code_(out, types, t);
        return out;
    }

} // namespace vellum::backend
