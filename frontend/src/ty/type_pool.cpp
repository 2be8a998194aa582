// frontend/src/ty/type_pool.cpp
#include <vellum/ty/TypePool.hpp>


namespace vellum::ty {

    bool TypePool::is_integer(TypeId t) const {
        if (t >= types_.size() || types_[t].kind != Kind::kBuiltin) return false;
        switch (types_[t].builtin) {
            case Builtin::kI8: case Builtin::kI16: case Builtin::kI32: case Builtin::kI64:
            case Builtin::kU8: case Builtin::kU16: case Builtin::kU32: case Builtin::kU64:
                return true;
            default:
                return false;
        }
    }

    bool TypePool::is_signed(TypeId t) const {
        if (!is_integer(t)) return false;
        switch (types_[t].builtin) {
            case Builtin::kI8: case Builtin::kI16: case Builtin::kI32: case Builtin::kI64:
                return true;
            default:
                return false;
        }
    }

    uint32_t TypePool::bit_width(TypeId t) const {
        if (t >= types_.size() || types_[t].kind != Kind::kBuiltin) return 0;
        switch (types_[t].builtin) {
            case Builtin::kBool: return 1;
            case Builtin::kI8:  case Builtin::kU8:  return 8;
            case Builtin::kI16: case Builtin::kU16: return 16;
            case Builtin::kI32: case Builtin::kU32: return 32;
            case Builtin::kI64: case Builtin::kU64: return 64;
            default: return 0;
        }
    }

    bool TypePool::is_copy(TypeId t) const {
        if (t >= types_.size()) return true;
        const auto& tt = types_[t];
        switch (tt.kind) {
            case Kind::kError:
                return true;
            case Kind::kBuiltin:
                return tt.builtin != Builtin::kBytes;
            case Kind::kResult:
                return is_copy(tt.elem);
            case Kind::kRef:
                // exclusive 참조는 복제되지 않는다.
                return false;
            case Kind::kStruct: {
                for (const auto& f : structs_[tt.struct_index].fields) {
                    if (!is_copy(f.type)) return false;
                }
                return true;
            }
        }
        return false;
    }

    bool TypePool::is_state_value(TypeId t) const {
        return is_integer(t) || is_bool(t) || is_bytes(t);
    }

    std::string TypePool::to_string(TypeId t) const {
        if (t >= types_.size()) return "<invalid>";
        const auto& tt = types_[t];
        switch (tt.kind) {
            case Kind::kError: return "<error>";
            case Kind::kStruct: return structs_[tt.struct_index].name;
            case Kind::kResult: return "result<" + to_string(tt.elem) + ">";
            case Kind::kRef: return "mut " + to_string(tt.elem);
            case Kind::kBuiltin:
                switch (tt.builtin) {
                    case Builtin::kUnit: return "unit";
                    case Builtin::kBool: return "bool";
                    case Builtin::kI8: return "i8";
                    case Builtin::kI16: return "i16";
                    case Builtin::kI32: return "i32";
                    case Builtin::kI64: return "i64";
                    case Builtin::kU8: return "u8";
                    case Builtin::kU16: return "u16";
                    case Builtin::kU32: return "u32";
                    case Builtin::kU64: return "u64";
                    case Builtin::kBytes: return "bytes";
                }
        }
        return "<invalid>";
    }

    std::optional<TypeId> TypePool::parse(std::string_view text) {
        struct Named {
            std::string_view name;
            Builtin b;
        };
        static constexpr Named kNames[] = {
            {"unit", Builtin::kUnit}, {"bool", Builtin::kBool},
            {"i8", Builtin::kI8},   {"i16", Builtin::kI16}, {"i32", Builtin::kI32}, {"i64", Builtin::kI64},
            {"u8", Builtin::kU8},   {"u16", Builtin::kU16}, {"u32", Builtin::kU32}, {"u64", Builtin::kU64},
            {"bytes", Builtin::kBytes},
        };
        for (const auto& n : kNames) {
            if (n.name == text) return builtin(n.b);
        }

        constexpr std::string_view kResultPrefix = "result<";
        if (text.starts_with(kResultPrefix) && text.ends_with(">")) {
            const auto inner = text.substr(kResultPrefix.size(), text.size() - kResultPrefix.size() - 1);
            const auto elem = parse(inner);
            if (!elem) return std::nullopt;
            return make_result(*elem);
        }

        const TypeId st = find_struct(text);
        if (st != kInvalidType) return st;
        return std::nullopt;
    }

} // namespace vellum::ty
