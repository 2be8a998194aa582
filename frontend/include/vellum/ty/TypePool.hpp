// frontend/include/vellum/ty/TypePool.hpp
#pragma once
#include <vellum/ty/Type.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::ty {

    class TypePool {
    public:
        TypePool() {
            types_.reserve(64);

            // [0] canonical error type
            {
                Type err{};
                err.kind = Kind::kError;
                types_.push_back(err);
                error_id_ = 0;
            }

            // canonical builtins are created eagerly.
            for (uint32_t i = 0; i < kBuiltinCount; ++i) {
                Type t{};
                t.kind = Kind::kBuiltin;
                t.builtin = static_cast<Builtin>(i);
                builtin_ids_.push_back(static_cast<TypeId>(types_.size()));
                types_.push_back(t);
            }
        }

        TypeId error() const {  return error_id_;  }

        TypeId builtin(Builtin b) const {
            return builtin_ids_[static_cast<uint32_t>(b)];
        }

        const Type& get(TypeId id) const { return types_[id]; }

        uint32_t count() const { return static_cast<uint32_t>(types_.size()); }

        const std::vector<StructDecl>& structs() const { return structs_; }

        /// @brief struct 선언을 등록한다. 같은 이름이 이미 있으면 kInvalidType.
        TypeId declare_struct(std::string name) {
            if (find_struct(name) != kInvalidType) return kInvalidType;
            StructDecl d{};
            d.name = std::move(name);
            structs_.push_back(std::move(d));

            Type t{};
            t.kind = Kind::kStruct;
            t.struct_index = static_cast<uint32_t>(structs_.size() - 1);
            return push_(t);
        }

        /// @brief 선언 이후 필드를 채운다(재귀 참조 없이 순서대로 선언된다고 가정).
        void set_struct_fields(TypeId st, std::vector<StructField> fields) {
            if (st >= types_.size() || types_[st].kind != Kind::kStruct) return;
            structs_[types_[st].struct_index].fields = std::move(fields);
        }

        const StructDecl* struct_decl(TypeId st) const {
            if (st >= types_.size() || types_[st].kind != Kind::kStruct) return nullptr;
            return &structs_[types_[st].struct_index];
        }

        TypeId find_struct(std::string_view name) const {
            for (TypeId i = 0; i < types_.size(); ++i) {
                const auto& t = types_[i];
                if (t.kind == Kind::kStruct && structs_[t.struct_index].name == name) return i;
            }
            return kInvalidType;
        }

        TypeId make_result(TypeId elem) { return make_wrapped_(Kind::kResult, elem); }
        TypeId make_ref(TypeId elem)    { return make_wrapped_(Kind::kRef, elem); }

        // ---- classification ----
        bool is_builtin(TypeId t, Builtin b) const {
            return t < types_.size() && types_[t].kind == Kind::kBuiltin && types_[t].builtin == b;
        }
        bool is_unit(TypeId t) const  { return is_builtin(t, Builtin::kUnit); }
        bool is_bool(TypeId t) const  { return is_builtin(t, Builtin::kBool); }
        bool is_bytes(TypeId t) const { return is_builtin(t, Builtin::kBytes); }
        bool is_integer(TypeId t) const;
        bool is_signed(TypeId t) const;
        uint32_t bit_width(TypeId t) const;

        /// @brief copy 의미론 여부. 스칼라는 copy, bytes는 move, 집합 타입은 구성요소를 따른다.
        bool is_copy(TypeId t) const;

        /// @brief 상태 저장소에 직렬화 가능한 값 타입인지(스칼라/bool/bytes).
        bool is_state_value(TypeId t) const;

        std::string to_string(TypeId t) const;

        /// @brief "u64", "bytes", "result<u32>", struct 이름을 TypeId로 해석한다.
        std::optional<TypeId> parse(std::string_view text);

    private:
        TypeId push_(const Type& t) {
            types_.push_back(t);
            return static_cast<TypeId>(types_.size() - 1);
        }

        TypeId make_wrapped_(Kind k, TypeId elem) {
            for (TypeId i = 0; i < types_.size(); ++i) {
                if (types_[i].kind == k && types_[i].elem == elem) return i;
            }
            Type t{};
            t.kind = k;
            t.elem = elem;
            return push_(t);
        }

        std::vector<Type> types_;
        std::vector<TypeId> builtin_ids_;
        std::vector<StructDecl> structs_;
        TypeId error_id_ = kInvalidType;
    };

} // namespace vellum::ty
