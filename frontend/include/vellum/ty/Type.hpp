// frontend/include/vellum/ty/Type.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>


namespace vellum::ty {

    using TypeId = uint32_t;
    inline constexpr TypeId kInvalidType = 0xFFFF'FFFFu;

    enum class Builtin : uint8_t {
        kUnit,
        kBool,

        // signed integers
        kI8, kI16, kI32, kI64,

        // unsigned integers
        kU8, kU16, kU32, kU64,

        // dynamic byte string (move semantics, memory resident)
        kBytes,
    };

    inline constexpr uint32_t kBuiltinCount = static_cast<uint32_t>(Builtin::kBytes) + 1;

    enum class Kind : uint8_t {
        kError,
        kBuiltin,
        kStruct,   // user struct (fields by position)
        kResult,   // result<T>: status code + payload

        // INTERNAL ONLY: exclusive-parameter reference cell (`mut` pass mode).
        // 표면 언어에는 노출되지 않는다.
        kRef,
    };

    struct Type {
        Kind kind = Kind::kError;

        // kBuiltin
        Builtin builtin = Builtin::kUnit;

        // kResult / kRef
        TypeId elem = kInvalidType;

        // kStruct: index into TypePool::structs()
        uint32_t struct_index = 0;
    };

    struct StructField {
        std::string name;
        TypeId type = kInvalidType;
    };

    struct StructDecl {
        std::string name;
        std::vector<StructField> fields;
    };

} // namespace vellum::ty
