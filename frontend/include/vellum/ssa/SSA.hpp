// frontend/include/vellum/ssa/SSA.hpp
#pragma once
#include <vellum/hir/HIR.hpp>
#include <vellum/text/Span.hpp>
#include <vellum/ty/Type.hpp>

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>


namespace vellum::ssa {

    // ----------------------
    // IDs
    // ----------------------
    using TypeId  = ty::TypeId;
    using FuncId  = uint32_t;
    using BlockId = uint32_t;
    using InstId  = uint32_t;
    using ValueId = uint32_t;

    inline constexpr uint32_t kInvalidId = 0xFFFF'FFFFu;

    // ----------------------
    // Effect model
    // ----------------------
    enum class Effect : uint8_t {
        Pure,
        MayReadMem,     // host read (state/context)
        MayWriteMem,    // host write (state/log)
        MayTrap,        // overflow check, unwrap, native div trap
        Call,
    };

    // ----------------------
    // Status codes carried by result<T>
    // ----------------------
    // 0 = ok, 음수 = 오류. 호스트 상태 코드(-1..-6)는 그대로 전달된다.
    enum class Status : int32_t {
        kOk = 0,
        kNotFound = -1,
        kInvalidArgument = -2,
        kBufferTooSmall = -3,
        kLimitExceeded = -4,
        kOutOfResource = -5,
        kInternalError = -6,

        kArithmetic = -16,   // checked 연산의 overflow / 0으로 나누기
    };

    // ----------------------
    // Ops
    // ----------------------
    enum class BinOp : uint8_t {
        Add, Sub, Mul, Div, Rem,
        Shl, Shr,
        And, Or, Xor,
        Eq, Ne, Lt, Le, Gt, Ge,
    };

    enum class UnOp : uint8_t {
        Neg,
        Not,      // bool
        BitNot,   // integer
    };

    /// @brief 산술 변형. Trap만 overflow 검사를 동반한다.
    enum class ArithMode : uint8_t {
        Trap,
        Wrapping,
        Saturating,
        Checked,    // result<T>: overflow -> Status::kArithmetic
    };

    enum class CastMode : uint8_t {
        Trap,
        Wrapping,
    };

    enum class ContextQuery : uint8_t {
        Caller,
        Self,
        BlockHeight,
        Timestamp,
        CallValue,
    };

    enum class RevertKind : uint8_t {
        Recoverable,   // require/revert: 메시지와 함께 되돌림, 사용한 gas만 소모
        Abort,         // panic/overflow: 전체 gas 소모
    };

    // ----------------------
    // Inst payloads
    // ----------------------
    struct InstConstInt   { uint64_t bits = 0; };      // word representation
    struct InstConstBool  { bool value = false; };
    struct InstConstBytes { std::string bytes; };

    struct InstUnary      { UnOp op; ArithMode mode; ValueId src; };
    struct InstBinOp      { BinOp op; ArithMode mode; ValueId lhs; ValueId rhs; };
    struct InstCast       { CastMode mode; TypeId to; ValueId src; };
    struct InstCall       { FuncId callee; std::vector<ValueId> args; };

    struct InstMakeStruct   { std::vector<ValueId> fields; };
    struct InstExtractField { ValueId base; uint32_t index; };
    struct InstInsertField  { ValueId base; uint32_t index; ValueId value; };

    // is_ok: value는 payload, 아니면 i32 status code
    struct InstMakeResult   { bool is_ok; ValueId value; };
    struct InstResultIsOk   { ValueId src; };
    struct InstResultValue  { ValueId src; };   // err이면 abort
    struct InstResultCode   { ValueId src; };

    // `mut` 매개변수 전달용 참조 셀
    struct InstRefNew   { ValueId init; };
    struct InstRefLoad  { ValueId ref; };
    struct InstRefStore { ValueId ref; ValueId value; };

    struct InstStateRead  { std::string ns; ValueId key; TypeId value_ty; };
    struct InstStateWrite { std::string ns; ValueId key; ValueId value; };
    struct InstStateHas   { std::string ns; ValueId key; };
    struct InstContext    { ContextQuery query; };
    struct InstDigest     { ValueId src; };
    struct InstEmit       { std::string topic; std::vector<ValueId> args; };
    struct InstBytesLen   { ValueId src; };

    using InstData = std::variant<
        InstConstInt,
        InstConstBool,
        InstConstBytes,
        InstUnary,
        InstBinOp,
        InstCast,
        InstCall,
        InstMakeStruct,
        InstExtractField,
        InstInsertField,
        InstMakeResult,
        InstResultIsOk,
        InstResultValue,
        InstResultCode,
        InstRefNew,
        InstRefLoad,
        InstRefStore,
        InstStateRead,
        InstStateWrite,
        InstStateHas,
        InstContext,
        InstDigest,
        InstEmit,
        InstBytesLen
    >;

    // ----------------------
    // Value
    // ----------------------
    struct Value {
        TypeId ty  = ty::kInvalidType;
        Effect eff = Effect::Pure;

        // def site
        // - inst result: def_a = inst_id
        // - block param: def_a = block_id, def_b = param_index
        uint32_t def_a = kInvalidId;
        uint32_t def_b = kInvalidId;

        Span span{};
    };

    // ----------------------
    // Inst
    // ----------------------
    struct Inst {
        InstData data{};
        Effect   eff    = Effect::Pure;
        ValueId  result = kInvalidId; // kInvalidId for "no result" (e.g. state write)
        Span     span{};
    };

    // ----------------------
    // Terminators
    // ----------------------
    struct TermBr {
        BlockId target = kInvalidId;
        std::vector<ValueId> args{};
    };

    struct TermCondBr {
        ValueId cond = kInvalidId;

        BlockId then_bb = kInvalidId;
        std::vector<ValueId> then_args{};

        BlockId else_bb = kInvalidId;
        std::vector<ValueId> else_args{};
    };

    struct TermRet {
        bool    has_value = false;
        ValueId value     = kInvalidId;
    };

    struct TermRevert {
        RevertKind kind = RevertKind::Recoverable;
        std::string message{};
    };

    struct TermUnreachable {};

    using Terminator = std::variant<TermBr, TermCondBr, TermRet, TermRevert, TermUnreachable>;

    // ----------------------
    // Block
    // ----------------------
    struct Block {
        // block params (phi)
        std::vector<ValueId> params;

        std::vector<InstId> insts;

        Terminator term{};
        bool has_term = false;
    };

    // ----------------------
    // Function
    // ----------------------
    struct Function {
        std::string name;
        Span span{};

        TypeId ret_ty = ty::kInvalidType;

        // entry block params == function params (`mut` 매개변수는 ref<T>)
        std::vector<TypeId> param_tys;
        std::vector<hir::PassMode> param_modes;

        std::vector<BlockId> blocks;
        BlockId entry = kInvalidId;

        bool is_public = false;
        bool is_payable = false;
        std::vector<hir::Attr> attrs;   // 해석되지 않은 어노테이션 원문

        // ownership/domain/backend 단계에서 제외된 함수는 본문을 갖지 않는다.
        bool excluded = false;
    };

    /// @brief SSA 패스가 누적하는 최적화 통계.
    struct OptStats {
        uint32_t blocks_removed = 0;
        uint32_t condbr_folded = 0;
        uint32_t consts_folded = 0;
        uint32_t calls_inlined = 0;
        uint32_t insts_removed = 0;
    };

    // ----------------------
    // Module container
    // ----------------------
    struct Module {
        std::string unit_id;

        std::vector<Function> funcs;
        std::vector<Block>    blocks;
        std::vector<Inst>     insts;
        std::vector<Value>    values;
        OptStats opt_stats{};

        ValueId add_value(const Value& v) {
            values.push_back(v);
            return static_cast<ValueId>(values.size() - 1);
        }

        InstId add_inst(const Inst& i) {
            insts.push_back(i);
            return static_cast<InstId>(insts.size() - 1);
        }

        BlockId add_block(const Block& b) {
            blocks.push_back(b);
            return static_cast<BlockId>(blocks.size() - 1);
        }

        FuncId add_func(const Function& f) {
            funcs.push_back(f);
            return static_cast<FuncId>(funcs.size() - 1);
        }
    };

    /// @brief inst operand을 순회한다.
    template <typename Fn>
    void for_each_operand(const InstData& data, Fn&& fn) {
        std::visit([&](auto&& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, InstUnary> || std::is_same_v<T, InstCast> ||
                          std::is_same_v<T, InstResultIsOk> || std::is_same_v<T, InstResultValue> ||
                          std::is_same_v<T, InstResultCode> || std::is_same_v<T, InstDigest> ||
                          std::is_same_v<T, InstBytesLen>) {
                fn(x.src);
            } else if constexpr (std::is_same_v<T, InstBinOp>) {
                fn(x.lhs);
                fn(x.rhs);
            } else if constexpr (std::is_same_v<T, InstCall>) {
                for (auto a : x.args) fn(a);
            } else if constexpr (std::is_same_v<T, InstMakeStruct>) {
                for (auto a : x.fields) fn(a);
            } else if constexpr (std::is_same_v<T, InstExtractField>) {
                fn(x.base);
            } else if constexpr (std::is_same_v<T, InstInsertField>) {
                fn(x.base);
                fn(x.value);
            } else if constexpr (std::is_same_v<T, InstMakeResult>) {
                if (x.value != kInvalidId) fn(x.value);
            } else if constexpr (std::is_same_v<T, InstRefNew>) {
                fn(x.init);
            } else if constexpr (std::is_same_v<T, InstRefLoad>) {
                fn(x.ref);
            } else if constexpr (std::is_same_v<T, InstRefStore>) {
                fn(x.ref);
                fn(x.value);
            } else if constexpr (std::is_same_v<T, InstStateRead> || std::is_same_v<T, InstStateHas>) {
                fn(x.key);
            } else if constexpr (std::is_same_v<T, InstStateWrite>) {
                fn(x.key);
                fn(x.value);
            } else if constexpr (std::is_same_v<T, InstEmit>) {
                for (auto a : x.args) fn(a);
            } else {
                // const / context: no operand
            }
        }, data);
    }

    /// @brief inst operand을 제자리에서 바꿀 수 있게 순회한다.
    template <typename Fn>
    void for_each_operand_mut(InstData& data, Fn&& fn) {
        std::visit([&](auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, InstUnary> || std::is_same_v<T, InstCast> ||
                          std::is_same_v<T, InstResultIsOk> || std::is_same_v<T, InstResultValue> ||
                          std::is_same_v<T, InstResultCode> || std::is_same_v<T, InstDigest> ||
                          std::is_same_v<T, InstBytesLen>) {
                fn(x.src);
            } else if constexpr (std::is_same_v<T, InstBinOp>) {
                fn(x.lhs);
                fn(x.rhs);
            } else if constexpr (std::is_same_v<T, InstCall>) {
                for (auto& a : x.args) fn(a);
            } else if constexpr (std::is_same_v<T, InstMakeStruct>) {
                for (auto& a : x.fields) fn(a);
            } else if constexpr (std::is_same_v<T, InstExtractField>) {
                fn(x.base);
            } else if constexpr (std::is_same_v<T, InstInsertField>) {
                fn(x.base);
                fn(x.value);
            } else if constexpr (std::is_same_v<T, InstMakeResult>) {
                if (x.value != kInvalidId) fn(x.value);
            } else if constexpr (std::is_same_v<T, InstRefNew>) {
                fn(x.init);
            } else if constexpr (std::is_same_v<T, InstRefLoad>) {
                fn(x.ref);
            } else if constexpr (std::is_same_v<T, InstRefStore>) {
                fn(x.ref);
                fn(x.value);
            } else if constexpr (std::is_same_v<T, InstStateRead> || std::is_same_v<T, InstStateHas>) {
                fn(x.key);
            } else if constexpr (std::is_same_v<T, InstStateWrite>) {
                fn(x.key);
                fn(x.value);
            } else if constexpr (std::is_same_v<T, InstEmit>) {
                for (auto& a : x.args) fn(a);
            } else {
                // const / context: no operand
            }
        }, data);
    }

    /// @brief terminator operand을 순회한다.
    template <typename Fn>
    void for_each_term_operand(const Terminator& term, Fn&& fn) {
        std::visit([&](auto&& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, TermRet>) {
                if (t.has_value) fn(t.value);
            } else if constexpr (std::is_same_v<T, TermBr>) {
                for (auto a : t.args) fn(a);
            } else if constexpr (std::is_same_v<T, TermCondBr>) {
                fn(t.cond);
                for (auto a : t.then_args) fn(a);
                for (auto a : t.else_args) fn(a);
            }
        }, term);
    }

    /// @brief terminator의 후속 블록을 순회한다(condbr는 then, else 순).
    template <typename Fn>
    void for_each_successor(const Terminator& term, Fn&& fn) {
        std::visit([&](auto&& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, TermBr>) {
                fn(t.target);
            } else if constexpr (std::is_same_v<T, TermCondBr>) {
                fn(t.then_bb);
                fn(t.else_bb);
            }
        }, term);
    }

} // namespace vellum::ssa
