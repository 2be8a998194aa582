// frontend/include/vellum/hir/HIR.hpp
#pragma once
#include <vellum/text/Span.hpp>
#include <vellum/ty/Type.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::hir {

    using TypeId   = ty::TypeId;
    using SymbolId = uint32_t;
    using ExprId   = uint32_t;
    using StmtId   = uint32_t;
    using BlockId  = uint32_t;
    using FuncId   = uint32_t;

    inline constexpr uint32_t kInvalidId = 0xFFFF'FFFFu;
    inline constexpr SymbolId kInvalidSymbol = kInvalidId;

    enum class ExprKind : uint8_t {
        kIntLit,
        kBoolLit,
        kBytesLit,
        kUnitLit,

        kLocal,

        kUnary,
        kBinary,
        kCast,

        kCall,

        kField,
        kStructLit,
        kSelect,      // cond ? then : else (if-expression)

        kResultOk,
        kResultErr,
        kIsOk,
        kUnwrap,      // aborts when the result carries an error
        kResultCode,

        kBytesLen,

        // persistent state / host capabilities
        kStateGet,
        kStatePut,
        kStateHas,
        kContext,
        kDigest,
        kEmit,
    };

    enum class UnaryOp : uint8_t {
        kNeg,
        kNot,
        kBitNot,
    };

    enum class BinaryOp : uint8_t {
        kAdd, kSub, kMul, kDiv, kRem,
        kShl, kShr,
        kBitAnd, kBitOr, kBitXor,
        kEq, kNe, kLt, kLe, kGt, kGe,
        kLogicalAnd, kLogicalOr,
    };

    /// @brief 산술 연산 변형. kDefault는 오버플로 시 abort하는 검사 연산이다.
    enum class ArithMode : uint8_t {
        kDefault,
        kWrapping,
        kSaturating,
        kChecked,     // result<T>를 돌려준다
    };

    enum class ContextKind : uint8_t {
        kCaller,
        kSelf,
        kBlockHeight,
        kTimestamp,
        kCallValue,
    };

    /// @brief 호출 지점 매개변수 전달 방식(by-value `self` / `self` / `mut self`).
    enum class PassMode : uint8_t {
        kOwn,
        kRef,
        kMut,
    };

    /// @brief ownership 검사기가 기록하는 사용 분류(내부 capability tag).
    enum class AccessKind : uint8_t {
        kNone,
        kCopy,
        kMove,
        kShared,
        kExclusive,
    };

    struct Expr {
        ExprKind kind = ExprKind::kUnitLit;
        Span span{};
        TypeId type = ty::kInvalidType;

        uint8_t op = 0;                 // UnaryOp / BinaryOp
        ArithMode mode = ArithMode::kDefault;

        ExprId a = kInvalidId;
        ExprId b = kInvalidId;
        ExprId c = kInvalidId;

        uint64_t int_bits = 0;          // kIntLit (word representation)
        bool bool_value = false;        // kBoolLit
        std::string text{};             // bytes literal / state namespace / event topic / field name

        SymbolId sym = kInvalidSymbol;  // kLocal
        FuncId callee = kInvalidId;     // kCall
        uint32_t field_index = 0;       // kField
        ContextKind ctx = ContextKind::kCaller;

        uint32_t arg_begin = 0;         // kCall / kStructLit / kEmit
        uint32_t arg_count = 0;

        AccessKind access = AccessKind::kNone;
    };

    enum class StmtKind : uint8_t {
        kExpr,
        kLet,
        kAssign,
        kIf,
        kWhile,
        kReturn,
        kBreak,
        kContinue,
        kRequire,   // recoverable precondition
        kRevert,    // recoverable, explicit
        kPanic,     // abort
    };

    struct Stmt {
        StmtKind kind = StmtKind::kExpr;
        Span span{};

        // kExpr/kLet(init)/kAssign(value)/kIf,kWhile,kRequire(cond)/kReturn(value, optional)
        ExprId expr = kInvalidId;

        // kLet / kAssign
        SymbolId sym = kInvalidSymbol;
        bool has_field = false;         // kAssign: `x.f = v`
        uint32_t field_index = 0;

        // kIf: a=then, b=else(optional) / kWhile: a=body
        BlockId a = kInvalidId;
        BlockId b = kInvalidId;

        std::string message{};          // kRequire / kRevert / kPanic
    };

    struct Block {
        Span span{};
        uint32_t stmt_begin = 0;        // into Module::block_stmts
        uint32_t stmt_count = 0;
    };

    struct Symbol {
        std::string name;
        TypeId type = ty::kInvalidType;
        bool is_mut = false;
        bool is_param = false;
        PassMode pass = PassMode::kOwn;
        Span decl_span{};
        FuncId owner = kInvalidId;
    };

    struct Param {
        std::string name;
        TypeId type = ty::kInvalidType;
        PassMode pass = PassMode::kOwn;
        bool is_mut = false;
        SymbolId sym = kInvalidSymbol;
        Span span{};
    };

    /// @brief 해석되지 않은 원문 어노테이션(`writes("acct:alice")` 등).
    struct Attr {
        std::string text;
        Span span{};
    };

    struct Func {
        std::string name;
        Span span{};
        TypeId ret = ty::kInvalidType;

        bool is_public = false;
        bool is_payable = false;

        uint32_t attr_begin = 0;
        uint32_t attr_count = 0;

        uint32_t param_begin = 0;
        uint32_t param_count = 0;

        BlockId body = kInvalidId;
    };

    class Module {
    public:
        std::string unit_id;

        std::vector<Expr>    exprs;
        std::vector<Stmt>    stmts;
        std::vector<Block>   blocks;
        std::vector<Func>    funcs;
        std::vector<Param>   params;
        std::vector<Attr>    attrs;
        std::vector<Symbol>  symbols;

        std::vector<ExprId>  args;          // call / struct / emit operands
        std::vector<StmtId>  block_stmts;   // block children

        ExprId add_expr(const Expr& e) {
            exprs.push_back(e);
            return static_cast<ExprId>(exprs.size() - 1);
        }

        StmtId add_stmt(const Stmt& s) {
            stmts.push_back(s);
            return static_cast<StmtId>(stmts.size() - 1);
        }

        BlockId add_block(const Block& b) {
            blocks.push_back(b);
            return static_cast<BlockId>(blocks.size() - 1);
        }

        FuncId add_func(const Func& f) {
            funcs.push_back(f);
            return static_cast<FuncId>(funcs.size() - 1);
        }

        SymbolId add_symbol(const Symbol& s) {
            symbols.push_back(s);
            return static_cast<SymbolId>(symbols.size() - 1);
        }

        FuncId find_func(std::string_view name) const {
            for (FuncId i = 0; i < funcs.size(); ++i) {
                if (funcs[i].name == name) return i;
            }
            return kInvalidId;
        }

        StmtId block_stmt(const Block& b, uint32_t i) const {
            return block_stmts[b.stmt_begin + i];
        }

        ExprId arg(const Expr& e, uint32_t i) const {
            return args[e.arg_begin + i];
        }

        const Param& param(const Func& f, uint32_t i) const {
            return params[f.param_begin + i];
        }
    };

} // namespace vellum::hir
