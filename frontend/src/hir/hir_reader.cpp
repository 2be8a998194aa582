// frontend/src/hir/hir_reader.cpp
#include <vellum/hir/Reader.hpp>
#include <vellum/ty/IntArith.hpp>

#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>

#include <charconv>
#include <optional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>


namespace vellum::hir {

    namespace {

        namespace json = llvm::json;

        struct BinarySpelling {
            std::string_view text;
            BinaryOp op;
        };

        constexpr BinarySpelling kBinaryOps[] = {
            {"+", BinaryOp::kAdd}, {"-", BinaryOp::kSub}, {"*", BinaryOp::kMul},
            {"/", BinaryOp::kDiv}, {"%", BinaryOp::kRem},
            {"<<", BinaryOp::kShl}, {">>", BinaryOp::kShr},
            {"&", BinaryOp::kBitAnd}, {"|", BinaryOp::kBitOr}, {"^", BinaryOp::kBitXor},
            {"==", BinaryOp::kEq}, {"!=", BinaryOp::kNe},
            {"<", BinaryOp::kLt}, {"<=", BinaryOp::kLe}, {">", BinaryOp::kGt}, {">=", BinaryOp::kGe},
            {"&&", BinaryOp::kLogicalAnd}, {"||", BinaryOp::kLogicalOr},
        };

        bool is_arith_op_(BinaryOp op) {
            switch (op) {
                case BinaryOp::kAdd: case BinaryOp::kSub: case BinaryOp::kMul:
                case BinaryOp::kDiv: case BinaryOp::kRem:
                case BinaryOp::kShl: case BinaryOp::kShr:
                    return true;
                default:
                    return false;
            }
        }

        bool is_compare_op_(BinaryOp op) {
            switch (op) {
                case BinaryOp::kEq: case BinaryOp::kNe:
                case BinaryOp::kLt: case BinaryOp::kLe: case BinaryOp::kGt: case BinaryOp::kGe:
                    return true;
                default:
                    return false;
            }
        }

        /// @brief JSON 숫자 또는 `{"int": ...}` 중 타입 표기가 없는 리터럴인지.
        bool is_untyped_literal_(const json::Value& v) {
            if (v.kind() == json::Value::Number) return true;
            if (const auto* o = v.getAsObject()) {
                return o->get("int") != nullptr && o->get("type") == nullptr;
            }
            return false;
        }

        /// @brief JSON HIR 문서를 한 번 순회하며 Module을 채운다.
        class Reader final {
        public:
            Reader(Module& m, ty::TypePool& types, diag::Bag& bag, uint32_t file_id)
                : m_(m), types_(types), bag_(bag), file_id_(file_id) {}

            bool run(const json::Object& root) {
                if (auto unit = root.getString("unit")) {
                    m_.unit_id = unit->str();
                } else {
                    malformed_(Span{file_id_, 0, 0}, "missing 'unit'");
                    return false;
                }

                if (const auto* structs = root.getArray("structs")) {
                    for (const auto& s : *structs) read_struct_(s);
                }

                const auto* fns = root.getArray("fns");
                if (fns == nullptr) {
                    malformed_(Span{file_id_, 0, 0}, "missing 'fns'");
                    return false;
                }

                // 1) 시그니처를 먼저 등록해 전방 호출을 허용한다.
                std::vector<const json::Object*> fn_objs;
                for (const auto& f : *fns) {
                    const auto* fo = f.getAsObject();
                    if (fo == nullptr) {
                        malformed_(Span{file_id_, 0, 0}, "function entry must be an object");
                        continue;
                    }
                    fn_objs.push_back(fo);
                    declare_func_(*fo);
                }

                // 2) 본문
                for (FuncId fid = 0; fid < fn_objs.size() && fid < m_.funcs.size(); ++fid) {
                    read_body_(fid, *fn_objs[fid]);
                }
                return !failed_;
            }

        private:
            // ---------------- diagnostics ----------------
            void report_(diag::Code code, Span sp, std::initializer_list<std::string_view> args) {
                diag::Diagnostic d(diag::Severity::kError, code, sp);
                for (auto a : args) d.add_arg(a);
                bag_.add(std::move(d));
                failed_ = true;
            }

            void malformed_(Span sp, std::string_view detail) {
                report_(diag::Code::kHirMalformed, sp, {detail});
            }

            void mismatch_(Span sp, TypeId want, TypeId got) {
                report_(diag::Code::kHirTypeMismatch, sp, {types_.to_string(want), types_.to_string(got)});
            }

            Span span_of_(const json::Object* o) const {
                Span sp{file_id_, 0, 0};
                if (o == nullptr) return sp;
                const auto* arr = o->getArray("span");
                if (arr == nullptr || arr->size() != 2) return sp;
                const auto lo = (*arr)[0].getAsInteger();
                const auto hi = (*arr)[1].getAsInteger();
                if (!lo || !hi || *lo < 0 || *hi < *lo) return sp;
                sp.lo = static_cast<uint32_t>(*lo);
                sp.hi = static_cast<uint32_t>(*hi);
                return sp;
            }

            TypeId expr_type_(ExprId e) const {
                return (e == kInvalidId) ? ty::kInvalidType : m_.exprs[e].type;
            }

            bool expect_type_(ExprId e, TypeId want, Span sp) {
                if (e == kInvalidId) return false;
                if (want == ty::kInvalidType || m_.exprs[e].type == want) return true;
                mismatch_(sp, want, m_.exprs[e].type);
                return false;
            }

            std::optional<TypeId> parse_type_(std::string_view text, Span sp) {
                auto t = types_.parse(text);
                if (!t) report_(diag::Code::kHirUnknownType, sp, {text});
                return t;
            }

            // ---------------- scopes ----------------
            void push_scope_() { scope_marks_.push_back(scope_.size()); }

            void pop_scope_() {
                scope_.resize(scope_marks_.back());
                scope_marks_.pop_back();
            }

            SymbolId lookup_(std::string_view name) const {
                for (auto it = scope_.rbegin(); it != scope_.rend(); ++it) {
                    if (it->first == name) return it->second;
                }
                return kInvalidSymbol;
            }

            SymbolId declare_(std::string name, TypeId t, bool is_mut, Span sp) {
                Symbol s{};
                s.name = name;
                s.type = t;
                s.is_mut = is_mut;
                s.decl_span = sp;
                s.owner = cur_fn_;
                const SymbolId id = m_.add_symbol(s);
                scope_.emplace_back(std::move(name), id);
                return id;
            }

            // ---------------- declarations ----------------
            void read_struct_(const json::Value& v) {
                const auto* o = v.getAsObject();
                const Span sp = span_of_(o);
                if (o == nullptr) {
                    malformed_(sp, "struct entry must be an object");
                    return;
                }
                const auto name = o->getString("name");
                const auto* fields = o->getArray("fields");
                if (!name || fields == nullptr) {
                    malformed_(sp, "struct requires 'name' and 'fields'");
                    return;
                }

                const TypeId st = types_.declare_struct(name->str());
                if (st == ty::kInvalidType) {
                    report_(diag::Code::kHirDuplicateName, sp, {*name});
                    return;
                }

                std::vector<ty::StructField> out;
                for (const auto& f : *fields) {
                    const auto* pair = f.getAsArray();
                    if (pair == nullptr || pair->size() != 2) {
                        malformed_(sp, "struct field must be [name, type]");
                        return;
                    }
                    const auto fname = (*pair)[0].getAsString();
                    const auto ftype = (*pair)[1].getAsString();
                    if (!fname || !ftype) {
                        malformed_(sp, "struct field must be [name, type]");
                        return;
                    }
                    const auto t = parse_type_(*ftype, sp);
                    if (!t) return;
                    if (*t == st || types_.is_unit(*t)) {
                        malformed_(sp, "struct field type must be a value type declared earlier");
                        return;
                    }
                    out.push_back(ty::StructField{fname->str(), *t});
                }
                types_.set_struct_fields(st, std::move(out));
            }

            void declare_func_(const json::Object& o) {
                Func f{};
                f.span = span_of_(&o);

                const auto name = o.getString("name");
                if (!name) {
                    malformed_(f.span, "function requires 'name'");
                    f.name = "<anonymous>";
                } else {
                    f.name = name->str();
                }
                if (m_.find_func(f.name) != kInvalidId) {
                    report_(diag::Code::kHirDuplicateName, f.span, {f.name});
                }

                if (auto pub = o.getBoolean("pub")) f.is_public = *pub;
                if (auto payable = o.getBoolean("payable")) f.is_payable = *payable;

                f.ret = types_.builtin(ty::Builtin::kUnit);
                if (auto ret = o.getString("ret")) {
                    if (auto t = parse_type_(*ret, f.span)) f.ret = *t;
                }

                f.attr_begin = static_cast<uint32_t>(m_.attrs.size());
                if (const auto* attrs = o.getArray("attrs")) {
                    for (const auto& a : *attrs) {
                        if (auto text = a.getAsString()) {
                            m_.attrs.push_back(Attr{text->str(), f.span});
                        } else {
                            malformed_(f.span, "annotation must be a string");
                        }
                    }
                }
                f.attr_count = static_cast<uint32_t>(m_.attrs.size()) - f.attr_begin;

                f.param_begin = static_cast<uint32_t>(m_.params.size());
                if (const auto* ps = o.getArray("params")) {
                    for (const auto& p : *ps) read_param_(p, f.span);
                }
                f.param_count = static_cast<uint32_t>(m_.params.size()) - f.param_begin;

                m_.add_func(f);
            }

            void read_param_(const json::Value& v, Span fn_span) {
                Param p{};
                p.span = fn_span;

                std::optional<std::string> name, type, mode;
                auto take = [](std::optional<std::string>& dst, llvm::Optional<llvm::StringRef> src) {
                    if (src) dst = src->str();
                };
                if (const auto* arr = v.getAsArray()) {
                    if (arr->size() >= 2) {
                        take(name, (*arr)[0].getAsString());
                        take(type, (*arr)[1].getAsString());
                    }
                    if (arr->size() >= 3) take(mode, (*arr)[2].getAsString());
                } else if (const auto* o = v.getAsObject()) {
                    p.span = span_of_(o);
                    take(name, o->getString("name"));
                    take(type, o->getString("type"));
                    take(mode, o->getString("pass"));
                }

                if (!name || !type) {
                    malformed_(p.span, "parameter must be [name, type(, pass)]");
                    return;
                }
                p.name = *name;
                if (auto t = parse_type_(*type, p.span)) p.type = *t;
                else p.type = types_.error();
                if (types_.is_unit(p.type)) {
                    malformed_(p.span, "parameter type cannot be unit");
                }

                if (mode) {
                    if (*mode == "own") {
                        p.pass = PassMode::kOwn;
                    } else if (*mode == "var") {
                        p.pass = PassMode::kOwn;
                        p.is_mut = true;
                    } else if (*mode == "ref") {
                        p.pass = PassMode::kRef;
                    } else if (*mode == "mut") {
                        p.pass = PassMode::kMut;
                        p.is_mut = true;
                    } else {
                        malformed_(p.span, "parameter pass mode must be own|var|ref|mut");
                    }
                }
                m_.params.push_back(p);
            }

            void read_body_(FuncId fid, const json::Object& o) {
                cur_fn_ = fid;
                cur_ret_ = m_.funcs[fid].ret;
                loop_depth_ = 0;

                push_scope_();
                const auto& f = m_.funcs[fid];
                for (uint32_t i = 0; i < f.param_count; ++i) {
                    auto& p = m_.params[f.param_begin + i];
                    p.sym = declare_(p.name, p.type, p.is_mut, p.span);
                    auto& s = m_.symbols[p.sym];
                    s.is_param = true;
                    s.pass = p.pass;
                }

                const auto* body = o.getArray("body");
                if (body == nullptr) {
                    malformed_(f.span, "function requires 'body'");
                    pop_scope_();
                    return;
                }
                const BlockId b = read_block_(*body, f.span);
                m_.funcs[fid].body = b;
                pop_scope_();
            }

            // ---------------- statements ----------------
            BlockId read_block_(const json::Array& arr, Span sp) {
                push_scope_();
                std::vector<StmtId> ids;
                ids.reserve(arr.size());
                for (const auto& sv : arr) {
                    const StmtId s = read_stmt_(sv);
                    if (s != kInvalidId) ids.push_back(s);
                }
                pop_scope_();

                Block b{};
                b.span = sp;
                b.stmt_begin = static_cast<uint32_t>(m_.block_stmts.size());
                b.stmt_count = static_cast<uint32_t>(ids.size());
                for (auto s : ids) m_.block_stmts.push_back(s);
                return m_.add_block(b);
            }

            BlockId read_child_block_(const json::Object& o, llvm::StringRef key, Span sp, bool required) {
                const auto* arr = o.getArray(key);
                if (arr == nullptr) {
                    if (required) malformed_(sp, "statement requires '" + key.str() + "' block");
                    return kInvalidId;
                }
                return read_block_(*arr, sp);
            }

            StmtId read_stmt_(const json::Value& v) {
                const auto* o = v.getAsObject();
                if (o == nullptr) {
                    malformed_(Span{file_id_, 0, 0}, "statement must be an object");
                    return kInvalidId;
                }
                const Span sp = span_of_(o);

                Stmt s{};
                s.span = sp;

                if (o->get("let") != nullptr || o->get("var") != nullptr) {
                    const bool is_var = o->get("var") != nullptr;
                    const auto name = o->getString(is_var ? "var" : "let");
                    const auto* init = o->get("init");
                    if (!name || init == nullptr) {
                        malformed_(sp, "binding requires a name and 'init'");
                        return kInvalidId;
                    }

                    TypeId declared = ty::kInvalidType;
                    if (auto t = o->getString("type")) {
                        auto parsed = parse_type_(*t, sp);
                        if (!parsed) return kInvalidId;
                        declared = *parsed;
                    }

                    s.kind = StmtKind::kLet;
                    s.expr = read_expr_(*init, declared);
                    if (s.expr == kInvalidId) return kInvalidId;
                    if (declared != ty::kInvalidType && !expect_type_(s.expr, declared, sp)) return kInvalidId;
                    if (types_.is_unit(expr_type_(s.expr))) {
                        malformed_(sp, "cannot bind a unit value");
                        return kInvalidId;
                    }

                    // 초기화 식을 읽은 뒤에 이름을 도입한다(자기 참조 금지).
                    s.sym = declare_(name->str(), expr_type_(s.expr), is_var, sp);
                    return m_.add_stmt(s);
                }

                if (const auto name = o->getString("set")) {
                    const SymbolId sym = lookup_(*name);
                    if (sym == kInvalidSymbol) {
                        report_(diag::Code::kHirUnknownName, sp, {*name});
                        return kInvalidId;
                    }
                    const auto* value = o->get("value");
                    if (value == nullptr) {
                        malformed_(sp, "'set' requires 'value'");
                        return kInvalidId;
                    }

                    s.kind = StmtKind::kAssign;
                    s.sym = sym;
                    TypeId target = m_.symbols[sym].type;
                    if (auto field = o->getString("field")) {
                        const auto* decl = types_.struct_decl(target);
                        if (decl == nullptr) {
                            malformed_(sp, "field assignment on a non-struct binding");
                            return kInvalidId;
                        }
                        bool found = false;
                        for (uint32_t i = 0; i < decl->fields.size(); ++i) {
                            if (decl->fields[i].name == *field) {
                                s.has_field = true;
                                s.field_index = i;
                                target = decl->fields[i].type;
                                found = true;
                                break;
                            }
                        }
                        if (!found) {
                            report_(diag::Code::kHirUnknownName, sp, {*field});
                            return kInvalidId;
                        }
                    }
                    s.expr = read_expr_(*value, target);
                    if (!expect_type_(s.expr, target, sp)) return kInvalidId;
                    return m_.add_stmt(s);
                }

                if (const auto* cond = o->get("if")) {
                    s.kind = StmtKind::kIf;
                    s.expr = read_expr_(*cond, types_.builtin(ty::Builtin::kBool));
                    if (!expect_type_(s.expr, types_.builtin(ty::Builtin::kBool), sp)) return kInvalidId;
                    s.a = read_child_block_(*o, "then", sp, /*required=*/true);
                    s.b = read_child_block_(*o, "else", sp, /*required=*/false);
                    if (s.a == kInvalidId) return kInvalidId;
                    return m_.add_stmt(s);
                }

                if (const auto* cond = o->get("while")) {
                    s.kind = StmtKind::kWhile;
                    s.expr = read_expr_(*cond, types_.builtin(ty::Builtin::kBool));
                    if (!expect_type_(s.expr, types_.builtin(ty::Builtin::kBool), sp)) return kInvalidId;
                    ++loop_depth_;
                    s.a = read_child_block_(*o, "body", sp, /*required=*/true);
                    --loop_depth_;
                    if (s.a == kInvalidId) return kInvalidId;
                    return m_.add_stmt(s);
                }

                if (const auto* ret = o->get("return")) {
                    s.kind = StmtKind::kReturn;
                    if (ret->kind() != json::Value::Null) {
                        s.expr = read_expr_(*ret, cur_ret_);
                        if (!expect_type_(s.expr, cur_ret_, sp)) return kInvalidId;
                    } else if (!types_.is_unit(cur_ret_)) {
                        mismatch_(sp, cur_ret_, types_.builtin(ty::Builtin::kUnit));
                        return kInvalidId;
                    }
                    return m_.add_stmt(s);
                }

                if (o->get("break") != nullptr || o->get("continue") != nullptr) {
                    s.kind = (o->get("break") != nullptr) ? StmtKind::kBreak : StmtKind::kContinue;
                    if (loop_depth_ == 0) {
                        malformed_(sp, "break/continue outside of a loop");
                        return kInvalidId;
                    }
                    return m_.add_stmt(s);
                }

                if (const auto* cond = o->get("require")) {
                    s.kind = StmtKind::kRequire;
                    s.expr = read_expr_(*cond, types_.builtin(ty::Builtin::kBool));
                    if (!expect_type_(s.expr, types_.builtin(ty::Builtin::kBool), sp)) return kInvalidId;
                    s.message = "requirement failed";
                    if (auto msg = o->getString("msg")) s.message = msg->str();
                    return m_.add_stmt(s);
                }

                if (o->get("revert") != nullptr || o->get("panic") != nullptr) {
                    const bool is_panic = o->get("panic") != nullptr;
                    s.kind = is_panic ? StmtKind::kPanic : StmtKind::kRevert;
                    if (auto msg = o->getString(is_panic ? "panic" : "revert")) s.message = msg->str();
                    return m_.add_stmt(s);
                }

                const json::Value* e = o->get("do");
                s.kind = StmtKind::kExpr;
                s.expr = read_expr_(e != nullptr ? *e : v, ty::kInvalidType);
                if (s.expr == kInvalidId) return kInvalidId;
                return m_.add_stmt(s);
            }

            // ---------------- expressions ----------------
            ExprId add_(Expr e) { return m_.add_expr(e); }

            ExprId int_lit_(uint64_t raw, TypeId t, Span sp) {
                if (!types_.is_integer(t)) {
                    malformed_(sp, "integer literal requires an integer type");
                    return kInvalidId;
                }
                Expr e{};
                e.kind = ExprKind::kIntLit;
                e.span = sp;
                e.type = t;
                e.int_bits = raw;
                return add_(e);
            }

            /// @brief 리터럴 값(i64 해석 또는 u64 문자열)을 목표 타입 범위에서 검사한다.
            ExprId read_int_value_(const json::Value& v, TypeId t, Span sp) {
                if (t == ty::kInvalidType || !types_.is_integer(t)) t = types_.builtin(ty::Builtin::kI64);
                const auto tk = ty::int_kind(types_.get(t).builtin);

                if (auto i = v.getAsInteger()) {
                    const auto c = ty::eval_cast(ty::IntKind{true, 64}, tk, static_cast<uint64_t>(*i));
                    if (c.overflow) {
                        malformed_(sp, "integer literal out of range for " + types_.to_string(t));
                        return kInvalidId;
                    }
                    return int_lit_(c.value, t, sp);
                }

                if (auto s = v.getAsString()) {
                    const std::string text = s->str();
                    const bool neg = !text.empty() && text[0] == '-';
                    uint64_t mag = 0;
                    const char* b = text.data() + (neg ? 1 : 0);
                    const char* e = text.data() + text.size();
                    auto [ptr, ec] = std::from_chars(b, e, mag, 10);
                    if (ec != std::errc{} || ptr != e || b == e) {
                        malformed_(sp, "invalid integer literal '" + text + "'");
                        return kInvalidId;
                    }
                    if (neg) {
                        const uint64_t w = 0 - mag;
                        const bool fits_i64 = mag <= (uint64_t{1} << 63);
                        const auto c = ty::eval_cast(ty::IntKind{true, 64}, tk, w);
                        if (!fits_i64 || c.overflow) {
                            malformed_(sp, "integer literal out of range for " + types_.to_string(t));
                            return kInvalidId;
                        }
                        return int_lit_(c.value, t, sp);
                    }
                    const auto c = ty::eval_cast(ty::IntKind{false, 64}, tk, mag);
                    if (c.overflow) {
                        malformed_(sp, "integer literal out of range for " + types_.to_string(t));
                        return kInvalidId;
                    }
                    return int_lit_(c.value, t, sp);
                }

                malformed_(sp, "integer literal must be a number or decimal string");
                return kInvalidId;
            }

            ExprId read_expr_(const json::Value& v, TypeId hint) {
                switch (v.kind()) {
                    case json::Value::Number:
                        return read_int_value_(v, hint, Span{file_id_, 0, 0});

                    case json::Value::Boolean: {
                        Expr e{};
                        e.kind = ExprKind::kBoolLit;
                        e.span = Span{file_id_, 0, 0};
                        e.type = types_.builtin(ty::Builtin::kBool);
                        e.bool_value = *v.getAsBoolean();
                        return add_(e);
                    }

                    case json::Value::String: {
                        const auto name = *v.getAsString();
                        return local_ref_(name, Span{file_id_, 0, 0});
                    }

                    case json::Value::Object:
                        return read_expr_object_(*v.getAsObject(), hint);

                    default:
                        malformed_(Span{file_id_, 0, 0}, "unsupported expression form");
                        return kInvalidId;
                }
            }

            ExprId local_ref_(llvm::StringRef name, Span sp) {
                const SymbolId sym = lookup_(name);
                if (sym == kInvalidSymbol) {
                    report_(diag::Code::kHirUnknownName, sp, {name});
                    return kInvalidId;
                }
                Expr e{};
                e.kind = ExprKind::kLocal;
                e.span = sp;
                e.sym = sym;
                e.type = m_.symbols[sym].type;
                return add_(e);
            }

            const json::Value* need_(const json::Object& o, llvm::StringRef key, Span sp) {
                const auto* v = o.get(key);
                if (v == nullptr) malformed_(sp, "expression requires '" + key.str() + "'");
                return v;
            }

            std::optional<ArithMode> read_mode_(const json::Object& o, Span sp) {
                const auto mode = o.getString("mode");
                if (!mode) return ArithMode::kDefault;
                if (*mode == "wrap") return ArithMode::kWrapping;
                if (*mode == "sat") return ArithMode::kSaturating;
                if (*mode == "checked") return ArithMode::kChecked;
                if (*mode == "trap") return ArithMode::kDefault;
                malformed_(sp, "arithmetic mode must be trap|wrap|sat|checked");
                return std::nullopt;
            }

            /// @brief 상태 키: 정수 또는 bytes.
            ExprId read_state_key_(const json::Object& o, Span sp) {
                const auto* kv = need_(o, "key", sp);
                if (kv == nullptr) return kInvalidId;
                const ExprId k = read_expr_(*kv, types_.builtin(ty::Builtin::kU64));
                if (k == kInvalidId) return kInvalidId;
                const TypeId kt = expr_type_(k);
                if (!types_.is_integer(kt) && !types_.is_bytes(kt)) {
                    malformed_(sp, "state key must be an integer or bytes");
                    return kInvalidId;
                }
                return k;
            }

            std::optional<std::string> read_namespace_(const json::Object& o, llvm::StringRef key, Span sp) {
                const auto ns = o.getString(key);
                if (!ns || ns->empty()) {
                    malformed_(sp, "state namespace must be a non-empty string");
                    return std::nullopt;
                }
                if (ns->find_first_of(":*.") != llvm::StringRef::npos) {
                    malformed_(sp, "state namespace must not contain ':', '*' or '.'");
                    return std::nullopt;
                }
                return ns->str();
            }

            bool read_args_(const json::Array& arr, const std::vector<TypeId>& hints, std::vector<ExprId>& out) {
                bool ok = true;
                for (size_t i = 0; i < arr.size(); ++i) {
                    const TypeId h = (i < hints.size()) ? hints[i] : ty::kInvalidType;
                    const ExprId e = read_expr_(arr[i], h);
                    if (e == kInvalidId) ok = false;
                    out.push_back(e);
                }
                return ok;
            }

            void store_args_(Expr& e, const std::vector<ExprId>& args) {
                e.arg_begin = static_cast<uint32_t>(m_.args.size());
                e.arg_count = static_cast<uint32_t>(args.size());
                for (auto a : args) m_.args.push_back(a);
            }

            ExprId read_expr_object_(const json::Object& o, TypeId hint) {
                const Span sp = span_of_(&o);
                const TypeId t_bool = types_.builtin(ty::Builtin::kBool);
                const TypeId t_bytes = types_.builtin(ty::Builtin::kBytes);
                const TypeId t_u64 = types_.builtin(ty::Builtin::kU64);
                const TypeId t_unit = types_.builtin(ty::Builtin::kUnit);

                Expr e{};
                e.span = sp;

                if (const auto* iv = o.get("int")) {
                    TypeId t = hint;
                    if (auto tn = o.getString("type")) {
                        auto parsed = parse_type_(*tn, sp);
                        if (!parsed) return kInvalidId;
                        t = *parsed;
                    }
                    return read_int_value_(*iv, t, sp);
                }

                if (auto bytes = o.getString("bytes")) {
                    e.kind = ExprKind::kBytesLit;
                    e.type = t_bytes;
                    e.text = bytes->str();
                    return add_(e);
                }

                if (o.get("unit") != nullptr) {
                    e.kind = ExprKind::kUnitLit;
                    e.type = t_unit;
                    return add_(e);
                }

                if (auto name = o.getString("local")) {
                    const ExprId id = local_ref_(*name, sp);
                    return id;
                }

                if (auto op_text = o.getString("bin")) {
                    std::optional<BinaryOp> op;
                    for (const auto& b : kBinaryOps) {
                        if (*op_text == llvm::StringRef(b.text.data(), b.text.size())) op = b.op;
                    }
                    if (!op) {
                        malformed_(sp, "unknown binary operator '" + op_text->str() + "'");
                        return kInvalidId;
                    }
                    const auto* lv = need_(o, "l", sp);
                    const auto* rv = need_(o, "r", sp);
                    if (lv == nullptr || rv == nullptr) return kInvalidId;
                    const auto mode = read_mode_(o, sp);
                    if (!mode) return kInvalidId;

                    e.kind = ExprKind::kBinary;
                    e.op = static_cast<uint8_t>(*op);
                    e.mode = *mode;

                    if (*op == BinaryOp::kLogicalAnd || *op == BinaryOp::kLogicalOr) {
                        e.a = read_expr_(*lv, t_bool);
                        e.b = read_expr_(*rv, t_bool);
                        if (!expect_type_(e.a, t_bool, sp) || !expect_type_(e.b, t_bool, sp)) return kInvalidId;
                        e.type = t_bool;
                        return add_(e);
                    }

                    // 타입 표기 없는 리터럴 쪽은 반대편 타입을 따른다.
                    TypeId operand_hint = (is_compare_op_(*op)) ? ty::kInvalidType : hint;
                    if (*mode == ArithMode::kChecked && hint != ty::kInvalidType
                        && types_.get(hint).kind == ty::Kind::kResult) {
                        operand_hint = types_.get(hint).elem;
                    }
                    if (is_untyped_literal_(*lv) && !is_untyped_literal_(*rv)) {
                        e.b = read_expr_(*rv, operand_hint);
                        e.a = read_expr_(*lv, expr_type_(e.b));
                    } else {
                        e.a = read_expr_(*lv, operand_hint);
                        e.b = read_expr_(*rv, expr_type_(e.a));
                    }
                    if (e.a == kInvalidId || e.b == kInvalidId) return kInvalidId;

                    const TypeId lt = expr_type_(e.a);
                    if (!expect_type_(e.b, lt, sp)) return kInvalidId;

                    if (is_compare_op_(*op)) {
                        const bool eq_like = (*op == BinaryOp::kEq || *op == BinaryOp::kNe);
                        if (!types_.is_integer(lt) && !(eq_like && types_.is_bool(lt))) {
                            malformed_(sp, "comparison requires integer (or bool for ==/!=) operands");
                            return kInvalidId;
                        }
                        if (e.mode != ArithMode::kDefault) {
                            malformed_(sp, "comparison does not take an arithmetic mode");
                            return kInvalidId;
                        }
                        e.type = t_bool;
                        return add_(e);
                    }

                    if (!types_.is_integer(lt)) {
                        malformed_(sp, "arithmetic requires integer operands");
                        return kInvalidId;
                    }
                    if (!is_arith_op_(*op) && e.mode != ArithMode::kDefault) {
                        malformed_(sp, "bitwise operators do not take an arithmetic mode");
                        return kInvalidId;
                    }
                    e.type = (e.mode == ArithMode::kChecked) ? types_.make_result(lt) : lt;
                    return add_(e);
                }

                if (const auto* nv = o.get("neg")) {
                    const auto mode = read_mode_(o, sp);
                    if (!mode) return kInvalidId;
                    TypeId operand_hint = hint;
                    if (*mode == ArithMode::kChecked && hint != ty::kInvalidType
                        && types_.get(hint).kind == ty::Kind::kResult) {
                        operand_hint = types_.get(hint).elem;
                    }
                    e.kind = ExprKind::kUnary;
                    e.op = static_cast<uint8_t>(UnaryOp::kNeg);
                    e.mode = *mode;
                    e.a = read_expr_(*nv, operand_hint);
                    if (e.a == kInvalidId) return kInvalidId;
                    const TypeId at = expr_type_(e.a);
                    if (!types_.is_integer(at)) {
                        malformed_(sp, "negation requires an integer operand");
                        return kInvalidId;
                    }
                    e.type = (e.mode == ArithMode::kChecked) ? types_.make_result(at) : at;
                    return add_(e);
                }

                if (const auto* nv = o.get("not")) {
                    e.kind = ExprKind::kUnary;
                    e.a = read_expr_(*nv, hint);
                    if (e.a == kInvalidId) return kInvalidId;
                    const TypeId at = expr_type_(e.a);
                    if (types_.is_bool(at)) {
                        e.op = static_cast<uint8_t>(UnaryOp::kNot);
                    } else if (types_.is_integer(at)) {
                        e.op = static_cast<uint8_t>(UnaryOp::kBitNot);
                    } else {
                        malformed_(sp, "'not' requires a bool or integer operand");
                        return kInvalidId;
                    }
                    e.type = at;
                    return add_(e);
                }

                if (const auto* cv = o.get("cast")) {
                    const auto to = o.getString("to");
                    if (!to) {
                        malformed_(sp, "cast requires 'to'");
                        return kInvalidId;
                    }
                    const auto target = parse_type_(*to, sp);
                    const auto mode = read_mode_(o, sp);
                    if (!target || !mode) return kInvalidId;
                    if (*mode == ArithMode::kSaturating || *mode == ArithMode::kChecked) {
                        malformed_(sp, "cast mode must be trap or wrap");
                        return kInvalidId;
                    }
                    e.kind = ExprKind::kCast;
                    e.mode = *mode;
                    e.a = read_expr_(*cv, ty::kInvalidType);
                    if (e.a == kInvalidId) return kInvalidId;
                    if (!types_.is_integer(expr_type_(e.a)) || !types_.is_integer(*target)) {
                        malformed_(sp, "cast requires integer source and target");
                        return kInvalidId;
                    }
                    e.type = *target;
                    return add_(e);
                }

                if (auto callee = o.getString("call")) {
                    const FuncId fid = m_.find_func(*callee);
                    if (fid == kInvalidId) {
                        report_(diag::Code::kHirUnknownName, sp, {*callee});
                        return kInvalidId;
                    }
                    const auto& f = m_.funcs[fid];
                    const auto* arr = o.getArray("args");
                    const size_t argc = arr ? arr->size() : 0;
                    if (argc != f.param_count) {
                        report_(diag::Code::kHirArgCountMismatch, sp,
                                {f.name, std::to_string(f.param_count), std::to_string(argc)});
                        return kInvalidId;
                    }

                    std::vector<TypeId> hints;
                    for (uint32_t i = 0; i < f.param_count; ++i) hints.push_back(m_.param(f, i).type);

                    std::vector<ExprId> args;
                    if (arr != nullptr && !read_args_(*arr, hints, args)) return kInvalidId;

                    for (uint32_t i = 0; i < f.param_count; ++i) {
                        const auto& p = m_.params[m_.funcs[fid].param_begin + i];
                        if (!expect_type_(args[i], p.type, sp)) return kInvalidId;
                        if (p.pass == PassMode::kMut && m_.exprs[args[i]].kind != ExprKind::kLocal) {
                            report_(diag::Code::kHirNotAPlace, m_.exprs[args[i]].span, {p.name});
                            return kInvalidId;
                        }
                    }

                    e.kind = ExprKind::kCall;
                    e.callee = fid;
                    e.type = m_.funcs[fid].ret;
                    store_args_(e, args);
                    return add_(e);
                }

                if (const auto* bv = o.get("field")) {
                    const auto fname = o.getString("name");
                    if (!fname) {
                        malformed_(sp, "field access requires 'name'");
                        return kInvalidId;
                    }
                    e.kind = ExprKind::kField;
                    e.a = read_expr_(*bv, ty::kInvalidType);
                    if (e.a == kInvalidId) return kInvalidId;
                    const auto* decl = types_.struct_decl(expr_type_(e.a));
                    if (decl == nullptr) {
                        malformed_(sp, "field access on a non-struct value");
                        return kInvalidId;
                    }
                    for (uint32_t i = 0; i < decl->fields.size(); ++i) {
                        if (decl->fields[i].name == *fname) {
                            e.field_index = i;
                            e.text = fname->str();
                            e.type = decl->fields[i].type;
                            return add_(e);
                        }
                    }
                    report_(diag::Code::kHirUnknownName, sp, {*fname});
                    return kInvalidId;
                }

                if (auto sname = o.getString("struct")) {
                    const TypeId st = types_.find_struct(*sname);
                    if (st == ty::kInvalidType) {
                        report_(diag::Code::kHirUnknownType, sp, {*sname});
                        return kInvalidId;
                    }
                    const auto* decl = types_.struct_decl(st);
                    const auto* arr = o.getArray("fields");
                    const size_t n = arr ? arr->size() : 0;
                    if (n != decl->fields.size()) {
                        report_(diag::Code::kHirArgCountMismatch, sp,
                                {*sname, std::to_string(decl->fields.size()), std::to_string(n)});
                        return kInvalidId;
                    }
                    std::vector<TypeId> hints;
                    for (const auto& fd : decl->fields) hints.push_back(fd.type);
                    std::vector<ExprId> fields;
                    if (arr != nullptr && !read_args_(*arr, hints, fields)) return kInvalidId;
                    for (size_t i = 0; i < fields.size(); ++i) {
                        if (!expect_type_(fields[i], hints[i], sp)) return kInvalidId;
                    }
                    e.kind = ExprKind::kStructLit;
                    e.type = st;
                    store_args_(e, fields);
                    return add_(e);
                }

                if (const auto* cv = o.get("select")) {
                    const auto* tv = need_(o, "then", sp);
                    const auto* ev = need_(o, "else", sp);
                    if (tv == nullptr || ev == nullptr) return kInvalidId;
                    e.kind = ExprKind::kSelect;
                    e.a = read_expr_(*cv, t_bool);
                    if (!expect_type_(e.a, t_bool, sp)) return kInvalidId;
                    if (is_untyped_literal_(*tv) && !is_untyped_literal_(*ev)) {
                        e.c = read_expr_(*ev, hint);
                        e.b = read_expr_(*tv, expr_type_(e.c));
                    } else {
                        e.b = read_expr_(*tv, hint);
                        e.c = read_expr_(*ev, expr_type_(e.b));
                    }
                    if (e.b == kInvalidId || e.c == kInvalidId) return kInvalidId;
                    if (!expect_type_(e.c, expr_type_(e.b), sp)) return kInvalidId;
                    e.type = expr_type_(e.b);
                    return add_(e);
                }

                if (o.get("get") != nullptr) {
                    auto ns = read_namespace_(o, "get", sp);
                    if (!ns) return kInvalidId;
                    TypeId vt = ty::kInvalidType;
                    if (auto tn = o.getString("type")) {
                        auto parsed = parse_type_(*tn, sp);
                        if (!parsed) return kInvalidId;
                        vt = *parsed;
                    } else if (hint != ty::kInvalidType && types_.get(hint).kind == ty::Kind::kResult) {
                        vt = types_.get(hint).elem;
                    }
                    if (vt == ty::kInvalidType || !types_.is_state_value(vt)) {
                        malformed_(sp, "state value type must be an integer, bool or bytes");
                        return kInvalidId;
                    }
                    e.kind = ExprKind::kStateGet;
                    e.text = *ns;
                    e.a = read_state_key_(o, sp);
                    if (e.a == kInvalidId) return kInvalidId;
                    e.type = types_.make_result(vt);
                    return add_(e);
                }

                if (o.get("put") != nullptr) {
                    auto ns = read_namespace_(o, "put", sp);
                    if (!ns) return kInvalidId;
                    const auto* vv = need_(o, "value", sp);
                    if (vv == nullptr) return kInvalidId;
                    e.kind = ExprKind::kStatePut;
                    e.text = *ns;
                    e.a = read_state_key_(o, sp);
                    if (e.a == kInvalidId) return kInvalidId;
                    e.b = read_expr_(*vv, ty::kInvalidType);
                    if (e.b == kInvalidId) return kInvalidId;
                    if (!types_.is_state_value(expr_type_(e.b))) {
                        malformed_(sp, "state value type must be an integer, bool or bytes");
                        return kInvalidId;
                    }
                    e.type = t_unit;
                    return add_(e);
                }

                if (o.get("has") != nullptr) {
                    auto ns = read_namespace_(o, "has", sp);
                    if (!ns) return kInvalidId;
                    e.kind = ExprKind::kStateHas;
                    e.text = *ns;
                    e.a = read_state_key_(o, sp);
                    if (e.a == kInvalidId) return kInvalidId;
                    e.type = t_bool;
                    return add_(e);
                }

                if (auto q = o.getString("ctx")) {
                    e.kind = ExprKind::kContext;
                    if (*q == "caller") { e.ctx = ContextKind::kCaller; e.type = t_bytes; }
                    else if (*q == "self") { e.ctx = ContextKind::kSelf; e.type = t_bytes; }
                    else if (*q == "block_height") { e.ctx = ContextKind::kBlockHeight; e.type = t_u64; }
                    else if (*q == "timestamp") { e.ctx = ContextKind::kTimestamp; e.type = t_u64; }
                    else if (*q == "call_value") { e.ctx = ContextKind::kCallValue; e.type = t_u64; }
                    else {
                        malformed_(sp, "unknown context query '" + q->str() + "'");
                        return kInvalidId;
                    }
                    return add_(e);
                }

                if (const auto* dv = o.get("digest")) {
                    e.kind = ExprKind::kDigest;
                    e.a = read_expr_(*dv, t_bytes);
                    if (!expect_type_(e.a, t_bytes, sp)) return kInvalidId;
                    e.type = t_bytes;
                    return add_(e);
                }

                if (const auto* lv = o.get("len")) {
                    e.kind = ExprKind::kBytesLen;
                    e.a = read_expr_(*lv, t_bytes);
                    if (!expect_type_(e.a, t_bytes, sp)) return kInvalidId;
                    e.type = t_u64;
                    return add_(e);
                }

                if (auto topic = o.getString("emit")) {
                    e.kind = ExprKind::kEmit;
                    e.text = topic->str();
                    std::vector<ExprId> args;
                    if (const auto* arr = o.getArray("args")) {
                        if (!read_args_(*arr, {}, args)) return kInvalidId;
                    }
                    for (auto a : args) {
                        if (!types_.is_state_value(expr_type_(a))) {
                            malformed_(sp, "event payload must be integers, bools or bytes");
                            return kInvalidId;
                        }
                    }
                    e.type = t_unit;
                    store_args_(e, args);
                    return add_(e);
                }

                struct ResultUnary {
                    std::string_view key;
                    ExprKind kind;
                };
                static constexpr ResultUnary kResultOps[] = {
                    {"is_ok", ExprKind::kIsOk},
                    {"unwrap", ExprKind::kUnwrap},
                    {"code", ExprKind::kResultCode},
                };
                for (const auto& r : kResultOps) {
                    const auto* rv = o.get(llvm::StringRef(r.key.data(), r.key.size()));
                    if (rv == nullptr) continue;
                    e.kind = r.kind;
                    e.a = read_expr_(*rv, ty::kInvalidType);
                    if (e.a == kInvalidId) return kInvalidId;
                    const TypeId rt = expr_type_(e.a);
                    if (types_.get(rt).kind != ty::Kind::kResult) {
                        malformed_(sp, "operand must be a result value");
                        return kInvalidId;
                    }
                    switch (r.kind) {
                        case ExprKind::kIsOk: e.type = t_bool; break;
                        case ExprKind::kUnwrap: e.type = types_.get(rt).elem; break;
                        default: e.type = types_.builtin(ty::Builtin::kI32); break;
                    }
                    return add_(e);
                }

                if (const auto* pv = o.get("ok")) {
                    TypeId elem = ty::kInvalidType;
                    if (hint != ty::kInvalidType && types_.get(hint).kind == ty::Kind::kResult) {
                        elem = types_.get(hint).elem;
                    }
                    e.kind = ExprKind::kResultOk;
                    e.a = read_expr_(*pv, elem);
                    if (e.a == kInvalidId) return kInvalidId;
                    e.type = types_.make_result(expr_type_(e.a));
                    return add_(e);
                }

                if (const auto* cv = o.get("err")) {
                    TypeId rt = hint;
                    if (auto tn = o.getString("type")) {
                        auto parsed = parse_type_(*tn, sp);
                        if (!parsed) return kInvalidId;
                        rt = types_.make_result(*parsed);
                    }
                    if (rt == ty::kInvalidType || types_.get(rt).kind != ty::Kind::kResult) {
                        malformed_(sp, "'err' requires a result type");
                        return kInvalidId;
                    }
                    const TypeId t_i32 = types_.builtin(ty::Builtin::kI32);
                    e.kind = ExprKind::kResultErr;
                    e.a = read_expr_(*cv, t_i32);
                    if (!expect_type_(e.a, t_i32, sp)) return kInvalidId;
                    e.type = rt;
                    return add_(e);
                }

                malformed_(sp, "unknown expression form");
                return kInvalidId;
            }

            Module& m_;
            ty::TypePool& types_;
            diag::Bag& bag_;
            uint32_t file_id_ = 0;
            bool failed_ = false;

            std::vector<std::pair<std::string, SymbolId>> scope_;
            std::vector<size_t> scope_marks_;

            FuncId cur_fn_ = kInvalidId;
            TypeId cur_ret_ = ty::kInvalidType;
            uint32_t loop_depth_ = 0;
        };

    } // namespace

    ReadResult read_module_json(
        std::string_view json_text,
        std::string_view doc_name,
        Module& out,
        ty::TypePool& types,
        SourceManager& sm,
        diag::Bag& bag
    ) {
        ReadResult rr{};

        auto parsed = json::parse(llvm::StringRef(json_text.data(), json_text.size()));
        if (!parsed) {
            rr.file_id = sm.add(std::string(doc_name), std::string(json_text));
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kHirMalformed, Span{rr.file_id, 0, 0});
            d.add_arg(llvm::toString(parsed.takeError()));
            bag.add(std::move(d));
            return rr;
        }

        const auto* root = parsed->getAsObject();
        if (root == nullptr) {
            rr.file_id = sm.add(std::string(doc_name), std::string(json_text));
            diag::Diagnostic d(diag::Severity::kError, diag::Code::kHirMalformed, Span{rr.file_id, 0, 0});
            d.add_arg("top level must be an object");
            bag.add(std::move(d));
            return rr;
        }

        // span은 원본 계약 소스 기준이다. 없으면 이름만 가진 빈 파일을 둔다.
        std::string src_name(doc_name);
        std::string src_text;
        if (const auto* src = root->getObject("source")) {
            if (auto n = src->getString("name")) src_name = n->str();
            if (auto t = src->getString("text")) src_text = t->str();
        }
        rr.file_id = sm.add(std::move(src_name), std::move(src_text));

        Reader r(out, types, bag, rr.file_id);
        rr.ok = r.run(*root);
        return rr;
    }

} // namespace vellum::hir
