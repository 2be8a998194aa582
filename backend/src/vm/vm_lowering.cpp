// backend/src/vm/vm_lowering.cpp
#include <vellum/backend/host/HostInterface.hpp>
#include <vellum/backend/vm/Stackify.hpp>
#include <vellum/backend/vm/VmBackend.hpp>
#include <vellum/domain/DomainKey.hpp>
#include <vellum/ssa/Fold.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>


namespace vellum::backend::vm {

    namespace {

        using ssa::BlockId;
        using ssa::ValueId;
        using ssa::kInvalidId;

        constexpr uint32_t kUnbound = 0xFFFF'FFFFu;

        constexpr std::string_view kMsgOverflow = "arithmetic overflow";
        constexpr std::string_view kMsgUnwrap = "unwrap of err result";
        constexpr std::string_view kMsgHostFailure = "host call failed";

        uint64_t align8_(uint64_t n) { return (n + 7) & ~uint64_t{7}; }

        std::string encode_word_(uint64_t w) {
            std::string s(8, '\0');
            for (int i = 0; i < 8; ++i) s[i] = static_cast<char>((w >> (8 * i)) & 0xFF);
            return s;
        }

        uint64_t word_of_(int64_t v) { return static_cast<uint64_t>(v); }

        /// @brief 상수 데이터 세그먼트. 주소 0..7은 heap top 워드 자리다.
        class DataLayout final {
        public:
            explicit DataLayout(uint64_t limit) : limit_(limit) {}

            /// @brief 같은 바이트열은 한 번만 배치한다. 한도를 넘으면 false.
            bool add(const std::string& bytes, uint64_t& offset) {
                auto it = index_.find(bytes);
                if (it != index_.end()) {
                    offset = it->second;
                    return true;
                }
                if (used_ + bytes.size() > limit_) return false;

                offset = next_;
                segs_.push_back(DataSegment{offset, bytes});
                index_.emplace(bytes, offset);
                used_ += bytes.size();
                next_ = align8_(next_ + bytes.size());
                return true;
            }

            uint64_t end() const { return next_; }
            std::vector<DataSegment>& segments() { return segs_; }

        private:
            uint64_t limit_;
            uint64_t used_ = 0;
            uint64_t next_ = 8;
            std::vector<DataSegment> segs_;
            std::unordered_map<std::string, uint64_t> index_;
        };

        /// @brief lowering helper가 스택에 올릴 것: SSA 값, 즉시값, 임시 slot.
        struct Operand {
            enum class Kind : uint8_t { kValue, kImm, kSlot };
            Kind kind = Kind::kImm;
            ValueId v = kInvalidId;
            uint64_t imm = 0;
            uint32_t slot = kNoSlot;

            static Operand value(ValueId v) { return Operand{Kind::kValue, v, 0, kNoSlot}; }
            static Operand immediate(uint64_t x) { return Operand{Kind::kImm, kInvalidId, x, kNoSlot}; }
            static Operand local(uint32_t s) { return Operand{Kind::kSlot, kInvalidId, 0, s}; }
        };

        /// @brief host 인자 하나. (first, second)는 (offset, length|capacity) 쌍이다.
        struct HostArg {
            host::ArgShape shape = host::ArgShape::kWord;
            Operand first{};
            Operand second{};
        };

        struct LoweredFunction {
            bool ok = false;
            Function fn{};
            meta::FunctionGas gas{};
            std::vector<ssa::FuncId> callees{};
            std::vector<host::HostOp> host_ops{};
            uint32_t stack_values = 0;
        };

        class FunctionLowerer final {
        public:
            FunctionLowerer(
                const ssa::Module& m,
                const ty::TypePool& types,
                ssa::FuncId fid,
                const std::string& unit,
                DataLayout& data,
                const CompileOptions& opt,
                diag::Bag& bag
            ) : m_(m),
                types_(types),
                fid_(fid),
                f_(m.funcs[fid]),
                unit_(unit),
                data_(data),
                opt_(opt),
                bag_(bag) {}

            bool lower(LoweredFunction& out) {
                plan_ = plan_slots(m_, f_);
                depth_ = meta::loop_depths(m_, f_);

                for (auto bb : f_.blocks) block_label_[bb] = new_label_();

                // 1) 블록 순서대로 명령과 terminator를 내린다.
                for (size_t i = 0; i < f_.blocks.size(); ++i) {
                    const BlockId bb = f_.blocks[i];
                    next_block_ = (i + 1 < f_.blocks.size()) ? f_.blocks[i + 1] : kInvalidId;
                    weight_ = meta::loop_weight(opt_.gas, depth_[bb]);

                    bind_(block_label_[bb]);
                    const auto& b = m_.blocks[bb];
                    for (auto iid : b.insts) {
                        scratch_next_ = 0;
                        lower_inst_(m_.insts[iid]);
                    }
                    scratch_next_ = 0;
                    if (b.has_term) lower_term_(b.term);
                    else emit_(Op::kTrap, static_cast<uint64_t>(TrapCode::kUnreachable));
                }

                // 2) 공유 실패 경로
                counting_ = false;
                emit_handler_(ovf_label_, kMsgOverflow);
                emit_handler_(unwrap_label_, kMsgUnwrap);
                emit_handler_(host_fail_label_, kMsgHostFailure);

                // 3) 점프 대상 확정
                for (const auto& fx : fixups_) {
                    code_[fx.first].imm = labels_[fx.second];
                }

                const uint64_t locals = (uint64_t)plan_.num_slots + scratch_max_;
                if (locals > opt_.max_locals) {
                    diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kBackendTooManyLocals, f_.span);
                    d.add_arg(f_.name);
                    d.add_arg_int((int64_t)locals);
                    d.add_arg_int((int64_t)opt_.max_locals);
                    bag_.add(std::move(d));
                    ok_ = false;
                }

                out.fn.name = f_.name;
                out.fn.num_params = static_cast<uint32_t>(f_.param_tys.size());
                out.fn.num_locals = static_cast<uint32_t>(locals);
                out.fn.has_result = !types_.is_unit(f_.ret_ty);
                out.fn.code = std::move(code_);
                out.gas.present = ok_;
                out.gas.local = gas_local_;
                out.gas.calls = std::move(calls_);
                out.callees = std::move(callees_);
                out.host_ops = std::move(host_ops_);
                out.stack_values = plan_.stack_values;
                out.ok = ok_;
                return ok_;
            }

        private:
            // ---- code emission ----
            void emit_(Op op, uint64_t imm = 0) {
                code_.push_back(Instr{op, imm});
                if (counting_) gas_local_ += meta::op_cost(opt_.gas, op) * weight_;
            }

            uint32_t new_label_() {
                labels_.push_back(kUnbound);
                return static_cast<uint32_t>(labels_.size() - 1);
            }

            void bind_(uint32_t label) {
                labels_[label] = static_cast<uint32_t>(code_.size());
            }

            void jump_(Op op, uint32_t label) {
                fixups_.emplace_back(code_.size(), label);
                emit_(op, 0);
            }

            uint32_t tmp_() {
                const uint32_t s = plan_.num_slots + scratch_next_++;
                scratch_max_ = std::max(scratch_max_, scratch_next_);
                return s;
            }

            uint32_t lazy_label_(uint32_t& label) {
                if (label == kUnbound) label = new_label_();
                return label;
            }

            // ---- diagnostics ----
            void unsupported_(std::string_view what) {
                diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kBackendUnsupported, f_.span);
                d.add_arg(f_.name);
                d.add_arg(what);
                bag_.add(std::move(d));
                ok_ = false;
            }

            void too_large_(std::string_view what, uint64_t size, uint64_t limit, Span sp) {
                diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kBackendValueTooLarge, sp);
                d.add_arg(f_.name);
                d.add_arg(what);
                d.add_arg_int((int64_t)size);
                d.add_arg_int((int64_t)limit);
                bag_.add(std::move(d));
                ok_ = false;
            }

            uint64_t data_addr_(const std::string& bytes, std::string_view what, Span sp) {
                uint64_t off = 0;
                if (!data_.add(bytes, off)) {
                    too_large_(what, bytes.size(), opt_.max_data_bytes, sp);
                    return 0;
                }
                return off;
            }

            // ---- types ----
            ty::IntKind kind_(ValueId v) const {
                return ssa::int_kind_of(types_, m_.values[v].ty);
            }

            bool is_bytes_(ValueId v) const {
                return types_.is_bytes(m_.values[v].ty);
            }

            void normalize_(ty::IntKind k) {
                if (k.bits == 0 || k.bits >= 64) return;
                emit_(k.is_signed ? Op::kSext : Op::kZext, k.bits);
            }

            // ---- values ----
            uint64_t const_word_(ValueId v) {
                const auto& inst = m_.insts[m_.values[v].def_a];
                if (const auto* ci = std::get_if<ssa::InstConstInt>(&inst.data)) return ci->bits;
                if (const auto* cb = std::get_if<ssa::InstConstBool>(&inst.data)) return cb->value ? 1 : 0;
                if (const auto* cs = std::get_if<ssa::InstConstBytes>(&inst.data)) {
                    // bytes 상수: [len][data]
                    return data_addr_(encode_word_(cs->bytes.size()) + cs->bytes, "bytes constant", inst.span);
                }
                unsupported_("non-constant value marked as constant");
                return 0;
            }

            void push_value_(ValueId v) {
                if (v == kInvalidId || (size_t)v >= plan_.home.size()) {
                    unsupported_("invalid operand");
                    emit_(Op::kConst, 0);
                    return;
                }
                switch (plan_.home[v]) {
                    case ValueHome::kConst:
                        emit_(Op::kConst, const_word_(v));
                        return;
                    case ValueHome::kStack:
                        return;   // 직전 명령이 스택에 남겼다
                    case ValueHome::kLocal:
                        emit_(Op::kLocalGet, plan_.slot[v]);
                        return;
                    case ValueHome::kNone:
                        break;
                }
                unsupported_("operand without a home slot");
                emit_(Op::kConst, 0);
            }

            void push_(const Operand& o) {
                switch (o.kind) {
                    case Operand::Kind::kValue: push_value_(o.v); return;
                    case Operand::Kind::kImm: emit_(Op::kConst, o.imm); return;
                    case Operand::Kind::kSlot: emit_(Op::kLocalGet, o.slot); return;
                }
            }

            /// @brief 스택 top의 결과를 값의 home에 둔다.
            void def_(ValueId r) {
                if (r == kInvalidId) return;
                switch (plan_.home[r]) {
                    case ValueHome::kStack:
                        return;
                    case ValueHome::kLocal:
                        emit_(Op::kLocalSet, plan_.slot[r]);
                        return;
                    case ValueHome::kNone:
                    case ValueHome::kConst:
                        emit_(Op::kDrop);
                        return;
                }
            }

            // ---- memory ----
            /// @brief [] -> [addr]. heap top(주소 0)을 size만큼 올린다.
            void alloc_const_(uint64_t size) {
                const uint32_t t = tmp_();
                emit_(Op::kConst, 0);
                emit_(Op::kLoad);
                emit_(Op::kLocalSet, t);
                emit_(Op::kConst, 0);
                emit_(Op::kLocalGet, t);
                emit_(Op::kConst, align8_(size == 0 ? 8 : size));
                emit_(Op::kAdd);
                emit_(Op::kStore);
                emit_(Op::kLocalGet, t);
            }

            /// @brief [] -> [addr]. 크기는 slot에 있다.
            void alloc_dyn_(uint32_t size_slot) {
                const uint32_t t = tmp_();
                emit_(Op::kConst, 0);
                emit_(Op::kLoad);
                emit_(Op::kLocalSet, t);
                emit_(Op::kConst, 0);
                emit_(Op::kLocalGet, t);
                emit_(Op::kLocalGet, size_slot);
                emit_(Op::kConst, 7);
                emit_(Op::kAdd);
                emit_(Op::kConst, ~uint64_t{7});
                emit_(Op::kAnd);
                emit_(Op::kAdd);
                emit_(Op::kStore);
                emit_(Op::kLocalGet, t);
            }

            /// @brief 새 블록을 할당해 slot에 둔다.
            uint32_t alloc_into_(uint64_t size) {
                const uint32_t p = tmp_();
                alloc_const_(size);
                emit_(Op::kLocalSet, p);
                return p;
            }

            /// @brief [cond] -> [a 또는 b]
            void select_(uint64_t if_true, uint64_t if_false) {
                const uint32_t l_false = new_label_();
                const uint32_t l_end = new_label_();
                jump_(Op::kJmpIfNot, l_false);
                emit_(Op::kConst, if_true);
                jump_(Op::kJmp, l_end);
                bind_(l_false);
                emit_(Op::kConst, if_false);
                bind_(l_end);
            }

            // ---- host boundary ----
            /// @brief 테이블에 적힌 모양대로 인자를 올리고 host를 부른다.
            void host_call_(host::HostOp op, const std::vector<HostArg>& args, uint32_t status_slot) {
                const auto ref = host::lookup(op);
                if (ref.module == nullptr) {
                    unsupported_("host capability missing from interface table");
                    return;
                }
                const auto& fn = *ref.fn;
                if (args.size() != fn.args.size()) {
                    unsupported_("host call arity does not match interface table");
                    return;
                }
                for (size_t i = 0; i < args.size(); ++i) {
                    if (args[i].shape != fn.args[i]) {
                        unsupported_("host call argument shape does not match interface table");
                        return;
                    }
                    push_(args[i].first);
                    if (args[i].shape == host::ArgShape::kInPtrLen || args[i].shape == host::ArgShape::kOutPtrCap) {
                        push_(args[i].second);
                    }
                }

                emit_(Op::kCallHost, static_cast<uint64_t>(op));
                if (counting_) gas_local_ += fn.gas_base * weight_;
                if (std::find(host_ops_.begin(), host_ops_.end(), op) == host_ops_.end()) host_ops_.push_back(op);

                if (fn.ret == host::RetShape::kNoReturn) {
                    emit_(Op::kTrap, static_cast<uint64_t>(TrapCode::kUnreachable));
                    return;
                }
                if (status_slot != kNoSlot) emit_(Op::kLocalSet, status_slot);
                else emit_(Op::kDrop);
            }

            /// @brief 음수 상태 코드를 abort로 승격한다.
            void escalate_(uint32_t status_slot) {
                emit_(Op::kLocalGet, status_slot);
                emit_(Op::kConst, 0);
                emit_(Op::kLtS);
                jump_(Op::kJmpIf, lazy_label_(host_fail_label_));
            }

            void abort_(host::HostOp op, std::string_view msg, Span sp) {
                const std::string text(msg);
                const uint64_t addr = data_addr_(text, "message", sp);
                host_call_(op, {HostArg{host::ArgShape::kInPtrLen, Operand::immediate(addr),
                                        Operand::immediate(text.size())}}, kNoSlot);
            }

            /// @brief 상수 키면 manifest와 같은 규칙으로 적은 키 문자열을 돌려준다.
            bool const_key_text_(ValueId key, std::string& out) const {
                if (key == kInvalidId || (size_t)key >= plan_.home.size()) return false;
                if (plan_.home[key] != ValueHome::kConst) return false;
                const auto& inst = m_.insts[m_.values[key].def_a];
                if (const auto* ci = std::get_if<ssa::InstConstInt>(&inst.data)) {
                    out = domain::render_int_key(ci->bits, kind_(key).is_signed);
                    return true;
                }
                if (const auto* cs = std::get_if<ssa::InstConstBytes>(&inst.data)) {
                    out = domain::render_bytes_key(cs->bytes);
                    return true;
                }
                return false;
            }

            HostArg domain_arg_(const std::string& ns, ValueId key, Span sp) {
                const auto wk = domain::make_wildcard(unit_, ns);
                std::string bytes(wk.hash.begin(), wk.hash.end());
                std::string text;
                if (const_key_text_(key, text)) {
                    const auto dk = domain::make_key(unit_, ns, text);
                    bytes.append(dk.hash.begin(), dk.hash.end());
                } else {
                    bytes.append(host::kDomainArgLen - bytes.size(), '\0');
                }
                const uint64_t addr = data_addr_(bytes, "domain descriptor", sp);
                return HostArg{host::ArgShape::kInPtrLen, Operand::immediate(addr), Operand::immediate(bytes.size())};
            }

            /// @brief 키/값을 (offset, length) 버퍼로 만든다. 정수는 8바이트 LE 워드.
            HostArg buffer_arg_(ValueId v) {
                if (is_bytes_(v)) {
                    const uint32_t p = tmp_();
                    const uint32_t l = tmp_();
                    push_value_(v);
                    emit_(Op::kConst, 8);
                    emit_(Op::kAdd);
                    emit_(Op::kLocalSet, p);
                    push_value_(v);
                    emit_(Op::kLoad);
                    emit_(Op::kLocalSet, l);
                    return HostArg{host::ArgShape::kInPtrLen, Operand::local(p), Operand::local(l)};
                }
                const uint32_t p = alloc_into_(8);
                emit_(Op::kLocalGet, p);
                push_value_(v);
                emit_(Op::kStore);
                return HostArg{host::ArgShape::kInPtrLen, Operand::local(p), Operand::immediate(8)};
            }

            /// @brief 크기를 먼저 묻고 [len][data] 버퍼에 다시 읽는 read 계열 호출.
            /// 결과 주소를 담은 slot을 돌려준다.
            uint32_t read_bytes_(host::HostOp op, const std::vector<HostArg>& prefix, uint32_t size_slot) {
                const uint32_t sz = tmp_();
                emit_(Op::kLocalGet, size_slot);
                emit_(Op::kConst, 8);
                emit_(Op::kAdd);
                emit_(Op::kLocalSet, sz);

                const uint32_t b = tmp_();
                alloc_dyn_(sz);
                emit_(Op::kLocalSet, b);
                emit_(Op::kLocalGet, b);
                emit_(Op::kLocalGet, size_slot);
                emit_(Op::kStore);

                const uint32_t bp = tmp_();
                emit_(Op::kLocalGet, b);
                emit_(Op::kConst, 8);
                emit_(Op::kAdd);
                emit_(Op::kLocalSet, bp);

                std::vector<HostArg> args = prefix;
                args.push_back(HostArg{host::ArgShape::kOutPtrCap, Operand::local(bp), Operand::local(size_slot)});
                const uint32_t s2 = tmp_();
                host_call_(op, args, s2);
                escalate_(s2);
                return b;
            }

            // ---- arithmetic ----
            Op cmp_op_(ssa::BinOp op, bool is_signed) const {
                switch (op) {
                    case ssa::BinOp::Eq: return Op::kEq;
                    case ssa::BinOp::Ne: return Op::kNe;
                    case ssa::BinOp::Lt: return is_signed ? Op::kLtS : Op::kLtU;
                    case ssa::BinOp::Le: return is_signed ? Op::kLeS : Op::kLeU;
                    case ssa::BinOp::Gt: return is_signed ? Op::kGtS : Op::kGtU;
                    case ssa::BinOp::Ge: return is_signed ? Op::kGeS : Op::kGeU;
                    default: return Op::kEq;
                }
            }

            Op raw_op_(ssa::BinOp op, bool is_signed) const {
                switch (op) {
                    case ssa::BinOp::Add: return Op::kAdd;
                    case ssa::BinOp::Sub: return Op::kSub;
                    case ssa::BinOp::Mul: return Op::kMul;
                    case ssa::BinOp::Div: return is_signed ? Op::kDivS : Op::kDivU;
                    case ssa::BinOp::Rem: return is_signed ? Op::kRemS : Op::kRemU;
                    case ssa::BinOp::Shl: return Op::kShl;
                    case ssa::BinOp::Shr: return is_signed ? Op::kShrS : Op::kShrU;
                    case ssa::BinOp::And: return Op::kAnd;
                    case ssa::BinOp::Or: return Op::kOr;
                    case ssa::BinOp::Xor: return Op::kXor;
                    default: return Op::kNop;
                }
            }

            /// @brief 래핑 결과를 r, 실제 overflow 여부(0/1)를 o에 둔다.
            ///
            /// checked면 0으로 나누기도 o=1로 보고 나눗셈을 건너뛴다.
            /// 그 밖의 모드에서 0으로 나누기는 네이티브 trap에 맡긴다.
            void arith_core_(ssa::BinOp op, bool checked, ty::IntKind k,
                             const Operand& a, const Operand& b, uint32_t r, uint32_t o) {
                switch (op) {
                    case ssa::BinOp::Add:
                    case ssa::BinOp::Sub:
                    case ssa::BinOp::Mul: {
                        if (k.bits < 64) {
                            // 좁은 타입은 64비트에서 정확하다: 정규화해서 달라지면 overflow.
                            const uint32_t t = tmp_();
                            push_(a);
                            push_(b);
                            emit_(raw_op_(op, k.is_signed));
                            emit_(Op::kLocalTee, t);
                            normalize_(k);
                            emit_(Op::kLocalTee, r);
                            emit_(Op::kLocalGet, t);
                            emit_(Op::kNe);
                            emit_(Op::kLocalSet, o);
                            return;
                        }

                        push_(a);
                        push_(b);
                        emit_(raw_op_(op, k.is_signed));
                        emit_(Op::kLocalSet, r);

                        if (op == ssa::BinOp::Add) {
                            if (k.is_signed) {
                                // ((a ^ r) & (b ^ r)) < 0
                                push_(a);
                                emit_(Op::kLocalGet, r);
                                emit_(Op::kXor);
                                push_(b);
                                emit_(Op::kLocalGet, r);
                                emit_(Op::kXor);
                                emit_(Op::kAnd);
                                emit_(Op::kConst, 0);
                                emit_(Op::kLtS);
                            } else {
                                emit_(Op::kLocalGet, r);
                                push_(a);
                                emit_(Op::kLtU);
                            }
                            emit_(Op::kLocalSet, o);
                            return;
                        }

                        if (op == ssa::BinOp::Sub) {
                            if (k.is_signed) {
                                // ((a ^ b) & (a ^ r)) < 0
                                push_(a);
                                push_(b);
                                emit_(Op::kXor);
                                push_(a);
                                emit_(Op::kLocalGet, r);
                                emit_(Op::kXor);
                                emit_(Op::kAnd);
                                emit_(Op::kConst, 0);
                                emit_(Op::kLtS);
                            } else {
                                push_(a);
                                push_(b);
                                emit_(Op::kLtU);
                            }
                            emit_(Op::kLocalSet, o);
                            return;
                        }

                        // 64비트 곱셈: r / a != b 로 판정한다. a == -1 은 나눗셈 trap을 피해 따로 본다.
                        const uint32_t l_zero = new_label_();
                        const uint32_t l_done = new_label_();
                        if (k.is_signed) {
                            const uint32_t l_not_m1 = new_label_();
                            push_(a);
                            emit_(Op::kConst, word_of_(-1));
                            emit_(Op::kEq);
                            jump_(Op::kJmpIfNot, l_not_m1);
                            push_(b);
                            emit_(Op::kConst, word_of_(std::numeric_limits<int64_t>::min()));
                            emit_(Op::kEq);
                            emit_(Op::kLocalSet, o);
                            jump_(Op::kJmp, l_done);
                            bind_(l_not_m1);
                        }
                        push_(a);
                        emit_(Op::kEqz);
                        jump_(Op::kJmpIf, l_zero);
                        emit_(Op::kLocalGet, r);
                        push_(a);
                        emit_(k.is_signed ? Op::kDivS : Op::kDivU);
                        push_(b);
                        emit_(Op::kNe);
                        emit_(Op::kLocalSet, o);
                        jump_(Op::kJmp, l_done);
                        bind_(l_zero);
                        emit_(Op::kConst, 0);
                        emit_(Op::kLocalSet, o);
                        bind_(l_done);
                        return;
                    }

                    case ssa::BinOp::Div:
                    case ssa::BinOp::Rem: {
                        emit_(Op::kConst, 0);
                        emit_(Op::kLocalSet, o);
                        emit_(Op::kConst, 0);
                        emit_(Op::kLocalSet, r);

                        const uint32_t l_done = new_label_();
                        uint32_t l_zero = kUnbound;
                        uint32_t l_ovf = kUnbound;
                        if (checked) {
                            l_zero = new_label_();
                            push_(b);
                            emit_(Op::kEqz);
                            jump_(Op::kJmpIf, l_zero);
                        }
                        if (op == ssa::BinOp::Div && k.is_signed) {
                            // MIN / -1
                            l_ovf = new_label_();
                            push_(a);
                            emit_(Op::kConst, ty::min_word(k));
                            emit_(Op::kEq);
                            push_(b);
                            emit_(Op::kConst, word_of_(-1));
                            emit_(Op::kEq);
                            emit_(Op::kAnd);
                            jump_(Op::kJmpIf, l_ovf);
                        }
                        push_(a);
                        push_(b);
                        emit_(raw_op_(op, k.is_signed));
                        emit_(Op::kLocalSet, r);
                        jump_(Op::kJmp, l_done);

                        if (l_ovf != kUnbound) {
                            bind_(l_ovf);
                            emit_(Op::kConst, ty::min_word(k));
                            emit_(Op::kLocalSet, r);
                            emit_(Op::kConst, 1);
                            emit_(Op::kLocalSet, o);
                            jump_(Op::kJmp, l_done);
                        }
                        if (l_zero != kUnbound) {
                            bind_(l_zero);
                            emit_(Op::kConst, 1);
                            emit_(Op::kLocalSet, o);
                        }
                        bind_(l_done);
                        return;
                    }

                    case ssa::BinOp::Shl:
                    case ssa::BinOp::Shr: {
                        // 범위 밖 shift 양(음수 포함)은 overflow. 값은 마스크한 양으로 계산한다.
                        push_(b);
                        emit_(Op::kConst, k.bits);
                        emit_(Op::kGeU);
                        emit_(Op::kLocalSet, o);

                        push_(a);
                        push_(b);
                        emit_(Op::kConst, k.bits - 1);
                        emit_(Op::kAnd);
                        emit_(raw_op_(op, k.is_signed));
                        if (op == ssa::BinOp::Shl) normalize_(k);
                        emit_(Op::kLocalSet, r);
                        return;
                    }

                    default:
                        unsupported_("arithmetic operator");
                        return;
                }
            }

            /// @brief 모드별 마무리: trap은 검사, saturating은 경계값, checked는 result<T>.
            void finish_arith_(ssa::BinOp op, ssa::ArithMode mode, ty::IntKind k,
                               const Operand& a, const Operand& b, uint32_t r, uint32_t o) {
                switch (mode) {
                    case ssa::ArithMode::Trap:
                        emit_(Op::kLocalGet, o);
                        jump_(Op::kJmpIf, lazy_label_(ovf_label_));
                        emit_(Op::kLocalGet, r);
                        return;

                    case ssa::ArithMode::Wrapping:
                        emit_(Op::kLocalGet, r);
                        return;

                    case ssa::ArithMode::Saturating: {
                        if (op == ssa::BinOp::Shl || op == ssa::BinOp::Shr || op == ssa::BinOp::Rem) {
                            emit_(Op::kLocalGet, r);
                            return;
                        }
                        const uint64_t lo = ty::min_word(k);
                        const uint64_t hi = ty::max_word(k);
                        const uint32_t l_done = new_label_();
                        emit_(Op::kLocalGet, o);
                        jump_(Op::kJmpIfNot, l_done);
                        switch (op) {
                            case ssa::BinOp::Add:
                                if (!k.is_signed) {
                                    emit_(Op::kConst, hi);
                                } else {
                                    push_(b);
                                    emit_(Op::kConst, 0);
                                    emit_(Op::kLtS);
                                    select_(lo, hi);
                                }
                                break;
                            case ssa::BinOp::Sub:
                                if (!k.is_signed) {
                                    emit_(Op::kConst, lo);
                                } else {
                                    push_(b);
                                    emit_(Op::kConst, 0);
                                    emit_(Op::kLtS);
                                    select_(hi, lo);
                                }
                                break;
                            case ssa::BinOp::Mul:
                                if (!k.is_signed) {
                                    emit_(Op::kConst, hi);
                                } else {
                                    push_(a);
                                    emit_(Op::kConst, 0);
                                    emit_(Op::kLtS);
                                    push_(b);
                                    emit_(Op::kConst, 0);
                                    emit_(Op::kLtS);
                                    emit_(Op::kXor);
                                    select_(lo, hi);
                                }
                                break;
                            default:
                                emit_(Op::kConst, hi);   // MIN / -1
                                break;
                        }
                        emit_(Op::kLocalSet, r);
                        bind_(l_done);
                        emit_(Op::kLocalGet, r);
                        return;
                    }

                    case ssa::ArithMode::Checked: {
                        const uint32_t p = alloc_into_(16);
                        emit_(Op::kLocalGet, p);
                        emit_(Op::kLocalGet, o);
                        emit_(Op::kConst, word_of_(static_cast<int64_t>(ssa::Status::kArithmetic)));
                        emit_(Op::kMul);
                        emit_(Op::kStore);
                        emit_(Op::kLocalGet, p);
                        emit_(Op::kConst, 8);
                        emit_(Op::kAdd);
                        emit_(Op::kLocalGet, r);
                        emit_(Op::kStore);
                        emit_(Op::kLocalGet, p);
                        return;
                    }
                }
            }

            void lower_binop_(const ssa::Inst& inst, const ssa::InstBinOp& x) {
                const auto k = kind_(x.lhs);
                if (k.bits == 0) {
                    unsupported_("non-integer arithmetic operand");
                    return;
                }

                if (ssa::is_compare(x.op)) {
                    push_value_(x.lhs);
                    push_value_(x.rhs);
                    emit_(cmp_op_(x.op, k.is_signed));
                    def_(inst.result);
                    return;
                }
                if (ssa::is_bitwise(x.op)) {
                    push_value_(x.lhs);
                    push_value_(x.rhs);
                    emit_(raw_op_(x.op, k.is_signed));
                    def_(inst.result);
                    return;
                }

                // lhs를 스택에서 바로 쓰는 단순 경로(검사 없음)
                if (stack_operand(inst) == x.lhs) {
                    push_value_(x.lhs);
                    push_value_(x.rhs);
                    if (x.op == ssa::BinOp::Shl || x.op == ssa::BinOp::Shr) {
                        emit_(Op::kConst, k.bits - 1);
                        emit_(Op::kAnd);
                    }
                    emit_(raw_op_(x.op, k.is_signed));
                    if (x.op != ssa::BinOp::Rem && x.op != ssa::BinOp::Shr) normalize_(k);
                    def_(inst.result);
                    return;
                }

                const uint32_t r = tmp_();
                const uint32_t o = tmp_();
                const Operand a = Operand::value(x.lhs);
                const Operand b = Operand::value(x.rhs);
                arith_core_(x.op, x.mode == ssa::ArithMode::Checked, k, a, b, r, o);
                finish_arith_(x.op, x.mode, k, a, b, r, o);
                def_(inst.result);
            }

            void lower_unary_(const ssa::Inst& inst, const ssa::InstUnary& x) {
                const auto k = kind_(x.src);
                switch (x.op) {
                    case ssa::UnOp::Not:
                        push_value_(x.src);
                        emit_(Op::kConst, 1);
                        emit_(Op::kXor);
                        def_(inst.result);
                        return;
                    case ssa::UnOp::BitNot:
                        push_value_(x.src);
                        emit_(Op::kConst, ~uint64_t{0});
                        emit_(Op::kXor);
                        normalize_(k);
                        def_(inst.result);
                        return;
                    case ssa::UnOp::Neg: {
                        const uint32_t r = tmp_();
                        const uint32_t o = tmp_();
                        const Operand a = Operand::immediate(0);
                        const Operand b = Operand::value(x.src);
                        arith_core_(ssa::BinOp::Sub, x.mode == ssa::ArithMode::Checked, k, a, b, r, o);
                        finish_arith_(ssa::BinOp::Sub, x.mode, k, a, b, r, o);
                        def_(inst.result);
                        return;
                    }
                }
            }

            void lower_cast_(const ssa::Inst& inst, const ssa::InstCast& x) {
                const auto from = kind_(x.src);
                const auto to = ssa::int_kind_of(types_, x.to);
                if (from.bits == 0 || to.bits == 0) {
                    unsupported_("non-integer cast");
                    return;
                }

                if (x.mode == ssa::CastMode::Trap) {
                    const bool from_u64 = !from.is_signed && from.bits >= 64;
                    const bool to_u64 = !to.is_signed && to.bits >= 64;
                    const uint32_t ovf = lazy_label_(ovf_label_);
                    if (to_u64) {
                        if (from.is_signed) {
                            push_value_(x.src);
                            emit_(Op::kConst, 0);
                            emit_(Op::kLtS);
                            jump_(Op::kJmpIf, ovf);
                        }
                    } else {
                        if (from_u64) {
                            // 2^63 이상은 u64로만 표현된다.
                            push_value_(x.src);
                            emit_(Op::kConst, 0);
                            emit_(Op::kLtS);
                            jump_(Op::kJmpIf, ovf);
                        }
                        push_value_(x.src);
                        normalize_(to);
                        push_value_(x.src);
                        emit_(Op::kNe);
                        jump_(Op::kJmpIf, ovf);
                    }
                }
                push_value_(x.src);
                normalize_(to);
                def_(inst.result);
            }

            void lower_call_(const ssa::Inst& inst, const ssa::InstCall& x) {
                if ((size_t)x.callee >= m_.funcs.size() || m_.funcs[x.callee].excluded) {
                    unsupported_("call to an excluded function");
                    return;
                }
                for (auto a : x.args) push_value_(a);
                emit_(Op::kCall, x.callee);   // 최종 함수 인덱스는 모듈 단계에서 고친다
                calls_.push_back(meta::GasCall{x.callee, weight_});
                if (std::find(callees_.begin(), callees_.end(), x.callee) == callees_.end()) {
                    callees_.push_back(x.callee);
                }
                def_(inst.result);
            }

            uint32_t struct_field_count_(ty::TypeId t) const {
                const auto* sd = types_.struct_decl(t);
                return sd != nullptr ? static_cast<uint32_t>(sd->fields.size()) : 0u;
            }

            void lower_state_read_(const ssa::Inst& inst, const ssa::InstStateRead& x) {
                const auto ref = host::lookup(host::HostOp::kStateRead);
                if (ref.module == nullptr) {
                    unsupported_("host capability missing from interface table");
                    return;
                }

                const HostArg dom = domain_arg_(x.ns, x.key, inst.span);
                const HostArg key = buffer_arg_(x.key);
                const bool bytes = types_.is_bytes(x.value_ty);

                const uint32_t s = tmp_();
                uint32_t out = kNoSlot;
                if (bytes) {
                    host_call_(host::HostOp::kStateRead,
                               {dom, key, HostArg{host::ArgShape::kOutPtrCap, Operand::immediate(0), Operand::immediate(0)}},
                               s);
                } else {
                    out = alloc_into_(8);
                    host_call_(host::HostOp::kStateRead,
                               {dom, key, HostArg{host::ArgShape::kOutPtrCap, Operand::local(out), Operand::immediate(8)}},
                               s);
                }

                const uint32_t res = alloc_into_(16);
                const uint32_t l_ok = new_label_();
                const uint32_t l_err = new_label_();
                const uint32_t l_done = new_label_();

                emit_(Op::kLocalGet, s);
                emit_(Op::kConst, 0);
                emit_(Op::kLtS);
                jump_(Op::kJmpIfNot, l_ok);

                // 복구 가능한 코드만 result 오류로, 나머지는 abort
                for (auto c : ref.fn->recoverable) {
                    emit_(Op::kLocalGet, s);
                    emit_(Op::kConst, word_of_(c));
                    emit_(Op::kEq);
                    jump_(Op::kJmpIf, l_err);
                }
                jump_(Op::kJmp, lazy_label_(host_fail_label_));

                bind_(l_err);
                emit_(Op::kLocalGet, res);
                emit_(Op::kLocalGet, s);
                emit_(Op::kStore);
                jump_(Op::kJmp, l_done);

                bind_(l_ok);
                if (bytes) {
                    // 값 크기를 알았으니 버퍼를 잡고 다시 읽는다.
                    const uint32_t b = read_bytes_(host::HostOp::kStateRead, {dom, key}, s);
                    emit_(Op::kLocalGet, res);
                    emit_(Op::kConst, 8);
                    emit_(Op::kAdd);
                    emit_(Op::kLocalGet, b);
                } else {
                    emit_(Op::kLocalGet, res);
                    emit_(Op::kConst, 8);
                    emit_(Op::kAdd);
                    emit_(Op::kLocalGet, out);
                    emit_(Op::kLoad);
                    normalize_(ssa::int_kind_of(types_, x.value_ty));
                }
                emit_(Op::kStore);
                emit_(Op::kLocalGet, res);
                emit_(Op::kConst, 0);
                emit_(Op::kStore);

                bind_(l_done);
                emit_(Op::kLocalGet, res);
                def_(inst.result);
            }

            host::CtxQuery ctx_query_(ssa::ContextQuery q) const {
                switch (q) {
                    case ssa::ContextQuery::Caller: return host::CtxQuery::kCaller;
                    case ssa::ContextQuery::Self: return host::CtxQuery::kSelf;
                    case ssa::ContextQuery::BlockHeight: return host::CtxQuery::kBlockHeight;
                    case ssa::ContextQuery::Timestamp: return host::CtxQuery::kTimestamp;
                    case ssa::ContextQuery::CallValue: return host::CtxQuery::kCallValue;
                }
                return host::CtxQuery::kCaller;
            }

            void lower_context_(const ssa::Inst& inst, const ssa::InstContext& x) {
                const HostArg which{host::ArgShape::kWord,
                                    Operand::immediate(static_cast<uint64_t>(ctx_query_(x.query))), {}};
                const uint32_t s = tmp_();
                if (inst.result == kInvalidId) return;

                if (types_.is_bytes(m_.values[inst.result].ty)) {
                    host_call_(host::HostOp::kCtxQuery,
                               {which, HostArg{host::ArgShape::kOutPtrCap, Operand::immediate(0), Operand::immediate(0)}},
                               s);
                    escalate_(s);
                    const uint32_t b = read_bytes_(host::HostOp::kCtxQuery, {which}, s);
                    emit_(Op::kLocalGet, b);
                    def_(inst.result);
                    return;
                }

                const uint32_t out = alloc_into_(8);
                host_call_(host::HostOp::kCtxQuery,
                           {which, HostArg{host::ArgShape::kOutPtrCap, Operand::local(out), Operand::immediate(8)}},
                           s);
                escalate_(s);
                emit_(Op::kLocalGet, out);
                emit_(Op::kLoad);
                def_(inst.result);
            }

            void lower_digest_(const ssa::Inst& inst, const ssa::InstDigest& x) {
                const auto ref = host::lookup(host::HostOp::kSha256);
                const uint64_t out_len = (ref.fn != nullptr) ? ref.fn->fixed_out_len : 32;

                const uint32_t b = alloc_into_(8 + out_len);
                emit_(Op::kLocalGet, b);
                emit_(Op::kConst, out_len);
                emit_(Op::kStore);

                const uint32_t bp = tmp_();
                emit_(Op::kLocalGet, b);
                emit_(Op::kConst, 8);
                emit_(Op::kAdd);
                emit_(Op::kLocalSet, bp);

                const HostArg src = buffer_arg_(x.src);
                const uint32_t s = tmp_();
                host_call_(host::HostOp::kSha256,
                           {src, HostArg{host::ArgShape::kOutPtr, Operand::local(bp), {}}}, s);
                escalate_(s);
                emit_(Op::kLocalGet, b);
                def_(inst.result);
            }

            /// @brief payload: 정수/bool은 8바이트 워드, bytes는 [len][data].
            void lower_emit_(const ssa::Inst& inst, const ssa::InstEmit& x) {
                const uint64_t topic = data_addr_(x.topic, "event topic", inst.span);

                const uint32_t z = tmp_();
                emit_(Op::kConst, 8 * x.args.size());
                emit_(Op::kLocalSet, z);
                for (auto a : x.args) {
                    if (!is_bytes_(a)) continue;
                    emit_(Op::kLocalGet, z);
                    push_value_(a);
                    emit_(Op::kLoad);
                    emit_(Op::kAdd);
                    emit_(Op::kLocalSet, z);
                }

                const uint32_t b = tmp_();
                alloc_dyn_(z);
                emit_(Op::kLocalSet, b);

                const uint32_t c = tmp_();
                const uint32_t l = tmp_();
                emit_(Op::kLocalGet, b);
                emit_(Op::kLocalSet, c);
                for (auto a : x.args) {
                    if (is_bytes_(a)) {
                        push_value_(a);
                        emit_(Op::kLoad);
                        emit_(Op::kLocalSet, l);
                        emit_(Op::kLocalGet, c);
                        emit_(Op::kLocalGet, l);
                        emit_(Op::kStore);

                        emit_(Op::kLocalGet, c);
                        emit_(Op::kConst, 8);
                        emit_(Op::kAdd);
                        push_value_(a);
                        emit_(Op::kConst, 8);
                        emit_(Op::kAdd);
                        emit_(Op::kLocalGet, l);
                        emit_(Op::kMemCopy);

                        emit_(Op::kLocalGet, c);
                        emit_(Op::kConst, 8);
                        emit_(Op::kAdd);
                        emit_(Op::kLocalGet, l);
                        emit_(Op::kAdd);
                        emit_(Op::kLocalSet, c);
                    } else {
                        emit_(Op::kLocalGet, c);
                        push_value_(a);
                        emit_(Op::kStore);
                        emit_(Op::kLocalGet, c);
                        emit_(Op::kConst, 8);
                        emit_(Op::kAdd);
                        emit_(Op::kLocalSet, c);
                    }
                }

                const uint32_t s = tmp_();
                host_call_(host::HostOp::kLogEmit,
                           {HostArg{host::ArgShape::kInPtrLen, Operand::immediate(topic), Operand::immediate(x.topic.size())},
                            HostArg{host::ArgShape::kInPtrLen, Operand::local(b), Operand::local(z)}},
                           s);
                escalate_(s);
            }

            void lower_inst_(const ssa::Inst& inst) {
                std::visit([&](auto&& x) {
                    using T = std::decay_t<decltype(x)>;
                    if constexpr (std::is_same_v<T, ssa::InstConstInt> ||
                                  std::is_same_v<T, ssa::InstConstBool> ||
                                  std::is_same_v<T, ssa::InstConstBytes>) {
                        // 사용 지점에서 다시 만든다. bytes는 여기서 세그먼트를 잡아 한도를 검사한다.
                        if constexpr (std::is_same_v<T, ssa::InstConstBytes>) {
                            if (inst.result != kInvalidId) (void)const_word_(inst.result);
                        }
                    } else if constexpr (std::is_same_v<T, ssa::InstBinOp>) {
                        lower_binop_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstUnary>) {
                        lower_unary_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstCast>) {
                        lower_cast_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstCall>) {
                        lower_call_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstMakeStruct>) {
                        const uint64_t n = x.fields.size();
                        if (n > opt_.max_aggregate_fields) {
                            too_large_("struct", n, opt_.max_aggregate_fields, inst.span);
                            return;
                        }
                        const uint32_t p = alloc_into_(8 * n);
                        for (size_t i = 0; i < x.fields.size(); ++i) {
                            emit_(Op::kLocalGet, p);
                            if (i != 0) {
                                emit_(Op::kConst, 8 * i);
                                emit_(Op::kAdd);
                            }
                            push_value_(x.fields[i]);
                            emit_(Op::kStore);
                        }
                        emit_(Op::kLocalGet, p);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstExtractField>) {
                        push_value_(x.base);
                        if (x.index != 0) {
                            emit_(Op::kConst, 8 * (uint64_t)x.index);
                            emit_(Op::kAdd);
                        }
                        emit_(Op::kLoad);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstInsertField>) {
                        const uint64_t n = struct_field_count_(m_.values[x.base].ty);
                        if (n > opt_.max_aggregate_fields) {
                            too_large_("struct", n, opt_.max_aggregate_fields, inst.span);
                            return;
                        }
                        const uint32_t p = alloc_into_(8 * n);
                        emit_(Op::kLocalGet, p);
                        push_value_(x.base);
                        emit_(Op::kConst, 8 * n);
                        emit_(Op::kMemCopy);
                        emit_(Op::kLocalGet, p);
                        emit_(Op::kConst, 8 * (uint64_t)x.index);
                        emit_(Op::kAdd);
                        push_value_(x.value);
                        emit_(Op::kStore);
                        emit_(Op::kLocalGet, p);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstMakeResult>) {
                        // [status][payload]
                        const uint32_t p = alloc_into_(16);
                        emit_(Op::kLocalGet, p);
                        if (x.is_ok) {
                            emit_(Op::kConst, 0);
                            emit_(Op::kStore);
                            if (x.value != kInvalidId) {
                                emit_(Op::kLocalGet, p);
                                emit_(Op::kConst, 8);
                                emit_(Op::kAdd);
                                push_value_(x.value);
                                emit_(Op::kStore);
                            }
                        } else {
                            push_value_(x.value);
                            emit_(Op::kStore);
                        }
                        emit_(Op::kLocalGet, p);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstResultIsOk>) {
                        push_value_(x.src);
                        emit_(Op::kLoad);
                        emit_(Op::kEqz);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstResultValue>) {
                        push_value_(x.src);
                        emit_(Op::kLoad);
                        jump_(Op::kJmpIf, lazy_label_(unwrap_label_));
                        if (inst.result != kInvalidId) {
                            push_value_(x.src);
                            emit_(Op::kConst, 8);
                            emit_(Op::kAdd);
                            emit_(Op::kLoad);
                            def_(inst.result);
                        }
                    } else if constexpr (std::is_same_v<T, ssa::InstResultCode>) {
                        push_value_(x.src);
                        emit_(Op::kLoad);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstRefNew>) {
                        const uint32_t p = alloc_into_(8);
                        emit_(Op::kLocalGet, p);
                        push_value_(x.init);
                        emit_(Op::kStore);
                        emit_(Op::kLocalGet, p);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstRefLoad>) {
                        push_value_(x.ref);
                        emit_(Op::kLoad);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstRefStore>) {
                        push_value_(x.ref);
                        push_value_(x.value);
                        emit_(Op::kStore);
                    } else if constexpr (std::is_same_v<T, ssa::InstStateRead>) {
                        lower_state_read_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstStateWrite>) {
                        const HostArg dom = domain_arg_(x.ns, x.key, inst.span);
                        const HostArg key = buffer_arg_(x.key);
                        const HostArg val = buffer_arg_(x.value);
                        const uint32_t s = tmp_();
                        host_call_(host::HostOp::kStateWrite, {dom, key, val}, s);
                        escalate_(s);
                    } else if constexpr (std::is_same_v<T, ssa::InstStateHas>) {
                        const HostArg dom = domain_arg_(x.ns, x.key, inst.span);
                        const HostArg key = buffer_arg_(x.key);
                        const uint32_t s = tmp_();
                        host_call_(host::HostOp::kStateHas, {dom, key}, s);
                        escalate_(s);
                        emit_(Op::kLocalGet, s);
                        emit_(Op::kConst, 0);
                        emit_(Op::kNe);
                        def_(inst.result);
                    } else if constexpr (std::is_same_v<T, ssa::InstContext>) {
                        lower_context_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstDigest>) {
                        lower_digest_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstEmit>) {
                        lower_emit_(inst, x);
                    } else if constexpr (std::is_same_v<T, ssa::InstBytesLen>) {
                        push_value_(x.src);
                        emit_(Op::kLoad);
                        def_(inst.result);
                    }
                }, inst.data);
            }

            // ---- control flow ----
            /// @brief 간선 인자를 대상 블록 param slot에 병렬 복사한다.
            /// 모두 스택에 올린 뒤 역순으로 내려 swap 형태의 복사도 안전하다.
            void edge_copies_(BlockId target, const std::vector<ValueId>& args) {
                const auto& params = m_.blocks[target].params;
                std::vector<uint32_t> dst;
                for (size_t i = 0; i < params.size() && i < args.size(); ++i) {
                    if (plan_.home[params[i]] != ValueHome::kLocal) continue;
                    push_value_(args[i]);
                    dst.push_back(plan_.slot[params[i]]);
                }
                for (auto it = dst.rbegin(); it != dst.rend(); ++it) emit_(Op::kLocalSet, *it);
            }

            void branch_to_(BlockId target) {
                if (target == next_block_) return;
                jump_(Op::kJmp, block_label_[target]);
            }

            void lower_term_(const ssa::Terminator& term) {
                std::visit([&](auto&& t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, ssa::TermBr>) {
                        edge_copies_(t.target, t.args);
                        branch_to_(t.target);
                    } else if constexpr (std::is_same_v<T, ssa::TermCondBr>) {
                        push_value_(t.cond);
                        if (t.then_args.empty() && t.else_args.empty()) {
                            jump_(Op::kJmpIf, block_label_[t.then_bb]);
                            branch_to_(t.else_bb);
                            return;
                        }
                        const uint32_t l_else = new_label_();
                        jump_(Op::kJmpIfNot, l_else);
                        edge_copies_(t.then_bb, t.then_args);
                        jump_(Op::kJmp, block_label_[t.then_bb]);
                        bind_(l_else);
                        edge_copies_(t.else_bb, t.else_args);
                        branch_to_(t.else_bb);
                    } else if constexpr (std::is_same_v<T, ssa::TermRet>) {
                        if (t.has_value && !types_.is_unit(f_.ret_ty)) push_value_(t.value);
                        emit_(Op::kRet);
                    } else if constexpr (std::is_same_v<T, ssa::TermRevert>) {
                        const auto op = (t.kind == ssa::RevertKind::Abort) ? host::HostOp::kPanic : host::HostOp::kRevert;
                        abort_(op, t.message, f_.span);
                    } else if constexpr (std::is_same_v<T, ssa::TermUnreachable>) {
                        emit_(Op::kTrap, static_cast<uint64_t>(TrapCode::kUnreachable));
                    }
                }, term);
            }

            void emit_handler_(uint32_t label, std::string_view msg) {
                if (label == kUnbound) return;
                scratch_next_ = 0;
                bind_(label);
                abort_(host::HostOp::kPanic, msg, f_.span);
            }

            const ssa::Module& m_;
            const ty::TypePool& types_;
            ssa::FuncId fid_;
            const ssa::Function& f_;
            const std::string& unit_;
            DataLayout& data_;
            const CompileOptions& opt_;
            diag::Bag& bag_;

            SlotPlan plan_{};
            std::vector<uint32_t> depth_{};
            uint64_t weight_ = 1;
            bool counting_ = true;
            bool ok_ = true;

            std::vector<Instr> code_{};
            std::vector<uint32_t> labels_{};
            std::vector<std::pair<size_t, uint32_t>> fixups_{};
            std::unordered_map<BlockId, uint32_t> block_label_{};
            BlockId next_block_ = kInvalidId;

            uint32_t ovf_label_ = kUnbound;
            uint32_t unwrap_label_ = kUnbound;
            uint32_t host_fail_label_ = kUnbound;

            uint32_t scratch_next_ = 0;
            uint32_t scratch_max_ = 0;

            uint64_t gas_local_ = 0;
            std::vector<meta::GasCall> calls_{};
            std::vector<ssa::FuncId> callees_{};
            std::vector<host::HostOp> host_ops_{};
        };

    } // namespace

    BackendKind VmBackend::kind() const {
        return BackendKind::kVm;
    }

    CompileResult VmBackend::compile(
        const ssa::Module& m,
        const ty::TypePool& types,
        diag::Bag& bag,
        const CompileOptions& opt
    ) {
        CompileResult r{};
        const std::string unit = opt.unit_id.empty() ? m.unit_id : opt.unit_id;
        const size_t n = m.funcs.size();

        r.functions.resize(n);
        r.fn_ok.assign(n, false);

        DataLayout data(opt.max_data_bytes);
        std::vector<LoweredFunction> lowered(n);
        std::vector<uint8_t> alive(n, 0);

        // 1) 함수별 lowering. 실패해도 형제 함수는 계속한다.
        bool all_ok = true;
        for (ssa::FuncId fid = 0; fid < n; ++fid) {
            const auto& f = m.funcs[fid];
            r.functions[fid].fid = fid;
            if (f.excluded) continue;
            r.functions[fid].mangled = mangle(unit, f, types);

            FunctionLowerer fl(m, types, fid, unit, data, opt, bag);
            if (fl.lower(lowered[fid])) {
                alive[fid] = 1;
            } else {
                all_ok = false;
            }
        }

        // 2) 제외된 함수를 부르는 함수도 제외한다(전이적으로).
        bool changed = true;
        while (changed) {
            changed = false;
            for (ssa::FuncId fid = 0; fid < n; ++fid) {
                if (!alive[fid]) continue;
                for (auto c : lowered[fid].callees) {
                    if (alive[c]) continue;
                    diag::Diagnostic d(diag::Severity::kNote, diag::Code::kFnExcluded, m.funcs[fid].span);
                    d.add_arg(m.funcs[fid].name);
                    d.add_arg("calls '" + m.funcs[c].name + "', which could not be lowered");
                    bag.add(std::move(d));
                    alive[fid] = 0;
                    all_ok = false;
                    changed = true;
                    break;
                }
            }
        }

        // 3) 최종 인덱스, import 목록, call/call_host 패치
        std::vector<uint32_t> index_of(n, kNoFunction);
        for (ssa::FuncId fid = 0; fid < n; ++fid) {
            if (!alive[fid]) continue;
            index_of[fid] = static_cast<uint32_t>(r.module.functions.size());
            r.module.functions.push_back(lowered[fid].fn);
        }

        std::unordered_map<uint64_t, uint32_t> import_of;
        for (ssa::FuncId fid = 0; fid < n; ++fid) {
            if (!alive[fid]) continue;
            for (auto op : lowered[fid].host_ops) {
                const uint64_t key = static_cast<uint64_t>(op);
                if (import_of.count(key) != 0) continue;
                const auto ref = host::lookup(op);
                Import im{};
                im.module = std::string(ref.module->name);
                im.version = ref.module->version;
                im.name = std::string(ref.fn->name);
                im.num_args = host::word_arity(*ref.fn);
                im.has_result = (ref.fn->ret == host::RetShape::kStatus);
                import_of.emplace(key, static_cast<uint32_t>(r.module.imports.size()));
                r.module.imports.push_back(std::move(im));
            }
        }

        for (auto& fn : r.module.functions) {
            for (auto& ins : fn.code) {
                if (ins.op == Op::kCall) ins.imm = index_of[ins.imm];
                else if (ins.op == Op::kCallHost) ins.imm = import_of[ins.imm];
            }
        }

        // 4) export, gas, 요약
        std::vector<meta::FunctionGas> gas(n);
        for (ssa::FuncId fid = 0; fid < n; ++fid) {
            if (!alive[fid]) continue;
            gas[fid] = lowered[fid].gas;
            gas[fid].present = true;
        }
        const auto totals = meta::estimate_gas(gas);

        for (ssa::FuncId fid = 0; fid < n; ++fid) {
            auto& info = r.functions[fid];
            if (!alive[fid]) continue;
            r.fn_ok[fid] = true;
            info.index = index_of[fid];
            info.num_locals = lowered[fid].fn.num_locals;
            info.stack_values = lowered[fid].stack_values;
            info.gas = totals[fid];

            if (m.funcs[fid].is_public) {
                info.exported = true;
                r.module.functions[info.index].export_name = info.mangled;
                r.module.exports.push_back(Export{info.mangled, info.index});
            }
        }

        // 5) 메모리 배치: [heap top][data...][heap]
        r.module.memory_pages = opt.memory_pages;
        r.module.heap_base = align8_(data.end());
        r.module.data.push_back(DataSegment{0, encode_word_(r.module.heap_base)});
        for (auto& seg : data.segments()) r.module.data.push_back(std::move(seg));

        const uint64_t memory_bytes = (uint64_t)opt.memory_pages * kPageSize;
        if (r.module.heap_base > memory_bytes) {
            diag::Diagnostic d(diag::Severity::kFatal, diag::Code::kBackendValueTooLarge, Span{});
            d.add_arg(unit);
            d.add_arg("data segments");
            d.add_arg_int((int64_t)r.module.heap_base);
            d.add_arg_int((int64_t)memory_bytes);
            bag.add(std::move(d));
            all_ok = false;
        }

        r.ok = all_ok;
        return r;
    }

} // namespace vellum::backend::vm
