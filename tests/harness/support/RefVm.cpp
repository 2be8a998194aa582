// tests/harness/support/RefVm.cpp
#include "RefVm.hpp"

#include <vellum/backend/host/HostInterface.hpp>

#include <cstring>
#include <limits>
#include <string>


namespace vellum::harness {

    namespace {

        using backend::vm::Op;
        using backend::vm::TrapCode;
        namespace host = backend::host;

        constexpr uint64_t kMinI64 = static_cast<uint64_t>(std::numeric_limits<int64_t>::min());

        uint64_t status_word_(host::HostStatus s) {
            return static_cast<uint64_t>(static_cast<int64_t>(static_cast<int32_t>(s)));
        }

        class Machine final {
        public:
            Machine(const backend::vm::Module& m, TestHost& host, const VmLimits& limits)
                : m_(m), host_(host), limits_(limits) {}

            RunResult run(uint32_t index, const std::vector<uint64_t>& args) {
                if (!load_()) return out_;
                if (index >= m_.functions.size()) {
                    stop_(Exit::kError, "no such function");
                    return out_;
                }
                const auto& fn = m_.functions[index];
                if (args.size() != fn.num_params) {
                    stop_(Exit::kError, "argument count mismatch");
                    return out_;
                }

                for (auto a : args) stack_.push_back(a);
                if (!exec_(index)) return out_;

                out_.exit = Exit::kReturned;
                if (fn.has_result) {
                    if (stack_.empty()) {
                        stop_(Exit::kError, "missing return value");
                        return out_;
                    }
                    out_.has_value = true;
                    out_.value = stack_.back();
                }
                return out_;
            }

        private:
            bool stop_(Exit e, std::string msg, uint32_t trap = 0) {
                if (stopped_) return false;
                stopped_ = true;
                out_.exit = e;
                out_.message = std::move(msg);
                out_.trap = trap;
                return false;
            }

            bool trap_(TrapCode c) {
                return stop_(Exit::kTrapped, "trap", static_cast<uint32_t>(c));
            }

            /// @brief 메모리 초기화와 import 검증.
            bool load_() {
                mem_.assign(static_cast<size_t>(m_.memory_pages) * backend::vm::kPageSize, 0);
                for (const auto& seg : m_.data) {
                    if (!in_bounds_(seg.offset, seg.bytes.size())) return stop_(Exit::kError, "data segment out of bounds");
                    std::memcpy(mem_.data() + seg.offset, seg.bytes.data(), seg.bytes.size());
                }

                for (const auto& im : m_.imports) {
                    const auto ref = host::lookup(im.module, im.version, im.name);
                    if (ref.module == nullptr) {
                        return stop_(Exit::kError, "unresolved import " + im.module + "." + im.name);
                    }
                    if (host::word_arity(*ref.fn) != im.num_args) {
                        return stop_(Exit::kError, "import arity mismatch for " + im.name);
                    }
                    imports_.push_back(ref);
                }
                return true;
            }

            bool in_bounds_(uint64_t addr, uint64_t len) const {
                return addr <= mem_.size() && len <= mem_.size() - addr;
            }

            bool read_mem_(uint64_t addr, uint64_t len, std::string& out) const {
                if (!in_bounds_(addr, len)) return false;
                out.assign(reinterpret_cast<const char*>(mem_.data() + addr), static_cast<size_t>(len));
                return true;
            }

            bool write_mem_(uint64_t addr, const std::string& bytes) {
                if (!in_bounds_(addr, bytes.size())) return false;
                std::memcpy(mem_.data() + addr, bytes.data(), bytes.size());
                return true;
            }

            bool read_domain_(uint64_t addr, uint64_t len, std::string& out) const {
                return len == host::kDomainArgLen && read_mem_(addr, len, out);
            }

            uint64_t pop_() {
                const uint64_t v = stack_.back();
                stack_.pop_back();
                return v;
            }

            /// @brief 인자 워드는 테이블 순서대로 들어 있다.
            bool call_host_(uint32_t import_index) {
                if (import_index >= imports_.size()) return stop_(Exit::kError, "bad import index");
                const auto ref = imports_[import_index];
                const auto& im = m_.imports[import_index];
                if (stack_.size() < im.num_args) return stop_(Exit::kError, "stack underflow at host call");

                std::vector<uint64_t> a(im.num_args);
                for (size_t i = im.num_args; i > 0; --i) a[i - 1] = pop_();

                uint64_t status = 0;
                switch (ref.fn->op) {
                    case host::HostOp::kStateRead: {
                        std::string dom, key, value;
                        if (!read_domain_(a[0], a[1], dom) || !read_mem_(a[2], a[3], key)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        if (!host_.read(scope_of(dom), key, value)) {
                            status = status_word_(host::HostStatus::kNotFound);
                            break;
                        }
                        if (value.size() <= a[5] && !write_mem_(a[4], value)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        status = value.size();
                        break;
                    }
                    case host::HostOp::kStateWrite: {
                        std::string dom, key, value;
                        if (!read_domain_(a[0], a[1], dom) || !read_mem_(a[2], a[3], key) || !read_mem_(a[4], a[5], value)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        if (!host_.allows_write(dom)) {
                            status = status_word_(host::HostStatus::kDomainDenied);
                            break;
                        }
                        host_.write(scope_of(dom), key, value);
                        break;
                    }
                    case host::HostOp::kStateHas: {
                        std::string dom, key;
                        if (!read_domain_(a[0], a[1], dom) || !read_mem_(a[2], a[3], key)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        status = host_.has(scope_of(dom), key) ? 1 : 0;
                        break;
                    }
                    case host::HostOp::kCtxQuery: {
                        if (a[0] > static_cast<uint64_t>(host::CtxQuery::kCallValue)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        const std::string value = host_.context(static_cast<uint32_t>(a[0]));
                        if (value.size() <= a[2] && !write_mem_(a[1], value)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        status = value.size();
                        break;
                    }
                    case host::HostOp::kSha256: {
                        std::string data;
                        if (!read_mem_(a[0], a[1], data) || !write_mem_(a[2], sha256_bytes(data))) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                        }
                        break;
                    }
                    case host::HostOp::kLogEmit: {
                        std::string topic, payload;
                        if (!read_mem_(a[0], a[1], topic) || !read_mem_(a[2], a[3], payload)) {
                            status = status_word_(host::HostStatus::kInvalidArgument);
                            break;
                        }
                        host_.events.push_back(Event{std::move(topic), std::move(payload)});
                        break;
                    }
                    case host::HostOp::kRevert:
                    case host::HostOp::kPanic: {
                        std::string msg;
                        if (!read_mem_(a[0], a[1], msg)) return trap_(TrapCode::kOutOfBounds);
                        return stop_(ref.fn->op == host::HostOp::kPanic ? Exit::kPanicked : Exit::kReverted, msg);
                    }
                }

                if (static_cast<int64_t>(status) < 0) {
                    out_.host_status = host::status_name(static_cast<int32_t>(static_cast<int64_t>(status)));
                }
                if (im.has_result) stack_.push_back(status);
                return true;
            }

            bool exec_(uint32_t index) {
                if (depth_ >= limits_.max_depth) return stop_(Exit::kError, "call depth limit");
                const auto& fn = m_.functions[index];
                if (stack_.size() < fn.num_params) return stop_(Exit::kError, "stack underflow at call");

                ++depth_;
                std::vector<uint64_t> locals(fn.num_locals, 0);
                for (size_t i = fn.num_params; i > 0; --i) locals[i - 1] = pop_();
                const size_t base = stack_.size();

                size_t pc = 0;
                while (pc < fn.code.size()) {
                    if (++steps_ > limits_.max_steps) return stop_(Exit::kError, "step limit");
                    if (stack_.size() > limits_.max_stack) return stop_(Exit::kError, "stack limit");

                    const auto& ins = fn.code[pc++];
                    const auto need = [&](size_t n) { return stack_.size() >= base + n; };

                    switch (ins.op) {
                        case Op::kNop:
                            break;
                        case Op::kConst:
                            stack_.push_back(ins.imm);
                            break;
                        case Op::kLocalGet:
                            if (ins.imm >= locals.size()) return stop_(Exit::kError, "bad local");
                            stack_.push_back(locals[ins.imm]);
                            break;
                        case Op::kLocalSet:
                        case Op::kLocalTee:
                            if (ins.imm >= locals.size() || !need(1)) return stop_(Exit::kError, "bad local");
                            locals[ins.imm] = stack_.back();
                            if (ins.op == Op::kLocalSet) stack_.pop_back();
                            break;
                        case Op::kDrop:
                            if (!need(1)) return stop_(Exit::kError, "stack underflow");
                            stack_.pop_back();
                            break;

                        case Op::kEqz:
                            if (!need(1)) return stop_(Exit::kError, "stack underflow");
                            stack_.back() = (stack_.back() == 0) ? 1 : 0;
                            break;
                        case Op::kSext:
                            if (!need(1)) return stop_(Exit::kError, "stack underflow");
                            if (ins.imm > 0 && ins.imm < 64) {
                                const unsigned sh = static_cast<unsigned>(64 - ins.imm);
                                stack_.back() = static_cast<uint64_t>(static_cast<int64_t>(stack_.back() << sh) >> sh);
                            }
                            break;
                        case Op::kZext:
                            if (!need(1)) return stop_(Exit::kError, "stack underflow");
                            if (ins.imm > 0 && ins.imm < 64) stack_.back() &= (uint64_t{1} << ins.imm) - 1;
                            break;

                        case Op::kLoad: {
                            if (!need(1)) return stop_(Exit::kError, "stack underflow");
                            const uint64_t addr = stack_.back();
                            if (!in_bounds_(addr, 8)) return trap_(TrapCode::kOutOfBounds);
                            uint64_t w = 0;
                            for (int i = 0; i < 8; ++i) w |= static_cast<uint64_t>(mem_[addr + i]) << (8 * i);
                            stack_.back() = w;
                            break;
                        }
                        case Op::kStore: {
                            if (!need(2)) return stop_(Exit::kError, "stack underflow");
                            const uint64_t v = pop_();
                            const uint64_t addr = pop_();
                            if (!in_bounds_(addr, 8)) return trap_(TrapCode::kOutOfBounds);
                            for (int i = 0; i < 8; ++i) mem_[addr + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
                            break;
                        }
                        case Op::kMemCopy: {
                            if (!need(3)) return stop_(Exit::kError, "stack underflow");
                            const uint64_t len = pop_();
                            const uint64_t src = pop_();
                            const uint64_t dst = pop_();
                            if (!in_bounds_(src, len) || !in_bounds_(dst, len)) return trap_(TrapCode::kOutOfBounds);
                            std::memmove(mem_.data() + dst, mem_.data() + src, static_cast<size_t>(len));
                            break;
                        }

                        case Op::kJmp:
                            pc = static_cast<size_t>(ins.imm);
                            break;
                        case Op::kJmpIf:
                        case Op::kJmpIfNot: {
                            if (!need(1)) return stop_(Exit::kError, "stack underflow");
                            const bool c = pop_() != 0;
                            if (c == (ins.op == Op::kJmpIf)) pc = static_cast<size_t>(ins.imm);
                            break;
                        }

                        case Op::kCall:
                            if (ins.imm >= m_.functions.size()) return stop_(Exit::kError, "bad function index");
                            if (!exec_(static_cast<uint32_t>(ins.imm))) return false;
                            break;
                        case Op::kCallHost:
                            if (!call_host_(static_cast<uint32_t>(ins.imm))) return false;
                            break;
                        case Op::kRet: {
                            uint64_t r = 0;
                            if (fn.has_result) {
                                if (!need(1)) return stop_(Exit::kError, "missing return value");
                                r = stack_.back();
                            }
                            stack_.resize(base);
                            if (fn.has_result) stack_.push_back(r);
                            --depth_;
                            return true;
                        }
                        case Op::kTrap:
                            return trap_(static_cast<TrapCode>(ins.imm));

                        default: {
                            if (!need(2)) return stop_(Exit::kError, "stack underflow");
                            const uint64_t b = pop_();
                            const uint64_t a = pop_();
                            uint64_t r = 0;
                            if (!binary_(ins.op, a, b, r)) return false;
                            stack_.push_back(r);
                            break;
                        }
                    }
                }
                return stop_(Exit::kError, "fell off the end of function code");
            }

            bool binary_(Op op, uint64_t a, uint64_t b, uint64_t& r) {
                const auto sa = static_cast<int64_t>(a);
                const auto sb = static_cast<int64_t>(b);
                switch (op) {
                    case Op::kAdd: r = a + b; return true;
                    case Op::kSub: r = a - b; return true;
                    case Op::kMul: r = a * b; return true;
                    case Op::kDivS:
                        if (b == 0) return trap_(TrapCode::kDivByZero);
                        if (a == kMinI64 && sb == -1) return trap_(TrapCode::kIntegerOverflow);
                        r = static_cast<uint64_t>(sa / sb);
                        return true;
                    case Op::kDivU:
                        if (b == 0) return trap_(TrapCode::kDivByZero);
                        r = a / b;
                        return true;
                    case Op::kRemS:
                        if (b == 0) return trap_(TrapCode::kDivByZero);
                        r = (sb == -1) ? 0 : static_cast<uint64_t>(sa % sb);
                        return true;
                    case Op::kRemU:
                        if (b == 0) return trap_(TrapCode::kDivByZero);
                        r = a % b;
                        return true;
                    case Op::kShl: r = a << (b & 63); return true;
                    case Op::kShrS: r = static_cast<uint64_t>(sa >> (b & 63)); return true;
                    case Op::kShrU: r = a >> (b & 63); return true;
                    case Op::kAnd: r = a & b; return true;
                    case Op::kOr: r = a | b; return true;
                    case Op::kXor: r = a ^ b; return true;
                    case Op::kEq: r = (a == b); return true;
                    case Op::kNe: r = (a != b); return true;
                    case Op::kLtS: r = (sa < sb); return true;
                    case Op::kLtU: r = (a < b); return true;
                    case Op::kLeS: r = (sa <= sb); return true;
                    case Op::kLeU: r = (a <= b); return true;
                    case Op::kGtS: r = (sa > sb); return true;
                    case Op::kGtU: r = (a > b); return true;
                    case Op::kGeS: r = (sa >= sb); return true;
                    case Op::kGeU: r = (a >= b); return true;
                    default:
                        return stop_(Exit::kError, std::string("unexpected op ") + backend::vm::op_name(op));
                }
            }

            const backend::vm::Module& m_;
            TestHost& host_;
            VmLimits limits_;

            std::vector<uint8_t> mem_;
            std::vector<uint64_t> stack_;
            std::vector<host::HostRef> imports_;

            RunResult out_{};
            bool stopped_ = false;
            uint64_t steps_ = 0;
            uint32_t depth_ = 0;
        };

    } // namespace

    RunResult run_function(
        const backend::vm::Module& m,
        uint32_t index,
        const std::vector<uint64_t>& args,
        TestHost& host,
        const VmLimits& limits
    ) {
        Machine vm(m, host, limits);
        return vm.run(index, args);
    }

    RunResult run_export(
        const backend::vm::Module& m,
        std::string_view name,
        const std::vector<uint64_t>& args,
        TestHost& host,
        const VmLimits& limits
    ) {
        for (const auto& e : m.exports) {
            if (e.name == name) return run_function(m, e.func, args, host, limits);
        }
        RunResult r{};
        r.exit = Exit::kError;
        r.message = "no export named '" + std::string(name) + "'";
        return r;
    }

} // namespace vellum::harness
