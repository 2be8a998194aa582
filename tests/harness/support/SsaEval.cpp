// tests/harness/support/SsaEval.cpp
#include "SsaEval.hpp"

#include <vellum/backend/host/HostInterface.hpp>
#include <vellum/backend/vm/Bytecode.hpp>
#include <vellum/domain/DomainKey.hpp>
#include <vellum/ssa/Fold.hpp>

#include <memory>
#include <type_traits>
#include <unordered_map>
#include <utility>


namespace vellum::harness {

    const char* exit_name(Exit e) {
        switch (e) {
            case Exit::kReturned: return "returned";
            case Exit::kReverted: return "reverted";
            case Exit::kPanicked: return "panicked";
            case Exit::kTrapped: return "trapped";
            case Exit::kError: return "error";
        }
        return "?";
    }

    namespace {

        using ssa::ValueId;
        using ssa::kInvalidId;

        constexpr std::string_view kMsgOverflow = "arithmetic overflow";
        constexpr std::string_view kMsgUnwrap = "unwrap of err result";
        constexpr std::string_view kMsgHostFailure = "host call failed";

        namespace host = backend::host;

        /// @brief 평가 중의 값. 정수/bool은 word, bytes는 bytes,
        /// struct와 result([status, payload])는 fields, 참조 셀은 cell.
        struct Val {
            uint64_t word = 0;
            std::string bytes{};
            std::vector<Val> fields{};
            std::shared_ptr<Val> cell{};
        };

        Val word_(uint64_t w) {
            Val v{};
            v.word = w;
            return v;
        }

        Val bytes_(std::string b) {
            Val v{};
            v.bytes = std::move(b);
            return v;
        }

        Val result_(int64_t status, Val payload) {
            Val v{};
            v.fields.push_back(word_(static_cast<uint64_t>(status)));
            v.fields.push_back(std::move(payload));
            return v;
        }

        using Env = std::unordered_map<ValueId, Val>;

        class Evaluator final {
        public:
            Evaluator(
                const ssa::Module& m,
                const ty::TypePool& types,
                TestHost& host,
                std::string_view unit,
                const EvalLimits& limits
            ) : m_(m), types_(types), host_(host), unit_(unit), limits_(limits) {}

            RunResult run(ssa::FuncId fid, const std::vector<uint64_t>& args) {
                if ((size_t)fid >= m_.funcs.size()) {
                    stop_(Exit::kError, "no such function");
                    return out_;
                }
                const auto& f = m_.funcs[fid];
                if (args.size() != f.param_tys.size()) {
                    stop_(Exit::kError, "argument count mismatch");
                    return out_;
                }

                std::vector<Val> vals;
                for (size_t i = 0; i < args.size(); ++i) {
                    Val v = word_(args[i]);
                    if (i < f.param_modes.size() && f.param_modes[i] == hir::PassMode::kMut) {
                        Val ref{};
                        ref.cell = std::make_shared<Val>(std::move(v));
                        v = std::move(ref);
                    }
                    vals.push_back(std::move(v));
                }

                Val ret{};
                if (!call_(fid, std::move(vals), ret)) return out_;

                out_.exit = Exit::kReturned;
                if (!types_.is_unit(f.ret_ty)) {
                    out_.has_value = true;
                    out_.value = ret.word;
                }
                return out_;
            }

        private:
            bool stop_(Exit e, std::string_view msg, uint32_t trap = 0) {
                if (stopped_) return false;
                stopped_ = true;
                out_.exit = e;
                out_.message = std::string(msg);
                out_.trap = trap;
                return false;
            }

            bool trap_(backend::vm::TrapCode c) {
                return stop_(Exit::kTrapped, "trap", static_cast<uint32_t>(c));
            }

            bool is_bytes_(ValueId v) const { return types_.is_bytes(m_.values[v].ty); }

            /// @brief host에 넘기는 버퍼: bytes는 그대로, 정수는 8바이트 LE 워드.
            std::string buffer_(ValueId v, const Env& env) const {
                const Val& x = env.at(v);
                return is_bytes_(v) ? x.bytes : word_bytes(x.word);
            }

            /// @brief bytecode와 같은 규칙: 키가 상수 inst일 때만 exact hash를 채운다.
            std::string descriptor_(const std::string& ns, ValueId key) const {
                std::string text;
                const auto& v = m_.values[key];
                if (v.def_b == kInvalidId && v.def_a != kInvalidId) {
                    const auto& data = m_.insts[v.def_a].data;
                    if (const auto* ci = std::get_if<ssa::InstConstInt>(&data)) {
                        text = domain::render_int_key(ci->bits, ssa::int_kind_of(types_, v.ty).is_signed);
                    } else if (const auto* cs = std::get_if<ssa::InstConstBytes>(&data)) {
                        text = domain::render_bytes_key(cs->bytes);
                    }
                }
                return descriptor_of(unit_, ns, text);
            }

            /// @brief 음수 host 상태: 복구 가능하면 err 결과, 아니면 abort.
            bool host_status_(host::HostOp op, host::HostStatus st, Val& out) {
                const auto code = static_cast<int32_t>(st);
                out_.host_status = host::status_name(code);
                const auto ref = host::lookup(op);
                if (ref.fn != nullptr && host::is_recoverable(*ref.fn, code)) {
                    out = result_(code, Val{});
                    return true;
                }
                return stop_(Exit::kPanicked, kMsgHostFailure);
            }

            bool folded_(const ssa::Folded& r, Val& out) {
                switch (r.status) {
                    case ssa::FoldStatus::kValue:
                        out = word_(r.value);
                        return true;
                    case ssa::FoldStatus::kOverflow:
                        return stop_(Exit::kPanicked, kMsgOverflow);
                    case ssa::FoldStatus::kDivByZero:
                        return trap_(backend::vm::TrapCode::kDivByZero);
                    case ssa::FoldStatus::kCheckedErr:
                        out = result_(static_cast<int64_t>(ssa::Status::kArithmetic), Val{});
                        return true;
                }
                return stop_(Exit::kError, "unknown fold status");
            }

            bool eval_inst_(const ssa::Inst& inst, Env& env) {
                Val res{};
                bool ok = true;

                std::visit([&](auto&& x) {
                    using T = std::decay_t<decltype(x)>;
                    if constexpr (std::is_same_v<T, ssa::InstConstInt>) {
                        res = word_(x.bits);
                    } else if constexpr (std::is_same_v<T, ssa::InstConstBool>) {
                        res = word_(x.value ? 1 : 0);
                    } else if constexpr (std::is_same_v<T, ssa::InstConstBytes>) {
                        res = bytes_(x.bytes);
                    } else if constexpr (std::is_same_v<T, ssa::InstUnary>) {
                        const auto k = ssa::int_kind_of(types_, m_.values[x.src].ty);
                        const uint64_t a = env.at(x.src).word;
                        switch (x.op) {
                            case ssa::UnOp::Not: res = word_(a ^ 1); break;
                            case ssa::UnOp::BitNot: res = word_(ty::normalize(k, ~a)); break;
                            case ssa::UnOp::Neg: {
                                const auto r = ssa::fold_neg(x.mode, k, a);
                                ok = folded_(r, res);
                                if (ok && x.mode == ssa::ArithMode::Checked && r.status == ssa::FoldStatus::kValue) {
                                    res = result_(0, word_(r.value));
                                }
                                break;
                            }
                        }
                    } else if constexpr (std::is_same_v<T, ssa::InstBinOp>) {
                        const auto k = ssa::int_kind_of(types_, m_.values[x.lhs].ty);
                        const auto r = ssa::fold_binop(x.op, x.mode, k, env.at(x.lhs).word, env.at(x.rhs).word);
                        ok = folded_(r, res);
                        if (ok && x.mode == ssa::ArithMode::Checked && r.status == ssa::FoldStatus::kValue &&
                            !ssa::is_compare(x.op) && !ssa::is_bitwise(x.op)) {
                            res = result_(0, word_(r.value));
                        }
                    } else if constexpr (std::is_same_v<T, ssa::InstCast>) {
                        const auto from = ssa::int_kind_of(types_, m_.values[x.src].ty);
                        const auto to = ssa::int_kind_of(types_, x.to);
                        ok = folded_(ssa::fold_cast(x.mode, from, to, env.at(x.src).word), res);
                    } else if constexpr (std::is_same_v<T, ssa::InstCall>) {
                        std::vector<Val> args;
                        for (auto a : x.args) args.push_back(env.at(a));
                        ok = call_(x.callee, std::move(args), res);
                    } else if constexpr (std::is_same_v<T, ssa::InstMakeStruct>) {
                        for (auto f : x.fields) res.fields.push_back(env.at(f));
                    } else if constexpr (std::is_same_v<T, ssa::InstExtractField>) {
                        const Val& b = env.at(x.base);
                        if (x.index >= b.fields.size()) {
                            ok = stop_(Exit::kError, "field index out of range");
                            return;
                        }
                        res = b.fields[x.index];
                    } else if constexpr (std::is_same_v<T, ssa::InstInsertField>) {
                        res = env.at(x.base);
                        if (x.index >= res.fields.size()) {
                            ok = stop_(Exit::kError, "field index out of range");
                            return;
                        }
                        res.fields[x.index] = env.at(x.value);
                    } else if constexpr (std::is_same_v<T, ssa::InstMakeResult>) {
                        if (x.is_ok) {
                            res = result_(0, x.value != kInvalidId ? env.at(x.value) : Val{});
                        } else {
                            res = result_(static_cast<int64_t>(env.at(x.value).word), Val{});
                        }
                    } else if constexpr (std::is_same_v<T, ssa::InstResultIsOk>) {
                        res = word_(env.at(x.src).fields.at(0).word == 0 ? 1 : 0);
                    } else if constexpr (std::is_same_v<T, ssa::InstResultValue>) {
                        const Val& r = env.at(x.src);
                        if (r.fields.at(0).word != 0) {
                            ok = stop_(Exit::kPanicked, kMsgUnwrap);
                            return;
                        }
                        res = r.fields.at(1);
                    } else if constexpr (std::is_same_v<T, ssa::InstResultCode>) {
                        res = env.at(x.src).fields.at(0);
                    } else if constexpr (std::is_same_v<T, ssa::InstRefNew>) {
                        res.cell = std::make_shared<Val>(env.at(x.init));
                    } else if constexpr (std::is_same_v<T, ssa::InstRefLoad>) {
                        res = *env.at(x.ref).cell;
                    } else if constexpr (std::is_same_v<T, ssa::InstRefStore>) {
                        *env.at(x.ref).cell = env.at(x.value);
                    } else if constexpr (std::is_same_v<T, ssa::InstStateRead>) {
                        std::string raw;
                        if (!host_.read(domain_of(unit_, x.ns), buffer_(x.key, env), raw)) {
                            ok = host_status_(host::HostOp::kStateRead, host::HostStatus::kNotFound, res);
                        } else if (types_.is_bytes(x.value_ty)) {
                            res = result_(0, bytes_(std::move(raw)));
                        } else {
                            const auto k = ssa::int_kind_of(types_, x.value_ty);
                            res = result_(0, word_(ty::normalize(k, word_from(raw))));
                        }
                    } else if constexpr (std::is_same_v<T, ssa::InstStateWrite>) {
                        if (!host_.allows_write(descriptor_(x.ns, x.key))) {
                            ok = host_status_(host::HostOp::kStateWrite, host::HostStatus::kDomainDenied, res);
                            return;
                        }
                        host_.write(domain_of(unit_, x.ns), buffer_(x.key, env), buffer_(x.value, env));
                    } else if constexpr (std::is_same_v<T, ssa::InstStateHas>) {
                        res = word_(host_.has(domain_of(unit_, x.ns), buffer_(x.key, env)) ? 1 : 0);
                    } else if constexpr (std::is_same_v<T, ssa::InstContext>) {
                        const std::string raw = host_.context(static_cast<uint32_t>(x.query));
                        if (inst.result != kInvalidId && types_.is_bytes(m_.values[inst.result].ty)) res = bytes_(raw);
                        else res = word_(word_from(raw));
                    } else if constexpr (std::is_same_v<T, ssa::InstDigest>) {
                        res = bytes_(sha256_bytes(buffer_(x.src, env)));
                    } else if constexpr (std::is_same_v<T, ssa::InstEmit>) {
                        std::string payload;
                        for (auto a : x.args) {
                            const Val& v = env.at(a);
                            if (is_bytes_(a)) {
                                payload += word_bytes(v.bytes.size());
                                payload += v.bytes;
                            } else {
                                payload += word_bytes(v.word);
                            }
                        }
                        host_.events.push_back(Event{x.topic, std::move(payload)});
                    } else if constexpr (std::is_same_v<T, ssa::InstBytesLen>) {
                        res = word_(env.at(x.src).bytes.size());
                    }
                }, inst.data);

                if (!ok) return false;
                if (inst.result != kInvalidId) env[inst.result] = std::move(res);
                return true;
            }

            /// @brief 블록 param에 간선 인자를 동시에 대입한다.
            void bind_params_(ssa::BlockId target, const std::vector<ValueId>& args, Env& env) {
                const auto& params = m_.blocks[target].params;
                std::vector<Val> vals;
                for (size_t i = 0; i < params.size() && i < args.size(); ++i) vals.push_back(env.at(args[i]));
                for (size_t i = 0; i < vals.size(); ++i) env[params[i]] = std::move(vals[i]);
            }

            bool call_(ssa::FuncId fid, std::vector<Val> args, Val& ret) {
                if ((size_t)fid >= m_.funcs.size()) return stop_(Exit::kError, "call to unknown function");
                const auto& f = m_.funcs[fid];
                if (f.excluded || f.entry == kInvalidId) return stop_(Exit::kError, "call to excluded function");
                if (depth_ >= limits_.max_depth) return stop_(Exit::kError, "call depth limit");

                ++depth_;
                Env env;
                const auto& entry_params = m_.blocks[f.entry].params;
                for (size_t i = 0; i < entry_params.size() && i < args.size(); ++i) {
                    env[entry_params[i]] = std::move(args[i]);
                }

                ssa::BlockId bb = f.entry;
                for (;;) {
                    const auto& b = m_.blocks[bb];
                    for (auto iid : b.insts) {
                        if (++steps_ > limits_.max_steps) return stop_(Exit::kError, "step limit");
                        if (!eval_inst_(m_.insts[iid], env)) return false;
                    }
                    if (!b.has_term) return trap_(backend::vm::TrapCode::kUnreachable);

                    bool done = false;
                    bool ok = true;
                    std::visit([&](auto&& t) {
                        using T = std::decay_t<decltype(t)>;
                        if constexpr (std::is_same_v<T, ssa::TermBr>) {
                            bind_params_(t.target, t.args, env);
                            bb = t.target;
                        } else if constexpr (std::is_same_v<T, ssa::TermCondBr>) {
                            if (env.at(t.cond).word != 0) {
                                bind_params_(t.then_bb, t.then_args, env);
                                bb = t.then_bb;
                            } else {
                                bind_params_(t.else_bb, t.else_args, env);
                                bb = t.else_bb;
                            }
                        } else if constexpr (std::is_same_v<T, ssa::TermRet>) {
                            if (t.has_value) ret = env.at(t.value);
                            done = true;
                        } else if constexpr (std::is_same_v<T, ssa::TermRevert>) {
                            ok = stop_(t.kind == ssa::RevertKind::Abort ? Exit::kPanicked : Exit::kReverted, t.message);
                        } else if constexpr (std::is_same_v<T, ssa::TermUnreachable>) {
                            ok = trap_(backend::vm::TrapCode::kUnreachable);
                        }
                    }, b.term);

                    if (!ok) return false;
                    if (done) break;
                }
                --depth_;
                return true;
            }

            const ssa::Module& m_;
            const ty::TypePool& types_;
            TestHost& host_;
            std::string unit_;
            EvalLimits limits_;

            RunResult out_{};
            bool stopped_ = false;
            uint64_t steps_ = 0;
            uint32_t depth_ = 0;
        };

    } // namespace

    RunResult eval_function(
        const ssa::Module& m,
        const ty::TypePool& types,
        ssa::FuncId fid,
        const std::vector<uint64_t>& args,
        TestHost& host,
        std::string_view unit,
        const EvalLimits& limits
    ) {
        Evaluator ev(m, types, host, unit, limits);
        return ev.run(fid, args);
    }

} // namespace vellum::harness
