// frontend/src/ssa/ssa_dump.cpp
#include <vellum/ssa/Dump.hpp>

#include <ostream>
#include <type_traits>


namespace vellum::ssa {

    namespace {

        const char* effect_name_(Effect e) {
            switch (e) {
                case Effect::Pure: return "Pure";
                case Effect::MayReadMem: return "MayReadMem";
                case Effect::MayWriteMem: return "MayWriteMem";
                case Effect::MayTrap: return "MayTrap";
                case Effect::Call: return "Call";
            }
            return "Unknown";
        }

        const char* binop_name_(BinOp op) {
            switch (op) {
                case BinOp::Add: return "Add";
                case BinOp::Sub: return "Sub";
                case BinOp::Mul: return "Mul";
                case BinOp::Div: return "Div";
                case BinOp::Rem: return "Rem";
                case BinOp::Shl: return "Shl";
                case BinOp::Shr: return "Shr";
                case BinOp::And: return "And";
                case BinOp::Or: return "Or";
                case BinOp::Xor: return "Xor";
                case BinOp::Eq: return "Eq";
                case BinOp::Ne: return "Ne";
                case BinOp::Lt: return "Lt";
                case BinOp::Le: return "Le";
                case BinOp::Gt: return "Gt";
                case BinOp::Ge: return "Ge";
            }
            return "BinOp(?)";
        }

        const char* unop_name_(UnOp op) {
            switch (op) {
                case UnOp::Neg: return "Neg";
                case UnOp::Not: return "Not";
                case UnOp::BitNot: return "BitNot";
            }
            return "UnOp(?)";
        }

        const char* mode_name_(ArithMode m) {
            switch (m) {
                case ArithMode::Trap: return "trap";
                case ArithMode::Wrapping: return "wrapping";
                case ArithMode::Saturating: return "saturating";
                case ArithMode::Checked: return "checked";
            }
            return "mode(?)";
        }

        const char* context_name_(ContextQuery q) {
            switch (q) {
                case ContextQuery::Caller: return "caller";
                case ContextQuery::Self: return "self";
                case ContextQuery::BlockHeight: return "block_height";
                case ContextQuery::Timestamp: return "timestamp";
                case ContextQuery::CallValue: return "call_value";
            }
            return "ctx(?)";
        }

        void dump_values_(std::ostream& os, const std::vector<ValueId>& vs) {
            os << "[";
            for (size_t i = 0; i < vs.size(); ++i) {
                if (i) os << ", ";
                os << "v" << vs[i];
            }
            os << "]";
        }

    } // namespace

    void dump(const Module& m, const ty::TypePool& types, std::ostream& os) {
        os << "SSA unit=" << m.unit_id << "\n";
        os << "  funcs=" << m.funcs.size()
           << " blocks=" << m.blocks.size()
           << " insts=" << m.insts.size()
           << " values=" << m.values.size()
           << "\n";
        os << "  opt_stats:"
           << " blocks_removed=" << m.opt_stats.blocks_removed
           << " condbr_folded=" << m.opt_stats.condbr_folded
           << " consts_folded=" << m.opt_stats.consts_folded
           << " calls_inlined=" << m.opt_stats.calls_inlined
           << " insts_removed=" << m.opt_stats.insts_removed
           << "\n";

        for (size_t fi = 0; fi < m.funcs.size(); ++fi) {
            const auto& f = m.funcs[fi];
            os << "\n  fn #" << fi
               << " name=" << f.name
               << " ret=" << types.to_string(f.ret_ty);
            if (f.is_public) os << " pub";
            if (f.is_payable) os << " payable";
            if (f.excluded) {
                os << " <excluded>\n";
                continue;
            }
            os << " entry=bb#" << f.entry
               << " blocks=" << f.blocks.size()
               << "\n";

            for (auto bbid : f.blocks) {
                if (bbid == kInvalidId || (size_t)bbid >= m.blocks.size()) continue;
                const auto& b = m.blocks[bbid];

                os << "    bb #" << bbid
                   << " params=" << b.params.size()
                   << " insts=" << b.insts.size()
                   << "\n";

                for (auto vid : b.params) {
                    if ((size_t)vid >= m.values.size()) continue;
                    os << "      param v" << vid << " ty=" << types.to_string(m.values[vid].ty) << "\n";
                }

                for (auto iid : b.insts) {
                    if ((size_t)iid >= m.insts.size()) continue;
                    const auto& inst = m.insts[iid];

                    os << "      i" << iid << " eff=" << effect_name_(inst.eff);
                    if (inst.result != kInvalidId && (size_t)inst.result < m.values.size()) {
                        os << " -> v" << inst.result << " ty=" << types.to_string(m.values[inst.result].ty);
                    }
                    os << " : ";

                    std::visit([&](auto&& x) {
                        using T = std::decay_t<decltype(x)>;
                        if constexpr (std::is_same_v<T, InstConstInt>) {
                            os << "ConstInt " << x.bits;
                        } else if constexpr (std::is_same_v<T, InstConstBool>) {
                            os << "ConstBool " << (x.value ? "true" : "false");
                        } else if constexpr (std::is_same_v<T, InstConstBytes>) {
                            os << "ConstBytes len=" << x.bytes.size();
                        } else if constexpr (std::is_same_v<T, InstUnary>) {
                            os << "Unary " << unop_name_(x.op) << "." << mode_name_(x.mode) << " v" << x.src;
                        } else if constexpr (std::is_same_v<T, InstBinOp>) {
                            os << "BinOp " << binop_name_(x.op) << "." << mode_name_(x.mode)
                               << " v" << x.lhs << ", v" << x.rhs;
                        } else if constexpr (std::is_same_v<T, InstCast>) {
                            os << "Cast" << (x.mode == CastMode::Wrapping ? ".wrapping" : "")
                               << " to=" << types.to_string(x.to) << " v" << x.src;
                        } else if constexpr (std::is_same_v<T, InstCall>) {
                            os << "Call f#" << x.callee;
                            if ((size_t)x.callee < m.funcs.size()) os << " name=" << m.funcs[x.callee].name;
                            os << " args=";
                            dump_values_(os, x.args);
                        } else if constexpr (std::is_same_v<T, InstMakeStruct>) {
                            os << "MakeStruct ";
                            dump_values_(os, x.fields);
                        } else if constexpr (std::is_same_v<T, InstExtractField>) {
                            os << "ExtractField v" << x.base << " ." << x.index;
                        } else if constexpr (std::is_same_v<T, InstInsertField>) {
                            os << "InsertField v" << x.base << " ." << x.index << " = v" << x.value;
                        } else if constexpr (std::is_same_v<T, InstMakeResult>) {
                            os << (x.is_ok ? "MakeOk" : "MakeErr");
                            if (x.value != kInvalidId) os << " v" << x.value;
                        } else if constexpr (std::is_same_v<T, InstResultIsOk>) {
                            os << "ResultIsOk v" << x.src;
                        } else if constexpr (std::is_same_v<T, InstResultValue>) {
                            os << "ResultValue v" << x.src;
                        } else if constexpr (std::is_same_v<T, InstResultCode>) {
                            os << "ResultCode v" << x.src;
                        } else if constexpr (std::is_same_v<T, InstRefNew>) {
                            os << "RefNew v" << x.init;
                        } else if constexpr (std::is_same_v<T, InstRefLoad>) {
                            os << "RefLoad v" << x.ref;
                        } else if constexpr (std::is_same_v<T, InstRefStore>) {
                            os << "RefStore v" << x.ref << " = v" << x.value;
                        } else if constexpr (std::is_same_v<T, InstStateRead>) {
                            os << "StateRead " << x.ns << " key=v" << x.key;
                        } else if constexpr (std::is_same_v<T, InstStateWrite>) {
                            os << "StateWrite " << x.ns << " key=v" << x.key << " val=v" << x.value;
                        } else if constexpr (std::is_same_v<T, InstStateHas>) {
                            os << "StateHas " << x.ns << " key=v" << x.key;
                        } else if constexpr (std::is_same_v<T, InstContext>) {
                            os << "Context " << context_name_(x.query);
                        } else if constexpr (std::is_same_v<T, InstDigest>) {
                            os << "Digest v" << x.src;
                        } else if constexpr (std::is_same_v<T, InstEmit>) {
                            os << "Emit " << x.topic << " args=";
                            dump_values_(os, x.args);
                        } else if constexpr (std::is_same_v<T, InstBytesLen>) {
                            os << "BytesLen v" << x.src;
                        }
                    }, inst.data);
                    os << "\n";
                }

                if (!b.has_term) {
                    os << "      term: <none>\n";
                    continue;
                }
                std::visit([&](auto&& t) {
                    using T = std::decay_t<decltype(t)>;
                    if constexpr (std::is_same_v<T, TermRet>) {
                        if (!t.has_value) os << "      term: ret\n";
                        else os << "      term: ret v" << t.value << "\n";
                    } else if constexpr (std::is_same_v<T, TermBr>) {
                        os << "      term: br bb#" << t.target << " ";
                        dump_values_(os, t.args);
                        os << "\n";
                    } else if constexpr (std::is_same_v<T, TermCondBr>) {
                        os << "      term: condbr v" << t.cond << " then=bb#" << t.then_bb << " ";
                        dump_values_(os, t.then_args);
                        os << " else=bb#" << t.else_bb << " ";
                        dump_values_(os, t.else_args);
                        os << "\n";
                    } else if constexpr (std::is_same_v<T, TermRevert>) {
                        os << "      term: " << (t.kind == RevertKind::Abort ? "panic" : "revert")
                           << " \"" << t.message << "\"\n";
                    } else if constexpr (std::is_same_v<T, TermUnreachable>) {
                        os << "      term: unreachable\n";
                    }
                }, b.term);
            }
        }
    }

} // namespace vellum::ssa
