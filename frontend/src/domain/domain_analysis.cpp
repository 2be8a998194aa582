// frontend/src/domain/domain_analysis.cpp
#include <vellum/domain/Analyzer.hpp>
#include <vellum/ssa/Cfg.hpp>
#include <vellum/ssa/Fold.hpp>

#include <algorithm>
#include <string_view>
#include <type_traits>


namespace vellum::domain {

    namespace {

        using ssa::BlockId;
        using ssa::ValueId;
        using ssa::kInvalidId;

        /// @brief 키 후보 하나. 정수는 워드, 바이트열은 원문.
        struct KeyConst {
            bool is_bytes = false;
            uint64_t word = 0;
            std::string bytes;

            bool operator==(const KeyConst& o) const {
                return is_bytes == o.is_bytes && word == o.word && bytes == o.bytes;
            }
        };

        void add_unique_(std::vector<KeyConst>& out, KeyConst k) {
            if (std::find(out.begin(), out.end(), k) == out.end()) out.push_back(std::move(k));
        }

        void insert_sorted_(std::vector<uint32_t>& set, uint32_t id) {
            auto it = std::lower_bound(set.begin(), set.end(), id);
            if (it == set.end() || *it != id) set.insert(it, id);
        }

        void union_into_(std::vector<uint32_t>& dst, const std::vector<uint32_t>& src) {
            for (auto id : src) insert_sorted_(dst, id);
        }

        /// @brief 함수 하나의 키 식을 상수 후보 집합으로 해석한다.
        ///
        /// 상수, 캐스트, 정수 연산(후보의 곱집합), 구조체 필드 투영,
        /// ok 결과의 값, 그리고 선행 블록 간선 인자를 따라가는 block param을 다룬다.
        class KeyResolver final {
        public:
            KeyResolver(const ssa::Module& m, const ty::TypePool& types,
                        const ssa::Function& f, uint32_t max_keys)
                : m_(m), types_(types), max_keys_(max_keys),
                  preds_(ssa::build_preds(m, f)),
                  visiting_(m.values.size(), 0) {}

            bool resolve(ValueId v, std::vector<KeyConst>& out) {
                return resolve_(v, 0, out);
            }

        private:
            static constexpr uint32_t kMaxDepth = 16;

            bool resolve_(ValueId v, uint32_t depth, std::vector<KeyConst>& out) {
                if (v == kInvalidId || (size_t)v >= m_.values.size()) return false;
                if (depth > kMaxDepth) return false;
                if (visiting_[v]) return false;

                visiting_[v] = 1;
                const auto& val = m_.values[v];
                const bool ok = (val.def_b == kInvalidId)
                    ? resolve_inst_(val.def_a, depth, out)
                    : resolve_param_(val.def_a, val.def_b, v, depth, out);
                visiting_[v] = 0;
                return ok && out.size() <= max_keys_;
            }

            bool resolve_inst_(ssa::InstId iid, uint32_t depth, std::vector<KeyConst>& out) {
                if (iid == kInvalidId || (size_t)iid >= m_.insts.size()) return false;
                const auto& inst = m_.insts[iid];

                return std::visit([&](auto&& x) -> bool {
                    using T = std::decay_t<decltype(x)>;
                    if constexpr (std::is_same_v<T, ssa::InstConstInt>) {
                        add_unique_(out, KeyConst{false, x.bits, {}});
                        return true;
                    } else if constexpr (std::is_same_v<T, ssa::InstConstBool>) {
                        add_unique_(out, KeyConst{false, x.value ? 1u : 0u, {}});
                        return true;
                    } else if constexpr (std::is_same_v<T, ssa::InstConstBytes>) {
                        add_unique_(out, KeyConst{true, 0, x.bytes});
                        return true;
                    } else if constexpr (std::is_same_v<T, ssa::InstCast>) {
                        std::vector<KeyConst> src;
                        if (!resolve_(x.src, depth + 1, src)) return false;
                        const auto from = ssa::int_kind_of(types_, m_.values[x.src].ty);
                        const auto to = ssa::int_kind_of(types_, x.to);
                        if (from.bits == 0 || to.bits == 0) return false;
                        for (const auto& s : src) {
                            if (s.is_bytes) return false;
                            const auto r = ssa::fold_cast(x.mode, from, to, s.word);
                            if (r.status != ssa::FoldStatus::kValue) return false;
                            add_unique_(out, KeyConst{false, r.value, {}});
                        }
                        return true;
                    } else if constexpr (std::is_same_v<T, ssa::InstUnary>) {
                        std::vector<KeyConst> src;
                        if (!resolve_(x.src, depth + 1, src)) return false;
                        const auto k = ssa::int_kind_of(types_, m_.values[x.src].ty);
                        if (k.bits == 0) return false;
                        for (const auto& s : src) {
                            if (s.is_bytes) return false;
                            uint64_t w = 0;
                            if (x.op == ssa::UnOp::Not) {
                                w = s.word ^ 1u;
                            } else if (x.op == ssa::UnOp::BitNot) {
                                w = ty::normalize(k, ~s.word);
                            } else {
                                const auto r = ssa::fold_neg(x.mode, k, s.word);
                                if (r.status != ssa::FoldStatus::kValue) return false;
                                w = r.value;
                            }
                            add_unique_(out, KeyConst{false, w, {}});
                        }
                        return true;
                    } else if constexpr (std::is_same_v<T, ssa::InstBinOp>) {
                        // checked 연산은 result<T>라 키가 될 수 없다.
                        if (x.mode == ssa::ArithMode::Checked) return false;
                        std::vector<KeyConst> lhs;
                        std::vector<KeyConst> rhs;
                        if (!resolve_(x.lhs, depth + 1, lhs)) return false;
                        if (!resolve_(x.rhs, depth + 1, rhs)) return false;
                        if ((uint64_t)lhs.size() * rhs.size() > max_keys_) return false;

                        const auto k = ssa::int_kind_of(types_, m_.values[x.lhs].ty);
                        if (k.bits == 0) return false;
                        for (const auto& a : lhs) {
                            for (const auto& b : rhs) {
                                if (a.is_bytes || b.is_bytes) return false;
                                const auto r = ssa::fold_binop(x.op, x.mode, k, a.word, b.word);
                                if (r.status != ssa::FoldStatus::kValue) return false;
                                add_unique_(out, KeyConst{false, r.value, {}});
                            }
                        }
                        return true;
                    } else if constexpr (std::is_same_v<T, ssa::InstExtractField>) {
                        const ValueId field = project_field_(x.base, x.index);
                        if (field == kInvalidId) return false;
                        return resolve_(field, depth + 1, out);
                    } else if constexpr (std::is_same_v<T, ssa::InstResultValue>) {
                        const ValueId payload = ok_payload_(x.src);
                        if (payload == kInvalidId) return false;
                        return resolve_(payload, depth + 1, out);
                    } else {
                        return false;
                    }
                }, inst.data);
            }

            /// @brief 선행 블록들이 이 param 자리에 넘기는 인자를 모두 해석한다.
            bool resolve_param_(BlockId bb, uint32_t index, ValueId self, uint32_t depth,
                                std::vector<KeyConst>& out) {
                if ((size_t)bb >= preds_.size()) return false;
                const auto& preds = preds_[bb];
                // entry block param == 함수 매개변수: 호출마다 달라진다.
                if (preds.empty()) return false;

                std::vector<BlockId> seen;
                for (auto p : preds) {
                    if (std::find(seen.begin(), seen.end(), p) != seen.end()) continue;
                    seen.push_back(p);

                    const auto& pb = m_.blocks[p];
                    if (!pb.has_term) return false;

                    bool ok = true;
                    auto visit_edge = [&](BlockId target, const std::vector<ValueId>& args) {
                        if (!ok || target != bb) return;
                        if (index >= args.size()) {
                            ok = false;
                            return;
                        }
                        // 값을 그대로 돌려보내는 back-edge는 후보를 늘리지 않는다.
                        if (args[index] == self) return;
                        if (!resolve_(args[index], depth + 1, out)) ok = false;
                    };

                    std::visit([&](auto&& t) {
                        using T = std::decay_t<decltype(t)>;
                        if constexpr (std::is_same_v<T, ssa::TermBr>) {
                            visit_edge(t.target, t.args);
                        } else if constexpr (std::is_same_v<T, ssa::TermCondBr>) {
                            visit_edge(t.then_bb, t.then_args);
                            visit_edge(t.else_bb, t.else_args);
                        }
                    }, pb.term);

                    if (!ok || out.size() > max_keys_) return false;
                }
                return !out.empty();
            }

            ValueId project_field_(ValueId base, uint32_t index) const {
                for (uint32_t guard = 0; guard < kMaxDepth; ++guard) {
                    if (base == kInvalidId || (size_t)base >= m_.values.size()) return kInvalidId;
                    const auto& bv = m_.values[base];
                    if (bv.def_b != kInvalidId || (size_t)bv.def_a >= m_.insts.size()) return kInvalidId;

                    const auto& data = m_.insts[bv.def_a].data;
                    if (const auto* ms = std::get_if<ssa::InstMakeStruct>(&data)) {
                        return index < ms->fields.size() ? ms->fields[index] : kInvalidId;
                    }
                    if (const auto* ins = std::get_if<ssa::InstInsertField>(&data)) {
                        if (ins->index == index) return ins->value;
                        base = ins->base;
                        continue;
                    }
                    return kInvalidId;
                }
                return kInvalidId;
            }

            ValueId ok_payload_(ValueId src) const {
                if (src == kInvalidId || (size_t)src >= m_.values.size()) return kInvalidId;
                const auto& sv = m_.values[src];
                if (sv.def_b != kInvalidId || (size_t)sv.def_a >= m_.insts.size()) return kInvalidId;
                const auto* mr = std::get_if<ssa::InstMakeResult>(&m_.insts[sv.def_a].data);
                if (mr == nullptr || !mr->is_ok) return kInvalidId;
                return mr->value;
            }

            const ssa::Module& m_;
            const ty::TypePool& types_;
            uint32_t max_keys_;
            std::vector<std::vector<BlockId>> preds_;
            std::vector<uint8_t> visiting_;
        };

        /// @brief 선언 집합이 키 하나를 덮는지(같은 키이거나 같은 네임스페이스의 와일드카드).
        bool covered_by_(const InternTable& keys, uint32_t id, const std::vector<uint32_t>& declared) {
            const auto& k = keys.get(id);
            for (auto d : declared) {
                const auto& dk = keys.get(d);
                if (d == id) return true;
                if (dk.wildcard && dk.hash == k.scope) return true;
            }
            return false;
        }

        /// @brief 선언된 키가 계산 결과 중 하나라도 건드리는지.
        bool touched_by_(const InternTable& keys, uint32_t id, const std::vector<uint32_t>& computed) {
            const DomainEntry e = entry_of(keys.get(id));
            for (auto c : computed) {
                if (overlaps(e, entry_of(keys.get(c)))) return true;
            }
            return false;
        }

        class Analyzer final {
        public:
            Analyzer(const ssa::Module& m, const ty::TypePool& types, diag::Bag& bag, const Options& opt)
                : m_(m), types_(types), bag_(bag), opt_(opt),
                  unit_(opt.unit_id.empty() ? m.unit_id : opt.unit_id) {}

            AnalysisResult run() {
                AnalysisResult r{};
                r.fns.resize(m_.funcs.size());
                r.fn_ok.assign(m_.funcs.size(), true);
                anns_.resize(m_.funcs.size());

                // 1) 어노테이션 + 본문 접근(intra-procedural)
                for (ssa::FuncId fid = 0; fid < m_.funcs.size(); ++fid) {
                    const auto& f = m_.funcs[fid];
                    auto& fd = r.fns[fid];

                    if (!parse_annotations(f.attrs, anns_[fid], bag_)) {
                        r.fn_ok[fid] = false;
                    }
                    const auto& ann = anns_[fid];
                    fd.proofs = ann.proofs;

                    if (ann.no_state) {
                        fd.source = DomainSource::kTrusted;
                        continue;
                    }
                    declare_(r, fid);
                    if (f.excluded) continue;

                    collect_local_(r, fid);
                    if (fd.rejected) r.fn_ok[fid] = false;
                }

                // 2) 호출 그래프 SCC를 callee 먼저 순서로 고정점까지
                r.graph = build_call_graph(m_);
                r.stats.scc_count = static_cast<uint32_t>(r.graph.sccs.size());
                for (uint32_t si = 0; si < r.graph.sccs.size(); ++si) {
                    const bool cyclic = r.graph.is_cyclic(si);
                    if (cyclic) ++r.stats.cyclic_sccs;
                    for (;;) {
                        ++r.stats.fixpoint_passes;
                        bool changed = false;
                        for (auto fid : r.graph.sccs[si]) {
                            if (aggregate_(r, fid)) changed = true;
                        }
                        if (!cyclic || !changed) break;
                    }
                }

                // 3) override와 계산 결과 비교
                for (ssa::FuncId fid = 0; fid < m_.funcs.size(); ++fid) {
                    if (anns_[fid].no_state || m_.funcs[fid].excluded) continue;
                    reconcile_(r, fid);
                }

                r.keys = std::move(keys_);
                r.ok = std::all_of(r.fn_ok.begin(), r.fn_ok.end(), [](bool b) { return b; });
                return r;
            }

        private:
            uint32_t intern_declared_(const DeclaredKey& k) {
                return keys_.intern(k.wildcard ? make_wildcard(unit_, k.ns) : make_key(unit_, k.ns, k.key));
            }

            void declare_(AnalysisResult& r, ssa::FuncId fid) {
                const auto& ann = anns_[fid];
                auto& fd = r.fns[fid];
                if (ann.has_reads) {
                    fd.reads_declared = true;
                    for (const auto& k : ann.reads) insert_sorted_(fd.reads, intern_declared_(k));
                }
                if (ann.has_writes) {
                    fd.writes_declared = true;
                    for (const auto& k : ann.writes) insert_sorted_(fd.writes, intern_declared_(k));
                }
                if (ann.has_reads || ann.has_writes) fd.source = DomainSource::kDeclared;
            }

            void collect_local_(AnalysisResult& r, ssa::FuncId fid) {
                const auto& f = m_.funcs[fid];
                KeyResolver resolver(m_, types_, f, opt_.max_enumerated_keys);

                for (auto bb : f.blocks) {
                    if (bb == kInvalidId || (size_t)bb >= m_.blocks.size()) continue;
                    for (auto iid : m_.blocks[bb].insts) {
                        const auto& inst = m_.insts[iid];
                        std::visit([&](auto&& x) {
                            using T = std::decay_t<decltype(x)>;
                            if constexpr (std::is_same_v<T, ssa::InstStateRead> ||
                                          std::is_same_v<T, ssa::InstStateHas>) {
                                access_(r, fid, resolver, x.ns, x.key, false, inst.span);
                            } else if constexpr (std::is_same_v<T, ssa::InstStateWrite>) {
                                access_(r, fid, resolver, x.ns, x.key, true, inst.span);
                            }
                        }, inst.data);
                    }
                }
            }

            void access_(AnalysisResult& r, ssa::FuncId fid, KeyResolver& resolver,
                         const std::string& ns, ValueId key, bool is_write, Span span) {
                auto& fd = r.fns[fid];
                ++r.stats.accesses;

                std::vector<KeyConst> cands;
                const bool resolved = resolver.resolve(key, cands) && !cands.empty();

                std::vector<uint32_t> ids;
                if (resolved) {
                    const auto kind = ssa::int_kind_of(types_, m_.values[key].ty);
                    for (const auto& c : cands) {
                        const std::string text = c.is_bytes
                            ? render_bytes_key(c.bytes)
                            : render_int_key(c.word, kind.is_signed);
                        ids.push_back(keys_.intern(make_key(unit_, ns, text)));
                    }
                } else if (opt_.wildcard_policy == WildcardPolicy::kReject) {
                    diag::Diagnostic d(diag::Severity::kError, diag::Code::kDomainDynamicKeyRejected, span);
                    d.add_arg(m_.funcs[fid].name);
                    d.add_arg(ns);
                    bag_.add(std::move(d));
                    fd.rejected = true;
                    return;
                } else {
                    const uint32_t wid = keys_.intern(make_wildcard(unit_, ns));
                    diag::Diagnostic d(diag::Severity::kNote, diag::Code::kDomainWildcardFallback, span);
                    d.add_arg(m_.funcs[fid].name);
                    d.add_arg(ns);
                    d.add_arg(keys_.get(wid).canonical);
                    bag_.add(std::move(d));
                    ++fd.wildcard_fallbacks;
                    ++r.stats.wildcard_fallbacks;
                    ids.push_back(wid);
                }

                for (auto id : ids) {
                    insert_sorted_(is_write ? fd.local_writes : fd.local_reads, id);
                    fd.accesses.push_back(LocalAccess{id, is_write, span});
                }
            }

            /// @brief local 집합과 callee의 권위 있는 집합을 합친다. 권위 있는 집합이 바뀌면 true.
            bool aggregate_(AnalysisResult& r, ssa::FuncId fid) {
                auto& fd = r.fns[fid];
                if (anns_[fid].no_state || m_.funcs[fid].excluded) return false;

                std::vector<uint32_t> reads = fd.local_reads;
                std::vector<uint32_t> writes = fd.local_writes;
                for (auto c : r.graph.callees[fid]) {
                    union_into_(reads, r.fns[c].reads);
                    union_into_(writes, r.fns[c].writes);
                }
                fd.computed_reads = std::move(reads);
                fd.computed_writes = std::move(writes);

                bool changed = false;
                if (!fd.reads_declared && fd.reads != fd.computed_reads) {
                    fd.reads = fd.computed_reads;
                    changed = true;
                }
                if (!fd.writes_declared && fd.writes != fd.computed_writes) {
                    fd.writes = fd.computed_writes;
                    changed = true;
                }
                return changed;
            }

            /// @brief 접근이 본문에 있으면 그 위치를, 아니면 함수 위치를 쓴다.
            Span where_(const FunctionDomains& fd, uint32_t id, bool is_write, ssa::FuncId fid) const {
                for (const auto& a : fd.accesses) {
                    if (a.key == id && a.is_write == is_write) return a.span;
                }
                return m_.funcs[fid].span;
            }

            void compare_set_(ssa::FuncId fid, const FunctionDomains& fd,
                              const std::vector<uint32_t>& computed,
                              const std::vector<uint32_t>& declared,
                              bool is_write) {
                const char* set_name = is_write ? "writes" : "reads";

                for (auto id : computed) {
                    if (covered_by_(keys_, id, declared)) continue;
                    diag::Diagnostic d(diag::Severity::kWarning, diag::Code::kDomainUnderDeclared,
                                       where_(fd, id, is_write, fid));
                    d.add_arg(m_.funcs[fid].name);
                    d.add_arg(set_name);
                    d.add_arg(keys_.get(id).canonical);
                    bag_.add(std::move(d));
                }
                for (auto id : declared) {
                    if (touched_by_(keys_, id, computed)) continue;
                    diag::Diagnostic d(diag::Severity::kNote, diag::Code::kDomainOverDeclared, m_.funcs[fid].span);
                    d.add_arg(m_.funcs[fid].name);
                    d.add_arg(set_name);
                    d.add_arg(keys_.get(id).canonical);
                    bag_.add(std::move(d));
                }
            }

            void reconcile_(const AnalysisResult& r, ssa::FuncId fid) {
                const auto& fd = r.fns[fid];
                if (fd.reads_declared) compare_set_(fid, fd, fd.computed_reads, fd.reads, false);
                if (fd.writes_declared) compare_set_(fid, fd, fd.computed_writes, fd.writes, true);
            }

            const ssa::Module& m_;
            const ty::TypePool& types_;
            diag::Bag& bag_;
            const Options& opt_;
            std::string unit_;

            InternTable keys_;
            std::vector<FnAnnotations> anns_;
        };

    } // namespace

    AccessSet AnalysisResult::access_set(ssa::FuncId f) const {
        AccessSet s{};
        if ((size_t)f >= fns.size()) return s;
        for (auto id : fns[f].reads) s.reads.push_back(entry_of(keys.get(id)));
        for (auto id : fns[f].writes) s.writes.push_back(entry_of(keys.get(id)));
        return s;
    }

    AnalysisResult analyze(const ssa::Module& m, const ty::TypePool& types, diag::Bag& bag, const Options& opt) {
        Analyzer a(m, types, bag, opt);
        return a.run();
    }

} // namespace vellum::domain
