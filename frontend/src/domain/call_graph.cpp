// frontend/src/domain/call_graph.cpp
#include <vellum/domain/CallGraph.hpp>

#include <algorithm>


namespace vellum::domain {

    namespace {

        class Tarjan final {
        public:
            explicit Tarjan(CallGraph& g)
                : g_(g),
                  index_(g.callees.size(), kUnvisited),
                  low_(g.callees.size(), 0),
                  on_stack_(g.callees.size(), 0) {}

            void run() {
                for (FuncId f = 0; f < g_.callees.size(); ++f) {
                    if (index_[f] == kUnvisited) visit_(f);
                }
            }

        private:
            static constexpr uint32_t kUnvisited = 0xFFFF'FFFFu;

            void visit_(FuncId v) {
                index_[v] = low_[v] = next_index_++;
                stack_.push_back(v);
                on_stack_[v] = 1;

                for (auto w : g_.callees[v]) {
                    if (index_[w] == kUnvisited) {
                        visit_(w);
                        low_[v] = std::min(low_[v], low_[w]);
                    } else if (on_stack_[w]) {
                        low_[v] = std::min(low_[v], index_[w]);
                    }
                }

                if (low_[v] != index_[v]) return;

                // v가 SCC의 root: 스택에서 멤버를 꺼낸다.
                std::vector<FuncId> scc;
                for (;;) {
                    const FuncId w = stack_.back();
                    stack_.pop_back();
                    on_stack_[w] = 0;
                    g_.scc_of[w] = static_cast<uint32_t>(g_.sccs.size());
                    scc.push_back(w);
                    if (w == v) break;
                }
                std::sort(scc.begin(), scc.end());
                g_.sccs.push_back(std::move(scc));
            }

            CallGraph& g_;
            std::vector<uint32_t> index_;
            std::vector<uint32_t> low_;
            std::vector<uint8_t> on_stack_;
            std::vector<FuncId> stack_;
            uint32_t next_index_ = 0;
        };

    } // namespace

    bool CallGraph::is_cyclic(uint32_t scc) const {
        const auto& members = sccs[scc];
        if (members.size() > 1) return true;
        const FuncId f = members.front();
        return std::find(callees[f].begin(), callees[f].end(), f) != callees[f].end();
    }

    CallGraph build_call_graph(const ssa::Module& m) {
        CallGraph g{};
        g.callees.resize(m.funcs.size());
        g.scc_of.assign(m.funcs.size(), 0);

        for (FuncId fi = 0; fi < m.funcs.size(); ++fi) {
            const auto& f = m.funcs[fi];
            if (f.excluded) continue;

            auto& out = g.callees[fi];
            for (auto bb : f.blocks) {
                for (auto iid : m.blocks[bb].insts) {
                    const auto* c = std::get_if<ssa::InstCall>(&m.insts[iid].data);
                    if (c == nullptr || c->callee >= m.funcs.size()) continue;
                    out.push_back(c->callee);
                }
            }
            std::sort(out.begin(), out.end());
            out.erase(std::unique(out.begin(), out.end()), out.end());
        }

        Tarjan t(g);
        t.run();
        return g;
    }

} // namespace vellum::domain
