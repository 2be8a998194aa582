// backend/src/meta/gas.cpp
#include <vellum/backend/meta/Gas.hpp>
#include <vellum/ssa/Cfg.hpp>

#include <limits>


namespace vellum::backend::meta {

    namespace {

        uint64_t sat_add_(uint64_t a, uint64_t b) {
            const uint64_t r = a + b;
            return (r < a) ? std::numeric_limits<uint64_t>::max() : r;
        }

        uint64_t sat_mul_(uint64_t a, uint64_t b) {
            if (a == 0 || b == 0) return 0;
            if (a > std::numeric_limits<uint64_t>::max() / b) return std::numeric_limits<uint64_t>::max();
            return a * b;
        }

        class Estimator final {
        public:
            explicit Estimator(const std::vector<FunctionGas>& fns)
                : fns_(fns), state_(fns.size(), kNew), total_(fns.size(), 0) {}

            std::vector<uint64_t> run() {
                for (size_t f = 0; f < fns_.size(); ++f) visit_(static_cast<ssa::FuncId>(f));
                return total_;
            }

        private:
            enum State : uint8_t { kNew, kActive, kDone };

            uint64_t visit_(ssa::FuncId f) {
                if (!fns_[f].present) return 0;
                if (state_[f] == kDone) return total_[f];
                // 사이클: 진행 중인 callee는 지역 비용만 한 번 센다.
                if (state_[f] == kActive) return fns_[f].local;

                state_[f] = kActive;
                uint64_t sum = fns_[f].local;
                for (const auto& c : fns_[f].calls) {
                    if ((size_t)c.callee >= fns_.size()) continue;
                    sum = sat_add_(sum, sat_mul_(c.weight, visit_(c.callee)));
                }
                state_[f] = kDone;
                total_[f] = sum;
                return sum;
            }

            const std::vector<FunctionGas>& fns_;
            std::vector<State> state_;
            std::vector<uint64_t> total_;
        };

    } // namespace

    uint64_t op_cost(const GasTable& t, vm::Op op) {
        switch (op) {
            case vm::Op::kNop:
            case vm::Op::kJmp:
                return 0;
            case vm::Op::kLoad:
            case vm::Op::kStore:
                return t.memory_op;
            case vm::Op::kMemCopy:
                return t.copy_op;
            case vm::Op::kDivS:
            case vm::Op::kDivU:
            case vm::Op::kRemS:
            case vm::Op::kRemU:
                return t.div_op;
            case vm::Op::kCall:
                return t.call_op;
            default:
                return t.op;
        }
    }

    std::vector<uint32_t> loop_depths(const ssa::Module& m, const ssa::Function& f) {
        std::vector<uint32_t> depth(m.blocks.size(), 0);
        if (f.entry == ssa::kInvalidId) return depth;

        const auto dom = ssa::build_dom_info(m, f);
        const auto preds = ssa::build_preds(m, f);

        // back-edge (x -> h, h가 x를 지배)를 header별로 모은다.
        std::vector<std::vector<ssa::BlockId>> latches(m.blocks.size());
        std::vector<ssa::BlockId> headers;
        for (auto x : f.blocks) {
            const auto& b = m.blocks[x];
            if (!b.has_term) continue;
            ssa::for_each_successor(b.term, [&](ssa::BlockId h) {
                if (!ssa::dominates(dom, h, x)) return;
                if (latches[h].empty()) headers.push_back(h);
                latches[h].push_back(x);
            });
        }

        // header마다 자연 루프 본문: latch에서 header를 넘지 않고 거슬러 닿는 블록.
        for (auto h : headers) {
            std::vector<uint8_t> in_loop(m.blocks.size(), 0);
            std::vector<ssa::BlockId> work;
            in_loop[h] = 1;
            for (auto x : latches[h]) {
                if (in_loop[x]) continue;
                in_loop[x] = 1;
                work.push_back(x);
            }
            while (!work.empty()) {
                const ssa::BlockId cur = work.back();
                work.pop_back();
                for (auto p : preds[cur]) {
                    if (in_loop[p]) continue;
                    in_loop[p] = 1;
                    work.push_back(p);
                }
            }
            for (size_t i = 0; i < in_loop.size(); ++i) {
                if (in_loop[i]) ++depth[i];
            }
        }
        return depth;
    }

    uint64_t loop_weight(const GasTable& t, uint32_t depth) {
        uint64_t w = 1;
        const uint32_t d = (depth < t.max_loop_depth) ? depth : t.max_loop_depth;
        for (uint32_t i = 0; i < d; ++i) w = sat_mul_(w, t.loop_factor);
        return w;
    }

    std::vector<uint64_t> estimate_gas(const std::vector<FunctionGas>& fns) {
        Estimator e(fns);
        return e.run();
    }

} // namespace vellum::backend::meta
