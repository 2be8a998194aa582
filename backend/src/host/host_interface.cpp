// backend/src/host/host_interface.cpp
#include <vellum/backend/host/HostInterface.hpp>

#include <algorithm>


namespace vellum::backend::host {

    namespace {

        constexpr int32_t kNotFound = static_cast<int32_t>(HostStatus::kNotFound);

        std::vector<HostModule> build_table_() {
            using A = ArgShape;
            std::vector<HostModule> t;

            // 상태 접근: 첫 인자는 도메인 descriptor(kDomainArgLen 바이트)다.
            t.push_back(HostModule{
                "vellum.state", 1,
                {
                    HostFunction{HostOp::kStateRead, "read",
                                 {A::kInPtrLen, A::kInPtrLen, A::kOutPtrCap},
                                 RetShape::kStatus, 200, {kNotFound}, 0},
                    HostFunction{HostOp::kStateWrite, "write",
                                 {A::kInPtrLen, A::kInPtrLen, A::kInPtrLen},
                                 RetShape::kStatus, 500, {}, 0},
                    HostFunction{HostOp::kStateHas, "has",
                                 {A::kInPtrLen, A::kInPtrLen},
                                 RetShape::kStatus, 100, {}, 0},
                },
            });

            t.push_back(HostModule{
                "vellum.ctx", 1,
                {
                    HostFunction{HostOp::kCtxQuery, "query",
                                 {A::kWord, A::kOutPtrCap},
                                 RetShape::kStatus, 20, {}, 0},
                },
            });

            t.push_back(HostModule{
                "vellum.crypto", 1,
                {
                    HostFunction{HostOp::kSha256, "sha256",
                                 {A::kInPtrLen, A::kOutPtr},
                                 RetShape::kStatus, 60, {}, 32},
                },
            });

            t.push_back(HostModule{
                "vellum.log", 1,
                {
                    HostFunction{HostOp::kLogEmit, "emit",
                                 {A::kInPtrLen, A::kInPtrLen},
                                 RetShape::kStatus, 80, {}, 0},
                },
            });

            t.push_back(HostModule{
                "vellum.abort", 1,
                {
                    HostFunction{HostOp::kRevert, "revert", {A::kInPtrLen}, RetShape::kNoReturn, 10, {}, 0},
                    HostFunction{HostOp::kPanic, "panic", {A::kInPtrLen}, RetShape::kNoReturn, 10, {}, 0},
                },
            });
            return t;
        }

    } // namespace

    const std::vector<HostModule>& host_modules() {
        static const std::vector<HostModule> table = build_table_();
        return table;
    }

    HostRef lookup(HostOp op) {
        for (const auto& m : host_modules()) {
            for (const auto& f : m.funcs) {
                if (f.op == op) return HostRef{&m, &f};
            }
        }
        return HostRef{};
    }

    HostRef lookup(std::string_view module, uint32_t version, std::string_view name) {
        for (const auto& m : host_modules()) {
            if (m.name != module || m.version != version) continue;
            for (const auto& f : m.funcs) {
                if (f.name == name) return HostRef{&m, &f};
            }
        }
        return HostRef{};
    }

    uint32_t word_arity(const HostFunction& fn) {
        uint32_t n = 0;
        for (auto a : fn.args) {
            n += (a == ArgShape::kWord || a == ArgShape::kOutPtr) ? 1u : 2u;
        }
        return n;
    }

    bool is_recoverable(const HostFunction& fn, int32_t status) {
        return std::find(fn.recoverable.begin(), fn.recoverable.end(), status) != fn.recoverable.end();
    }

    std::string qualified_name(const HostModule& m) {
        return std::string(m.name) + "@" + std::to_string(m.version);
    }

    const char* status_name(int32_t status) {
        if (status >= 0) return "ok";
        switch (static_cast<HostStatus>(status)) {
            case HostStatus::kNotFound: return "not-found";
            case HostStatus::kInvalidArgument: return "invalid-argument";
            case HostStatus::kBufferTooSmall: return "buffer-too-small";
            case HostStatus::kLimitExceeded: return "limit-exceeded";
            case HostStatus::kOutOfResource: return "out-of-resource";
            case HostStatus::kInternalError: return "internal-error";
            case HostStatus::kDomainDenied: return "domain-denied";
        }
        return "unknown";
    }

} // namespace vellum::backend::host
