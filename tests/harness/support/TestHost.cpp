// tests/harness/support/TestHost.cpp
#include "TestHost.hpp"

#include <vellum/backend/host/HostInterface.hpp>
#include <vellum/domain/DomainKey.hpp>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/SHA256.h>

#include <utility>


namespace vellum::harness {

    std::string TestHost::slot_(std::string_view domain, std::string_view key) {
        std::string s(domain);
        s.push_back('\0');
        s.append(key);
        return s;
    }

    bool TestHost::read(std::string_view domain, std::string_view key, std::string& out) const {
        auto it = state_.find(slot_(domain, key));
        if (it == state_.end()) return false;
        out = it->second;
        return true;
    }

    void TestHost::write(std::string_view domain, std::string_view key, std::string_view value) {
        state_[slot_(domain, key)] = std::string(value);
        ++writes_;
    }

    bool TestHost::has(std::string_view domain, std::string_view key) const {
        return state_.count(slot_(domain, key)) != 0;
    }

    void TestHost::restrict_writes(std::vector<domain::DomainEntry> allowed) {
        restricted_ = true;
        allowed_writes_ = std::move(allowed);
    }

    bool TestHost::allows_write(std::string_view descriptor) const {
        if (!restricted_) return true;
        if (descriptor.size() != backend::host::kDomainArgLen) return false;

        const std::string_view scope = descriptor.substr(0, 32);
        const std::string_view exact = descriptor.substr(32);
        const bool resolved = exact.find_first_not_of('\0') != std::string_view::npos;

        for (const auto& e : allowed_writes_) {
            const std::string_view es(reinterpret_cast<const char*>(e.scope.data()), e.scope.size());
            const std::string_view eh(reinterpret_cast<const char*>(e.hash.data()), e.hash.size());
            if (es != scope) continue;
            if (e.wildcard || !resolved || eh == exact) return true;
        }
        return false;
    }

    std::string TestHost::context(uint32_t query) const {
        using backend::host::CtxQuery;
        switch (static_cast<CtxQuery>(query)) {
            case CtxQuery::kCaller: return caller;
            case CtxQuery::kSelf: return self;
            case CtxQuery::kBlockHeight: return word_bytes(block_height);
            case CtxQuery::kTimestamp: return word_bytes(timestamp);
            case CtxQuery::kCallValue: return word_bytes(call_value);
        }
        return {};
    }

    std::string domain_of(std::string_view unit, std::string_view ns) {
        const auto wk = domain::make_wildcard(unit, ns);
        return std::string(wk.hash.begin(), wk.hash.end());
    }

    std::string descriptor_of(std::string_view unit, std::string_view ns, std::string_view key_text) {
        std::string d = domain_of(unit, ns);
        if (key_text.empty()) {
            d.append(backend::host::kDomainArgLen - d.size(), '\0');
        } else {
            const auto k = domain::make_key(unit, ns, key_text);
            d.append(k.hash.begin(), k.hash.end());
        }
        return d;
    }

    std::string_view scope_of(std::string_view descriptor) {
        return descriptor.substr(0, 32);
    }

    std::string word_bytes(uint64_t w) {
        std::string s(8, '\0');
        for (int i = 0; i < 8; ++i) s[i] = static_cast<char>((w >> (8 * i)) & 0xFF);
        return s;
    }

    uint64_t word_from(std::string_view bytes) {
        uint64_t w = 0;
        for (size_t i = 0; i < bytes.size() && i < 8; ++i) {
            w |= static_cast<uint64_t>(static_cast<uint8_t>(bytes[i])) << (8 * i);
        }
        return w;
    }

    std::string sha256_bytes(std::string_view data) {
        const auto* p = reinterpret_cast<const uint8_t*>(data.data());
        const auto h = llvm::SHA256::hash(llvm::ArrayRef<uint8_t>(p, data.size()));
        return std::string(h.begin(), h.end());
    }

    void put_word(TestHost& h, std::string_view unit, std::string_view ns, std::string_view key, uint64_t value) {
        h.write(domain_of(unit, ns), key, word_bytes(value));
    }

    bool get_word(const TestHost& h, std::string_view unit, std::string_view ns, std::string_view key, uint64_t& out) {
        std::string v;
        if (!h.read(domain_of(unit, ns), key, v)) return false;
        out = word_from(v);
        return true;
    }

} // namespace vellum::harness
