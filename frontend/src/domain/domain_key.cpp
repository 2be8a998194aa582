// frontend/src/domain/domain_key.cpp
#include <vellum/domain/DomainKey.hpp>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/SHA256.h>

#include <utility>


namespace vellum::domain {

    Hash hash_canonical(std::string_view canonical) {
        const auto* p = reinterpret_cast<const uint8_t*>(canonical.data());
        return llvm::SHA256::hash(llvm::ArrayRef<uint8_t>(p, canonical.size()));
    }

    std::string hash_hex(const Hash& h) {
        return llvm::toHex(llvm::ArrayRef<uint8_t>(h.data(), h.size()), /*LowerCase=*/true);
    }

    std::string canonical_key(std::string_view unit, std::string_view ns, std::string_view key) {
        std::string out;
        out.reserve(unit.size() + ns.size() + key.size() + 2);
        out.append(unit);
        out.push_back('.');
        out.append(ns);
        out.push_back(':');
        out.append(key);
        return out;
    }

    std::string canonical_wildcard(std::string_view unit, std::string_view ns) {
        return canonical_key(unit, ns, "*");
    }

    std::string render_int_key(uint64_t word, bool is_signed) {
        if (is_signed) return std::to_string(static_cast<int64_t>(word));
        return std::to_string(word);
    }

    std::string render_bytes_key(std::string_view bytes) {
        bool verbatim = !bytes.empty() && !(bytes.size() >= 2 && bytes[0] == '0' && bytes[1] == 'x');
        for (char c : bytes) {
            const auto u = static_cast<unsigned char>(c);
            if (u < 0x21 || u > 0x7E || c == ':' || c == '*') {
                verbatim = false;
                break;
            }
        }
        if (verbatim) return std::string(bytes);

        const auto* p = reinterpret_cast<const uint8_t*>(bytes.data());
        return "0x" + llvm::toHex(llvm::ArrayRef<uint8_t>(p, bytes.size()), /*LowerCase=*/true);
    }

    DomainKey make_key(std::string_view unit, std::string_view ns, std::string_view key) {
        DomainKey k{};
        k.ns = std::string(ns);
        k.key = std::string(key);
        k.canonical = canonical_key(unit, ns, key);
        k.hash = hash_canonical(k.canonical);
        k.scope = hash_canonical(canonical_wildcard(unit, ns));
        return k;
    }

    DomainKey make_wildcard(std::string_view unit, std::string_view ns) {
        DomainKey k{};
        k.ns = std::string(ns);
        k.wildcard = true;
        k.canonical = canonical_wildcard(unit, ns);
        k.hash = hash_canonical(k.canonical);
        k.scope = k.hash;
        return k;
    }

    DomainEntry entry_of(const DomainKey& k) {
        return DomainEntry{k.hash, k.scope, k.wildcard};
    }

    bool overlaps(const DomainEntry& a, const DomainEntry& b) {
        if (a.hash == b.hash) return true;
        if (a.wildcard && b.scope == a.hash) return true;
        if (b.wildcard && a.scope == b.hash) return true;
        return false;
    }

    bool conflicts(const AccessSet& a, const AccessSet& b) {
        auto any_overlap = [](const std::vector<DomainEntry>& xs, const std::vector<DomainEntry>& ys) {
            for (const auto& x : xs) {
                for (const auto& y : ys) {
                    if (overlaps(x, y)) return true;
                }
            }
            return false;
        };

        // read/read는 충돌하지 않는다.
        return any_overlap(a.writes, b.writes) ||
               any_overlap(a.writes, b.reads) ||
               any_overlap(a.reads, b.writes);
    }

    uint32_t InternTable::intern(DomainKey k) {
        auto it = index_.find(k.canonical);
        if (it != index_.end()) return it->second;

        const uint32_t id = static_cast<uint32_t>(keys_.size());
        index_.emplace(k.canonical, id);
        keys_.push_back(std::move(k));
        return id;
    }

    uint32_t InternTable::find(std::string_view canonical) const {
        auto it = index_.find(std::string(canonical));
        return (it == index_.end()) ? kInvalidKey : it->second;
    }

} // namespace vellum::domain
