// frontend/include/vellum/domain/DomainKey.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace vellum::domain {

    /// @brief SHA-256 출력(32바이트).
    using Hash = std::array<uint8_t, 32>;

    inline constexpr uint32_t kInvalidKey = 0xFFFF'FFFFu;

    /// @brief 정규화된 도메인 키 `<unit>.<ns>:<key>` 또는 와일드카드 `<unit>.<ns>:*`.
    struct DomainKey {
        std::string ns;
        std::string key;        // 와일드카드면 비어 있다
        bool wildcard = false;

        std::string canonical;
        Hash hash{};
        Hash scope{};           // 네임스페이스 와일드카드의 hash (와일드카드면 hash와 같다)
    };

    /// @brief 해시만으로 충돌을 판정하기 위한 항목.
    struct DomainEntry {
        Hash hash{};
        Hash scope{};
        bool wildcard = false;
    };

    /// @brief 함수 하나(또는 트랜잭션 하나)의 read/write 도메인 집합.
    struct AccessSet {
        std::vector<DomainEntry> reads;
        std::vector<DomainEntry> writes;
    };

    Hash hash_canonical(std::string_view canonical);
    std::string hash_hex(const Hash& h);

    std::string canonical_key(std::string_view unit, std::string_view ns, std::string_view key);
    std::string canonical_wildcard(std::string_view unit, std::string_view ns);

    /// @brief 정수 키는 10진수로 적는다.
    std::string render_int_key(uint64_t word, bool is_signed);

    /// @brief 출력 가능하고 ':'/'*'가 없는 바이트열은 그대로, 아니면 `0x` hex로 적는다.
    std::string render_bytes_key(std::string_view bytes);

    DomainKey make_key(std::string_view unit, std::string_view ns, std::string_view key);
    DomainKey make_wildcard(std::string_view unit, std::string_view ns);

    DomainEntry entry_of(const DomainKey& k);

    /// @brief 같은 키이거나 한쪽이 다른 쪽을 덮는 네임스페이스 와일드카드이면 겹친다.
    bool overlaps(const DomainEntry& a, const DomainEntry& b);

    /// @brief 두 집합이 겹치고 그 중 한쪽 접근이라도 write이면 충돌한다. 대칭이다.
    bool conflicts(const AccessSet& a, const AccessSet& b);

    /// @brief 컴파일 단위 전체가 공유하는 canonical 문자열 -> 키 id 테이블.
    class InternTable {
    public:
        uint32_t intern(DomainKey k);
        uint32_t find(std::string_view canonical) const;

        const DomainKey& get(uint32_t id) const { return keys_[id]; }
        uint32_t size() const { return static_cast<uint32_t>(keys_.size()); }

    private:
        std::vector<DomainKey> keys_;
        std::unordered_map<std::string, uint32_t> index_;
    };

} // namespace vellum::domain
