// tests/harness/support/TestHost.hpp
#pragma once
#include <vellum/domain/DomainKey.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::harness {

    struct Event {
        std::string topic;
        std::string payload;
    };

    /// @brief 테스트용 in-memory host.
    ///
    /// 상태는 (scope hash 32바이트, 키 바이트열) -> 값 바이트열로 둔다.
    /// SSA 평가기와 참조 VM이 같은 host 규약을 쓰도록 한 곳에 모았다.
    class TestHost final {
    public:
        std::string caller = "alice";
        std::string self = "vault";
        uint64_t block_height = 100;
        uint64_t timestamp = 1'700'000'000;
        uint64_t call_value = 0;

        std::vector<Event> events;

        bool read(std::string_view domain, std::string_view key, std::string& out) const;
        void write(std::string_view domain, std::string_view key, std::string_view value);
        bool has(std::string_view domain, std::string_view key) const;

        /// @brief 컨텍스트 질의 결과. 정수 질의는 8바이트 LE 워드다.
        std::string context(uint32_t query) const;

        /// @brief 이후 write를 주어진 항목(manifest의 writes)으로 제한한다.
        void restrict_writes(std::vector<domain::DomainEntry> allowed);

        /// @brief descriptor([scope][exact]) 기준으로 write가 허용되는지.
        /// exact가 0이면 키가 컴파일 시점에 정해지지 않은 접근이므로 같은 scope의 항목이면 받는다.
        bool allows_write(std::string_view descriptor) const;

        size_t state_size() const { return state_.size(); }
        const std::map<std::string, std::string>& state() const { return state_; }
        uint64_t write_count() const { return writes_; }

    private:
        static std::string slot_(std::string_view domain, std::string_view key);

        std::map<std::string, std::string> state_;
        uint64_t writes_ = 0;

        bool restricted_ = false;
        std::vector<domain::DomainEntry> allowed_writes_;
    };

    /// @brief `<unit>.<ns>:*` 와일드카드 hash 바이트열. 상태 slot의 scope다.
    std::string domain_of(std::string_view unit, std::string_view ns);

    /// @brief 상태 host 호출의 첫 인자. key_text가 비어 있으면 exact 자리는 0이다.
    std::string descriptor_of(std::string_view unit, std::string_view ns, std::string_view key_text);

    /// @brief descriptor 앞쪽의 scope hash.
    std::string_view scope_of(std::string_view descriptor);

    std::string word_bytes(uint64_t w);

    /// @brief 최대 8바이트 LE를 워드로 읽는다.
    uint64_t word_from(std::string_view bytes);

    std::string sha256_bytes(std::string_view data);

    void put_word(TestHost& h, std::string_view unit, std::string_view ns, std::string_view key, uint64_t value);
    bool get_word(const TestHost& h, std::string_view unit, std::string_view ns, std::string_view key, uint64_t& out);

} // namespace vellum::harness
