// backend/include/vellum/backend/host/HostInterface.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::backend::host {

    /// @brief 코드 생성이 요청하는 호스트 연산. 테이블 조회 키로만 쓰인다.
    enum class HostOp : uint8_t {
        kStateRead,
        kStateWrite,
        kStateHas,
        kCtxQuery,
        kSha256,
        kLogEmit,
        kRevert,
        kPanic,
    };

    /// @brief 인자 하나의 모양. 포인터/길이 쌍은 워드 두 개로 넘어간다.
    enum class ArgShape : uint8_t {
        kWord,      // 즉시값(컨텍스트 질의 번호 등)
        kInPtrLen,  // 호스트가 읽는 (offset, length)
        kOutPtrCap, // 호스트가 쓰는 (offset, capacity)
        kOutPtr,    // 고정 길이 출력 버퍼의 offset
    };

    /// @brief 반환 규약.
    enum class RetShape : uint8_t {
        kStatus,    // 0 = 성공, 양수 = 사용 가능한 크기, 음수 = 오류 종류
        kNoReturn,  // 실행을 끝낸다(revert/panic)
    };

    /// @brief 호스트가 돌려주는 음수 상태 코드.
    enum class HostStatus : int32_t {
        kNotFound = -1,
        kInvalidArgument = -2,
        kBufferTooSmall = -3,
        kLimitExceeded = -4,
        kOutOfResource = -5,
        kInternalError = -6,
        kDomainDenied = -7,     // 함수가 선언하지 않은 도메인에 접근
    };

    /// @brief 상태 접근의 첫 인자: [scope hash 32][exact hash 32].
    /// 키가 컴파일 시점 상수가 아니면 exact 자리는 0으로 채운다.
    inline constexpr uint32_t kDomainArgLen = 64;

    struct HostFunction {
        HostOp op;
        std::string_view name;
        std::vector<ArgShape> args;
        RetShape ret = RetShape::kStatus;
        uint64_t gas_base = 0;

        // 언어 수준 result<T> 오류로 돌려줄 수 있는 코드. 나머지 음수는 abort로 승격한다.
        std::vector<int32_t> recoverable;
        uint32_t fixed_out_len = 0;   // kOutPtr 버퍼 길이
    };

    struct HostModule {
        std::string_view name;
        uint32_t version = 0;
        std::vector<HostFunction> funcs;
    };

    /// @brief 컨텍스트 질의 번호(vellum.ctx@1 `query`의 첫 인자).
    enum class CtxQuery : uint32_t {
        kCaller = 0,
        kSelf = 1,
        kBlockHeight = 2,
        kTimestamp = 3,
        kCallValue = 4,
    };

    /// @brief 호스트가 제공하는 버전별 capability 테이블.
    const std::vector<HostModule>& host_modules();

    struct HostRef {
        const HostModule* module = nullptr;
        const HostFunction* fn = nullptr;
    };

    /// @brief 연산에 해당하는 테이블 항목을 찾는다. 없으면 module == nullptr.
    HostRef lookup(HostOp op);

    /// @brief (module, version, name)으로 항목을 찾는다. 런타임 쪽 import 검증용.
    HostRef lookup(std::string_view module, uint32_t version, std::string_view name);

    /// @brief 인자 모양을 워드 개수로 펼친다.
    uint32_t word_arity(const HostFunction& fn);

    bool is_recoverable(const HostFunction& fn, int32_t status);

    /// @brief `vellum.state@1` 형태의 표시 이름.
    std::string qualified_name(const HostModule& m);

    const char* status_name(int32_t status);

} // namespace vellum::backend::host
