// backend/include/vellum/backend/vm/Bytecode.hpp
#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>


namespace vellum::backend::vm {

    /// @brief 64비트 워드 스택 머신 명령.
    ///
    /// 규약:
    /// - 모든 값은 워드 하나다. 집합 값은 선형 메모리 주소로 다룬다.
    /// - 블록 경계에서 평가 스택은 비어 있다.
    /// - 점프 대상은 함수 코드 안의 명령 인덱스다.
    enum class Op : uint8_t {
        kNop,
        kConst,        // imm
        kLocalGet,     // imm = slot
        kLocalSet,     // imm = slot
        kLocalTee,     // imm = slot
        kDrop,

        kAdd, kSub, kMul,      // 64비트 래핑
        kDivS, kDivU,          // 0으로 나누면 trap, DivS MIN/-1도 trap
        kRemS, kRemU,          // 0으로 나누면 trap, RemS x/-1 == 0
        kShl, kShrS, kShrU,    // shift 양은 63으로 마스크
        kAnd, kOr, kXor,

        kEq, kNe,
        kLtS, kLtU, kLeS, kLeU,
        kGtS, kGtU, kGeS, kGeU,
        kEqz,

        kSext,         // imm = bits: 하위 bits비트를 부호 확장
        kZext,         // imm = bits: 하위 bits비트만 남긴다

        kLoad,         // [addr] -> word (8바이트 LE)
        kStore,        // [addr, value] ->
        kMemCopy,      // [dst, src, len] ->

        kJmp,          // imm = target
        kJmpIf,        // [cond] -> , 0이 아니면 점프
        kJmpIfNot,     // [cond] -> , 0이면 점프

        kCall,         // imm = function index
        kCallHost,     // imm = import index
        kRet,
        kTrap,         // imm = TrapCode
    };

    enum class TrapCode : uint32_t {
        kUnreachable = 0,
        kDivByZero = 1,
        kIntegerOverflow = 2,   // DivS MIN/-1
        kOutOfBounds = 3,
    };

    struct Instr {
        Op op = Op::kNop;
        uint64_t imm = 0;
    };

    struct Import {
        std::string module;    // "vellum.state"
        uint32_t version = 0;
        std::string name;      // "read"
        uint32_t num_args = 0;
        bool has_result = false;
    };

    struct Function {
        std::string name;          // 원본 이름(디버깅용)
        std::string export_name;   // 비어 있으면 내부 함수
        uint32_t num_params = 0;   // slot 0..num_params-1
        uint32_t num_locals = 0;   // 매개변수 포함
        bool has_result = false;
        std::vector<Instr> code;
    };

    struct DataSegment {
        uint64_t offset = 0;
        std::string bytes;
    };

    struct Export {
        std::string name;
        uint32_t func = 0;
    };

    inline constexpr uint64_t kPageSize = 64 * 1024;

    /// @brief 선형 메모리 배치: 주소 0은 heap top 워드, 그 뒤로 데이터 세그먼트, 그 뒤가 heap.
    struct Module {
        std::vector<Import> imports;
        std::vector<Function> functions;
        std::vector<Export> exports;
        std::vector<DataSegment> data;

        uint32_t memory_pages = 1;
        uint64_t heap_base = 8;
    };

    const char* op_name(Op op);

    /// @brief 명령이 imm을 쓰는지.
    bool has_imm(Op op);

    /// @brief 사람이 읽는 덤프.
    void disassemble(const Module& m, std::ostream& os);

    // ---- serialized container ----
    inline constexpr char kMagic[4] = {'V', 'L', 'B', 'C'};
    inline constexpr uint16_t kFormatVersion = 1;

    /// @brief `VLBC` 컨테이너로 직렬화한다.
    std::string serialize(const Module& m);

    /// @brief 컨테이너를 읽는다. 실패하면 false와 이유.
    bool deserialize(std::string_view bytes, Module& out, std::string& err);

} // namespace vellum::backend::vm
