// frontend/include/vellum/domain/Analyzer.hpp
#pragma once
#include <vellum/diag/Diagnostic.hpp>
#include <vellum/domain/Annotations.hpp>
#include <vellum/domain/CallGraph.hpp>
#include <vellum/domain/DomainKey.hpp>
#include <vellum/ssa/SSA.hpp>
#include <vellum/ty/TypePool.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace vellum::domain {

    /// @brief 정적으로 해석되지 않는 상태 키를 어떻게 다룰지.
    enum class WildcardPolicy : uint8_t {
        kCoarsen,   // 네임스페이스 와일드카드로 넓히고 note를 남긴다
        kReject,    // 오류로 보고하고 함수를 제외한다
    };

    struct Options {
        WildcardPolicy wildcard_policy = WildcardPolicy::kCoarsen;
        uint32_t max_enumerated_keys = 4;   // 이보다 많은 후보 키는 와일드카드로 본다
        std::string unit_id;                // 비어 있으면 module.unit_id
    };

    enum class DomainSource : uint8_t {
        kInferred,   // 분석 결과 그대로
        kDeclared,   // #[reads]/#[writes] 중 하나 이상이 대체
        kTrusted,    // no_state
    };

    /// @brief 본문에서 직접 일어난 접근 하나(진단 위치용).
    struct LocalAccess {
        uint32_t key = kInvalidKey;
        bool is_write = false;
        Span span{};
    };

    struct FunctionDomains {
        // 본문만 본 결과(intern id, 정렬)
        std::vector<uint32_t> local_reads;
        std::vector<uint32_t> local_writes;
        std::vector<LocalAccess> accesses;

        // callee까지 합친 계산 결과(override 이전)
        std::vector<uint32_t> computed_reads;
        std::vector<uint32_t> computed_writes;

        // 호출자에게 전파되고 manifest에 기록되는 권위 있는 집합
        std::vector<uint32_t> reads;
        std::vector<uint32_t> writes;

        DomainSource source = DomainSource::kInferred;
        bool reads_declared = false;
        bool writes_declared = false;
        std::vector<std::string> proofs;

        uint32_t wildcard_fallbacks = 0;
        bool rejected = false;
    };

    struct AnalysisStats {
        uint32_t scc_count = 0;
        uint32_t cyclic_sccs = 0;
        uint32_t fixpoint_passes = 0;   // 모든 SCC에 대해 합산한 반복 횟수
        uint32_t accesses = 0;
        uint32_t wildcard_fallbacks = 0;
    };

    struct AnalysisResult {
        bool ok = false;

        InternTable keys;
        CallGraph graph;
        std::vector<FunctionDomains> fns;   // FuncId로 인덱싱
        std::vector<bool> fn_ok;            // annotation 오류/키 거부가 없으면 true
        AnalysisStats stats{};

        /// @brief 함수의 권위 있는 집합을 해시 항목으로 돌려준다.
        AccessSet access_set(ssa::FuncId f) const;
    };

    /// @brief 함수별 read/write 도메인 집합을 계산한다.
    ///
    /// 1) 본문의 state 접근마다 키를 상수/열거 가능한 집합으로 해석한다.
    /// 2) 해석되지 않으면 정책에 따라 와일드카드로 넓히거나 거부한다.
    /// 3) 호출 그래프를 역위상 순서로 돌며 SCC마다 고정점까지 합친다.
    /// 4) override가 있으면 그 집합으로 대체하되 계산 결과와 비교해 경고한다.
    AnalysisResult analyze(
        const ssa::Module& m,
        const ty::TypePool& types,
        diag::Bag& bag,
        const Options& opt = {}
    );

} // namespace vellum::domain
