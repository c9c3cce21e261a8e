#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// 도구 호출 컨텍스트를 받아 정책 세트에 따라 단일 판정(Verdict)을 내리는 엔진.
//
// [판정 순서: 반드시 준수]
// 1. priority 오름차순(안정 정렬)으로 정책을 순회, disabled 는 건너뜀.
//    조건이 일치하는 첫 정책이 승자 (first-match-wins, 점수/조합 없음).
// 2. 일치 없음 → context_fallbacks 체인을 원래 mode 부터 따라가며
//    mode 만 바꾼 컨텍스트로 1 을 재수행. 이미 방문한 mode 를 만나면 중단
//    (순환 차단, 오류 아님).
// 3. 체인 소진 → Defaults 로 판정 (policy_id 없음).
//
// evaluate() 는 어떤 컨텍스트에 대해서도 항상 Verdict 를 반환한다.
// 오류는 로드 시점(PolicyLoader)에만 존재한다.
//
// [Hot Reload]
// load() 는 새 PolicySnapshot 을 만든 뒤 std::atomic<std::shared_ptr> 로
// 한 번에 교체한다. 진행 중인 evaluate() 는 이전 스냅샷으로 완료된다.
//
// [순환 의존성: 무순환 구조]
// policy_engine.hpp → rule.hpp            (단방향)
// policy_engine.hpp → common/types.hpp    (단방향)
// ❌ rule.hpp → policy_engine.hpp 금지
// ---------------------------------------------------------------------------

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"  // EvalContext
#include "policy/rule.hpp"   // PolicySet, Verdict, PolicyReport

// ---------------------------------------------------------------------------
// PolicySnapshot
//   load() 시점에 만들어지는 불변 스냅샷.
//   호출자가 넘긴 PolicySet 과 분리된 사본이므로, 로드 이후 원본 문서를
//   수정해도 평가에 영향이 없다.
// ---------------------------------------------------------------------------
struct PolicySnapshot {
    std::vector<Policy>                policies{};           // priority 오름차순
    Defaults                           defaults{};
    std::map<std::string, std::string> context_fallbacks{};
};

// ---------------------------------------------------------------------------
// PolicyEngine
//
//   [스레드 안전성]
//   - evaluate/resolve/evaluate_all/접근자: 읽기 전용, concurrent 호출 안전.
//   - load: 스냅샷 원자적 교체. 드물게 호출되는 설정 교체 연산.
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    // 빈 엔진: 정책 없음, Defaults{ask, chat}.
    PolicyEngine();

    explicit PolicyEngine(const PolicySet& policy_set);

    ~PolicyEngine() = default;

    // std::atomic 멤버 보유 → 복사/이동 금지
    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = delete;
    PolicyEngine& operator=(PolicyEngine&&)      = delete;

    // load
    //   기존 상태를 통째로 교체한다 (부분 갱신 없음, 멱등).
    //   id/priority 중복은 허용한다.
    void load(const PolicySet& policy_set);

    // evaluate
    //   주 판정 API. 위 [판정 순서] 참고.
    [[nodiscard]] Verdict evaluate(const EvalContext& ctx) const;

    // resolve
    //   evaluate(ctx).effect 의 문자열 태그만 반환한다.
    [[nodiscard]] std::string resolve(const EvalContext& ctx) const;

    // evaluate_all
    //   감사/디버깅용. 모든 정책을 priority 순으로, 단락 없이 평가하여
    //   정책별 일치 여부를 보고한다. fallback 은 적용하지 않는다.
    //   evaluate() 결과에 영향을 주지 않는다.
    [[nodiscard]] std::vector<PolicyReport> evaluate_all(const EvalContext& ctx) const;

    // 접근자: 모두 내부 상태의 사본을 반환한다.
    [[nodiscard]] std::vector<Policy>                policies() const;
    [[nodiscard]] Defaults                           defaults() const;
    [[nodiscard]] std::map<std::string, std::string> context_fallbacks() const;

private:
    // 정렬된 정책 목록을 한 번 훑는다. 일치 없음 → std::nullopt
    [[nodiscard]] static std::optional<Verdict>
    evaluate_once(const PolicySnapshot& snapshot, const EvalContext& ctx);

    std::atomic<std::shared_ptr<const PolicySnapshot>> snapshot_;
};
