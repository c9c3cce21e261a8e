// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 도구 호출 컨텍스트를 받아 정책 세트에 따라 판정을 내리는 엔진.
//
// [판정 불변식]
// 1. evaluate() 는 항상 Verdict 를 반환한다 (예외/오류 없음).
// 2. disabled 정책은 어떤 경우에도 승자가 될 수 없다.
// 3. 원래 mode 에서 일치하는 enabled 정책이 있으면 fallback 은 수행하지 않는다.
// 4. fallback 체인은 방문 집합으로 유한하게 끝난다.
//
// [Hot Reload]
// load() 는 std::atomic<std::shared_ptr<const PolicySnapshot>>::store 로
// 교체한다. evaluate() 는 호출당 한 번 load() 하여 로컬 shared_ptr 을
// 보유하므로, 도중에 교체되더라도 이전 스냅샷의 수명이 유지된다.
//
// [알려진 한계]
// - fallback 대상 mode 가 빈 문자열이어도 일반 mode 값으로 취급한다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

#include "policy/condition_matcher.hpp"

// ---------------------------------------------------------------------------
// PolicyEngine 생성자
// ---------------------------------------------------------------------------
PolicyEngine::PolicyEngine()
    : snapshot_(std::make_shared<const PolicySnapshot>()) {}

PolicyEngine::PolicyEngine(const PolicySet& policy_set)
    : PolicyEngine() {
    load(policy_set);
}

// ---------------------------------------------------------------------------
// PolicyEngine::load 구현
//
// 스냅샷을 완성한 뒤에 교체하므로, 평가 중인 스레드는 절반만 갱신된
// 상태를 관측하지 않는다.
// ---------------------------------------------------------------------------
void PolicyEngine::load(const PolicySet& policy_set) {
    auto snapshot = std::make_shared<PolicySnapshot>();
    snapshot->policies          = policy_set.policies;
    snapshot->defaults          = policy_set.defaults;
    snapshot->context_fallbacks = policy_set.context_fallbacks;

    // 동일 priority 는 선언 순서 유지 (작성자가 순서 지정 도구로 사용)
    std::stable_sort(snapshot->policies.begin(), snapshot->policies.end(),
                     [](const Policy& a, const Policy& b) { return a.priority < b.priority; });

    spdlog::info("policy_engine: loaded policy set '{}' with {} policies, {} context fallbacks, "
                 "default effect={}",
                 policy_set.metadata.name,
                 snapshot->policies.size(),
                 snapshot->context_fallbacks.size(),
                 snapshot->defaults.effect.str());

    snapshot_.store(std::shared_ptr<const PolicySnapshot>(std::move(snapshot)));
}

// ---------------------------------------------------------------------------
// PolicyEngine::evaluate_once 구현
// ---------------------------------------------------------------------------
std::optional<Verdict> PolicyEngine::evaluate_once(
    const PolicySnapshot& snapshot,
    const EvalContext&    ctx) {

    for (const auto& policy : snapshot.policies) {
        if (!policy.enabled) {
            continue;
        }
        if (condition_matches(policy.condition, ctx)) {
            spdlog::debug("policy_engine: match policy={} effect={} tool='{}' mode='{}'",
                          policy.id, policy.effect.str(), ctx.tool, ctx.mode);
            return Verdict{policy.effect, policy.channel, policy.id};
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PolicyEngine::evaluate 구현
// ---------------------------------------------------------------------------
Verdict PolicyEngine::evaluate(const EvalContext& ctx) const {
    const auto snapshot = snapshot_.load();

    // Step 1: 원래 컨텍스트로 단일 패스
    if (auto verdict = evaluate_once(*snapshot, ctx)) {
        return *verdict;
    }

    // Step 2: context_fallbacks 체인
    // 방문 집합은 시작 mode 로 초기화한다. {a: b, b: a} 같은 순환도 유한하게 끝난다.
    std::string           mode = ctx.mode;
    std::set<std::string> visited{mode};

    for (;;) {
        const auto it = snapshot->context_fallbacks.find(mode);
        if (it == snapshot->context_fallbacks.end()) {
            break;
        }
        mode = it->second;
        if (!visited.insert(mode).second) {
            spdlog::debug("policy_engine: fallback cycle detected at mode='{}', tool='{}'",
                          mode, ctx.tool);
            break;
        }

        // 원본은 건드리지 않고 mode 만 바꾼 사본으로 재평가
        EvalContext fallback_ctx = ctx;
        fallback_ctx.mode        = mode;

        spdlog::debug("policy_engine: fallback mode='{}' -> '{}', tool='{}'",
                      ctx.mode, mode, ctx.tool);

        if (auto verdict = evaluate_once(*snapshot, fallback_ctx)) {
            return *verdict;
        }
    }

    // Step 3: 기본 판정
    spdlog::debug("policy_engine: default tool='{}' mode='{}' effect={}",
                  ctx.tool, ctx.mode, snapshot->defaults.effect.str());
    return Verdict{snapshot->defaults.effect, snapshot->defaults.channel, std::nullopt};
}

std::string PolicyEngine::resolve(const EvalContext& ctx) const {
    return evaluate(ctx).effect.str();
}

// ---------------------------------------------------------------------------
// PolicyEngine::evaluate_all 구현
//
// evaluate_once 와 동일한 술어(enabled && condition_matches)를 사용한다.
// 결과 행 수/순서는 승자와 무관하게 스냅샷의 정책 순서와 같다.
// ---------------------------------------------------------------------------
std::vector<PolicyReport> PolicyEngine::evaluate_all(const EvalContext& ctx) const {
    const auto snapshot = snapshot_.load();

    std::vector<PolicyReport> reports;
    reports.reserve(snapshot->policies.size());
    for (const auto& policy : snapshot->policies) {
        PolicyReport report{};
        report.policy_id = policy.id;
        report.name      = policy.name;
        report.priority  = policy.priority;
        report.effect    = policy.effect;
        report.enabled   = policy.enabled;
        report.matched   = policy.enabled && condition_matches(policy.condition, ctx);
        reports.push_back(std::move(report));
    }
    return reports;
}

// ---------------------------------------------------------------------------
// 접근자: 외부에서 내부 스냅샷을 변경할 수 없도록 사본을 반환한다.
// ---------------------------------------------------------------------------
std::vector<Policy> PolicyEngine::policies() const {
    return snapshot_.load()->policies;
}

Defaults PolicyEngine::defaults() const {
    return snapshot_.load()->defaults;
}

std::map<std::string, std::string> PolicyEngine::context_fallbacks() const {
    return snapshot_.load()->context_fallbacks;
}
