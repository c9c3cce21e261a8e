#pragma once

// ---------------------------------------------------------------------------
// condition_matcher.hpp
//
// 정책 Condition 을 EvalContext 에 대해 평가한다.
//
// [평가 규칙]
// - modes/models/channels/tools/risk/users/sessions: list_match() 그대로.
// - mcp_servers:
//     std::nullopt              → 제약 없음
//     패턴 있음 + 서버값 없음    → 불일치 (패턴 내용과 무관)
//     패턴 있음 + 서버값 있음    → list_match()
// - 모든 필드가 std::nullopt 인 Condition 은 모든 컨텍스트와 일치한다
//   (catch-all 정책).
//
// 평가 순서는 결과에 영향을 주지 않는다. 첫 불일치에서 즉시 반환한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // EvalContext
#include "policy/rule.hpp"   // Condition

[[nodiscard]] bool condition_matches(const Condition& condition, const EvalContext& ctx);
