#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 가드레일 정책 모델 정의.
// yaml-cpp 를 통해 config/policies/*.yaml 에서 로드되거나, 호스트가 직접
// 구성한다.
//
// [설계 원칙]
// - 이 헤더는 common/types.hpp 외의 프로젝트 헤더에 의존하지 않는다.
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 이 구조체들은 판정 로직을 포함하지 않는다 (PolicyEngine 소관).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// Effect
//   정책이 일치했을 때 내리는 판정 태그.
//
//   열린 열거형: 잘 알려진 값은 상수(kAllow, kDeny, ...)로 제공하지만
//   임의 문자열도 유효한 Effect 이다. 조직별 확장 태그(예: "quarantine")를
//   엔진 수정 없이 사용할 수 있다. 엔진은 값을 해석하지 않는다.
// ---------------------------------------------------------------------------
class Effect {
public:
    Effect() = default;
    explicit Effect(std::string value) : value_(std::move(value)) {}

    [[nodiscard]] const std::string& str() const noexcept { return value_; }

    bool operator==(const Effect&) const = default;

    static const Effect kAllow;
    static const Effect kDeny;
    static const Effect kAsk;
    static const Effect kHitl;    // human-in-the-loop
    static const Effect kPitl;    // phone-in-the-loop
    static const Effect kAitl;    // agent-in-the-loop
    static const Effect kFilter;

private:
    std::string value_{};
};

inline const Effect Effect::kAllow{"allow"};
inline const Effect Effect::kDeny{"deny"};
inline const Effect Effect::kAsk{"ask"};
inline const Effect Effect::kHitl{"hitl"};
inline const Effect Effect::kPitl{"pitl"};
inline const Effect Effect::kAitl{"aitl"};
inline const Effect Effect::kFilter{"filter"};

// ---------------------------------------------------------------------------
// Channel
//   ask 계열 판정의 승인 경로. 닫힌 열거형이므로 문서의 알 수 없는 값은
//   로드 시점에 거부된다.
// ---------------------------------------------------------------------------
enum class Channel : std::uint8_t {
    kChat  = 0,
    kPhone = 1,
};

[[nodiscard]] std::string_view channel_to_string(Channel channel) noexcept;

// "chat" | "phone" 이외의 값이면 std::nullopt
[[nodiscard]] std::optional<Channel> parse_channel(std::string_view text) noexcept;

// ---------------------------------------------------------------------------
// Condition
//   정책 일치 조건. 필드 간 AND, 필드 내 목록은 OR.
//
//   std::nullopt  : 해당 필드는 평가하지 않는다 (don't care).
//   빈 목록 []    : 어떤 값과도 일치하지 않는다 (목록이 "존재" 하므로).
//
//   [mcp_servers 예외]
//   패턴이 지정되었는데 컨텍스트에 mcp_server 가 없으면 불일치로 처리한다.
//   특정 서버로 범위를 한정한 정책이 서버와 무관한 호출에 적용되면 안 된다.
// ---------------------------------------------------------------------------
using PatternList = std::optional<std::vector<std::string>>;

struct Condition {
    PatternList modes{};
    PatternList models{};
    PatternList channels{};
    PatternList tools{};
    PatternList mcp_servers{};
    PatternList risk{};
    PatternList users{};
    PatternList sessions{};

    bool operator==(const Condition&) const = default;
};

// ---------------------------------------------------------------------------
// Policy
//   단일 가드레일 정책.
//   priority 가 낮을수록 먼저 평가된다. 같은 priority 는 선언 순서를 따른다.
//   id 유일성은 검증하지 않는다 (보고용으로만 사용).
// ---------------------------------------------------------------------------
struct Policy {
    std::string id{};
    std::string name{};
    std::string description{};
    bool        enabled{true};
    int         priority{100};
    Condition   condition{};
    Effect      effect{Effect::kAsk};
    Channel     channel{Channel::kChat};  // ask 계열 판정의 응답 경로

    bool operator==(const Policy&) const = default;
};

// ---------------------------------------------------------------------------
// Metadata
//   정책 세트 설명 정보. 판정에는 사용하지 않는다.
// ---------------------------------------------------------------------------
struct Metadata {
    std::string                        name{"unnamed"};
    std::string                        description{};
    std::string                        version{};
    std::map<std::string, std::string> labels{};

    bool operator==(const Metadata&) const = default;
};

// ---------------------------------------------------------------------------
// Defaults
//   fallback 체인까지 모두 실패했을 때 적용되는 판정.
// ---------------------------------------------------------------------------
struct Defaults {
    Effect  effect{Effect::kAsk};
    Channel channel{Channel::kChat};

    bool operator==(const Defaults&) const = default;
};

// ---------------------------------------------------------------------------
// PolicySet
//   정책 문서의 루트 구조체.
//   PolicyLoader::load 가 반환하는 최종 결과물이며 PolicyEngine::load 의 입력.
//
//   policies 는 정렬되지 않은 상태로 보관한다 (정렬은 엔진 소관).
//   context_fallbacks: "mode X 에서 일치 없음 → mode Y 로 재시도".
//   순환이 있어도 된다 (엔진이 방문 집합으로 차단).
// ---------------------------------------------------------------------------
struct PolicySet {
    std::string                        api_version{"agent-policy/v1"};
    std::string                        kind{"PolicySet"};
    Metadata                           metadata{};
    Defaults                           defaults{};
    std::vector<Policy>                policies{};
    std::map<std::string, std::string> context_fallbacks{};

    bool operator==(const PolicySet&) const = default;
};

// ---------------------------------------------------------------------------
// Verdict
//   엔진의 최종 판정.
//   policy_id: 판정을 만든 정책 ID. 기본값이 적용되면 std::nullopt.
// ---------------------------------------------------------------------------
struct Verdict {
    Effect                     effect{Effect::kAsk};
    Channel                    channel{Channel::kChat};
    std::optional<std::string> policy_id{};

    bool operator==(const Verdict&) const = default;
};

// ---------------------------------------------------------------------------
// PolicyReport
//   evaluate_all() 감사 뷰의 정책별 결과 행.
//   matched: enabled 이고 조건이 주어진 컨텍스트와 단독으로 일치하는지.
//            (우선순위/승자 여부와 무관)
// ---------------------------------------------------------------------------
struct PolicyReport {
    std::string policy_id{};
    std::string name{};
    int         priority{0};
    Effect      effect{};
    bool        matched{false};
    bool        enabled{true};

    bool operator==(const PolicyReport&) const = default;
};
