#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - Effect, Channel, Verdict 를 직접 include 하지 않는다.
// - effect / channel 은 호출자가 문자열로 변환하여 전달한다.
//     effect : verdict.effect.str()
//     channel: std::string(channel_to_string(verdict.channel))
//
// [민감정보 취급 주의]
// - user / session 은 식별 정보다. 운영 환경에서 로그 레벨/보존 정책을
//   별도로 적용할 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // EvalContext

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. 환경변수/설정에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "warning" | "error" (대소문자 구분)
// 알 수 없는 값이면 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view text) noexcept;

// ---------------------------------------------------------------------------
// DecisionLog
//   판정 1건의 로그.
//   policy_id: 기본값 판정이면 std::nullopt (JSON null 로 기록)
// ---------------------------------------------------------------------------
struct DecisionLog {
    EvalContext                                context{};
    std::string                                effect{};
    std::string                                channel{};
    std::optional<std::string>                 policy_id{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 판정 소요 시간
};

// ---------------------------------------------------------------------------
// PolicyLoadLog
//   정책 문서 로드 시도 1건의 로그.
//   success == false 이면 error 에 사유를 기록한다.
// ---------------------------------------------------------------------------
struct PolicyLoadLog {
    std::string                                source{};        // 파일 경로 등
    std::string                                policy_set{};    // metadata.name
    std::string                                version{};       // metadata.version
    std::uint64_t                              policy_count{0};
    bool                                       success{false};
    std::string                                error{};
    std::chrono::system_clock::time_point      timestamp{};
};
