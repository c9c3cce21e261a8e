#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 전역 레지스트리에 등록하지 않으므로 여러 인스턴스가 공존할 수 있다.
// - 고빈도 로그 경로(log_decision)에서 불필요한 문자열 복사를 줄이기 위해
//   const-ref 파라미터를 사용한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog / PolicyLoadLog 를 JSON 한 줄로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   to_stdout : true 이면 stdout 싱크도 추가한다.
    //
    //   싱크 생성 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path,
                              bool to_stdout = true);

    ~StructuredLogger() = default;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_decision
    //   판정 결과를 JSON 으로 기록한다 (info).
    //   [고빈도 호출 경로] 불필요한 문자열 복사를 최소화할 것.
    void log_decision(const DecisionLog& entry);

    // log_policy_load
    //   정책 로드 결과를 JSON 으로 기록한다. 성공은 info, 실패는 warn.
    void log_policy_load(const PolicyLoadLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // 버퍼를 파일로 내보낸다.
    void flush();

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
