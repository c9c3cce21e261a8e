#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// EvalContext
//   도구 호출 하나를 기술하는 불변 컨텍스트.
//   호스트 런타임이 호출마다 새로 생성하고 policy/logger 레이어에 const-ref 로
//   전달한다. 빈 문자열은 "알 수 없음/미설정" 을 의미한다.
//
//   [불변성]
//   fallback 재평가 시에도 원본을 수정하지 않는다. mode 만 바꾼 복사본을
//   새로 만든다.
// ---------------------------------------------------------------------------
struct EvalContext {
    std::string mode{};        // 에이전트 실행 모드 (예: "interactive", "background")
    std::string model{};       // 호출을 만든 LLM 모델 식별자
    std::string channel{};     // 사용자 채널 (예: "cli", "slack")
    std::string tool{};        // 호출 대상 도구 이름
    std::string mcp_server{};  // MCP 서버 식별자 (없으면 빈 문자열)
    std::string risk{};        // 위험도 태그 (예: "low", "high")
    std::string user{};        // 요청 사용자
    std::string session{};     // 세션 식별자

    bool operator==(const EvalContext&) const = default;
};

// ---------------------------------------------------------------------------
// LoadErrorCode
//   정책 문서 로드 단계에서 발생 가능한 오류 분류.
//   평가(evaluate) 단계에는 오류가 존재하지 않는다.
// ---------------------------------------------------------------------------
enum class LoadErrorCode : std::uint8_t {
    kFileError       = 0,  // 경로 해석/파일 열기 실패
    kYamlSyntax      = 1,  // YAML 문법 오류
    kNotAMapping     = 2,  // 최상위 노드가 map 이 아님
    kUnsupportedKind = 3,  // kind 가 PolicySet 이 아님
    kInvalidValue    = 4,  // 채널/우선순위 등 값 변환 실패
    kMissingField    = 5,  // 필수 필드(id, effect) 누락
};

// ---------------------------------------------------------------------------
// LoadError
//   로드 실패 시 반환되는 오류 정보.
//   std::expected<PolicySet, LoadError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct LoadError {
    LoadErrorCode code{LoadErrorCode::kInvalidValue};
    std::string   message{};  // 사람이 읽을 수 있는 오류 설명
};
