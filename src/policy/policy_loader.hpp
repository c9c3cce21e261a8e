#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 문서를 읽어 PolicySet 으로 변환하는 로더.
//
// [설계 원칙]
// - 실패 시 std::unexpected(LoadError) 반환. 호출자는 실패 시 기존 엔진
//   상태를 유지해야 한다 (PolicyEngine::load 를 호출하지 않는다).
// - All-or-nothing: 부분적으로 파싱된 PolicySet 을 반환하지 않는다.
// - 문서 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
// ❌ rule.hpp → policy_loader.hpp 금지
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "common/types.hpp"  // LoadError
#include "policy/rule.hpp"   // PolicySet

// ---------------------------------------------------------------------------
// PolicyLoader
//   정적 로드 기능만 제공한다. 파일 감시/재로드 트리거는 호스트 소관.
// ---------------------------------------------------------------------------
class PolicyLoader {
public:
    PolicyLoader()  = delete;

    // load
    //   지정된 경로의 YAML 파일을 읽어 PolicySet 으로 파싱한다.
    //
    //   실패: 파일 없음(kFileError), YAML 문법 오류(kYamlSyntax),
    //         최상위 map 아님(kNotAMapping), kind 불일치(kUnsupportedKind),
    //         값 변환 실패(kInvalidValue), id/effect 누락(kMissingField).
    [[nodiscard]] static std::expected<PolicySet, LoadError>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   메모리상의 YAML 문서를 파싱한다. load() 와 같은 규칙을 따른다.
    [[nodiscard]] static std::expected<PolicySet, LoadError>
    load_from_string(const std::string& text);
};
