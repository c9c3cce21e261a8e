#pragma once

// ---------------------------------------------------------------------------
// glob_matcher.hpp
//
// 셸 스타일 glob 패턴 매칭.
//
// [매칭 규칙]
// - 빈 패턴은 어떤 값과도 일치하지 않는다 (빈 값 포함). 잘못 작성된 설정을
//   기본 거부로 처리한다.
// - "*" 단독은 빈 문자열을 포함한 모든 값과 일치한다.
// - 그 외: '*' 임의 길이, '?' 정확히 한 글자, "[...]" / "[!...]" 문자 클래스.
//   글자 단위는 UTF-8 코드 포인트다 ('?' 는 "é" 한 글자와 일치).
// - 클래스 부정은 '!' 만 지원한다. "[^a]" 의 '^' 는 일반 문자다.
// - 대소문자 구분, 전체 일치 (부분 문자열 매칭 아님). 값 중간의 '\0' 도
//   비교 대상이다.
// - '\\' 는 일반 문자로 취급한다 (escape 없음). '/' 와 선두 '.' 도 특별 취급
//   하지 않는다.
// ---------------------------------------------------------------------------

#include <string>

#include "policy/rule.hpp"  // PatternList

// glob_match
//   pattern 이 value 전체와 일치하면 true.
[[nodiscard]] bool glob_match(const std::string& pattern, const std::string& value);

// list_match
//   patterns 가 std::nullopt 이면 true (제약 없음).
//   그 외에는 하나 이상의 패턴이 일치할 때만 true. 빈 목록은 항상 false.
[[nodiscard]] bool list_match(const PatternList& patterns, const std::string& value);
