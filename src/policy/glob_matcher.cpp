// ---------------------------------------------------------------------------
// glob_matcher.cpp
//
// 코드 포인트 단위 glob 매칭.
//
// [동작]
// - 패턴과 값을 UTF-8 로 디코딩한 뒤 코드 포인트 열로 비교한다.
//   '?' 와 문자 클래스는 바이트가 아닌 문자 하나와 대응한다.
// - std::string 길이 전체를 사용하므로 값 중간의 '\0' 도 일반 문자다.
// - 잘못된 UTF-8 바이트는 바이트 하나를 문자 하나로 취급한다
//   (0xDC80 + byte 로 매핑, 정상 코드 포인트와 겹치지 않는다).
// - 로케일에 의존하지 않는다.
//
// [문자 클래스]
// - "[abc]", "[a-z]", "[!a-z]". ']' 가 첫 멤버이면 일반 문자.
// - '^' 는 부정이 아니라 일반 문자다.
// - 닫는 ']' 가 없으면 '[' 는 일반 문자로 취급한다.
// - 역순 범위("[z-a]")는 아무 문자도 포함하지 않는다.
//
// [알고리즘]
// '*' 만 가변 길이이므로 마지막 '*' 위치만 기억하는 역추적으로 충분하다.
// 시간 복잡도 O(|pattern| * |value|).
// ---------------------------------------------------------------------------

#include "policy/glob_matcher.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace {

// 잘못된 바이트 매핑 구간 (UTF-16 low surrogate 영역, 유효한 UTF-8 로는 나오지 않음)
constexpr char32_t kInvalidByteBase = 0xDC80;

// ---------------------------------------------------------------------------
// decode_utf8
//   엄격한 UTF-8 디코더. overlong/surrogate/범위 초과는 잘못된 바이트로 본다.
// ---------------------------------------------------------------------------
std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    const auto  size = text.size();
    std::size_t i    = 0;
    while (i < size) {
        const auto lead = static_cast<unsigned char>(text[i]);

        std::size_t length = 0;
        char32_t    cp     = 0;
        char32_t    min_cp = 0;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp     = lead & 0x1F;
            min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp     = lead & 0x0F;
            min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp     = lead & 0x07;
            min_cp = 0x10000;
        }

        bool valid = length != 0 && i + length <= size;
        for (std::size_t k = 1; valid && k < length; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        valid = valid && cp >= min_cp && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);

        if (valid) {
            out.push_back(cp);
            i += length;
        } else {
            out.push_back(kInvalidByteBase + lead);
            ++i;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Token: 컴파일된 패턴 요소
// ---------------------------------------------------------------------------
struct Token {
    enum class Kind : std::uint8_t { kLiteral, kAny, kStar, kClass };

    Kind                                       kind{Kind::kLiteral};
    char32_t                                   ch{0};
    bool                                       negated{false};
    std::vector<std::pair<char32_t, char32_t>> ranges{};  // [lo, hi] 포함

    [[nodiscard]] bool accepts(char32_t c) const {
        switch (kind) {
            case Kind::kLiteral: return c == ch;
            case Kind::kAny:     return true;
            case Kind::kClass: {
                const bool in = std::any_of(ranges.begin(), ranges.end(),
                                            [c](const auto& r) { return r.first <= c && c <= r.second; });
                return in != negated;
            }
            case Kind::kStar:    return false;
        }
        return false;
    }
};

// ---------------------------------------------------------------------------
// compile: 패턴 코드 포인트 열 → Token 목록
// 연속된 '*' 는 하나로 합친다.
// ---------------------------------------------------------------------------
std::vector<Token> compile(const std::u32string& pat) {
    std::vector<Token> tokens;
    tokens.reserve(pat.size());

    const auto  n = pat.size();
    std::size_t i = 0;
    while (i < n) {
        const char32_t c = pat[i];

        if (c == U'*') {
            if (tokens.empty() || tokens.back().kind != Token::Kind::kStar) {
                tokens.push_back(Token{Token::Kind::kStar});
            }
            ++i;
            continue;
        }
        if (c == U'?') {
            tokens.push_back(Token{Token::Kind::kAny});
            ++i;
            continue;
        }
        if (c == U'[') {
            // 닫는 ']' 탐색: '!' 다음, 또는 맨 앞의 ']' 는 멤버
            std::size_t j = i + 1;
            if (j < n && pat[j] == U'!') {
                ++j;
            }
            if (j < n && pat[j] == U']') {
                ++j;
            }
            while (j < n && pat[j] != U']') {
                ++j;
            }

            if (j < n) {
                Token cls{Token::Kind::kClass};
                std::size_t k = i + 1;
                if (pat[k] == U'!') {
                    cls.negated = true;
                    ++k;
                }
                while (k < j) {
                    if (k + 2 < j && pat[k + 1] == U'-') {
                        if (pat[k] <= pat[k + 2]) {
                            cls.ranges.emplace_back(pat[k], pat[k + 2]);
                        }
                        k += 3;
                    } else {
                        cls.ranges.emplace_back(pat[k], pat[k]);
                        ++k;
                    }
                }
                tokens.push_back(std::move(cls));
                i = j + 1;
                continue;
            }
            // 닫히지 않은 '[' 는 일반 문자
        }

        Token lit{Token::Kind::kLiteral};
        lit.ch = c;
        tokens.push_back(std::move(lit));
        ++i;
    }
    return tokens;
}

bool match_tokens(const std::vector<Token>& tokens, const std::u32string& value) {
    constexpr std::size_t kNone = static_cast<std::size_t>(-1);

    std::size_t t = 0;
    std::size_t v = 0;
    std::size_t star_t = kNone;  // 마지막 '*' 다음 토큰 위치
    std::size_t star_v = 0;      // 그 '*' 가 흡수를 시작한 값 위치

    while (v < value.size()) {
        if (t < tokens.size() && tokens[t].kind == Token::Kind::kStar) {
            star_t = ++t;
            star_v = v;
        } else if (t < tokens.size() && tokens[t].accepts(value[v])) {
            ++t;
            ++v;
        } else if (star_t != kNone) {
            t = star_t;
            v = ++star_v;
        } else {
            return false;
        }
    }

    while (t < tokens.size() && tokens[t].kind == Token::Kind::kStar) {
        ++t;
    }
    return t == tokens.size();
}

}  // namespace

bool glob_match(const std::string& pattern, const std::string& value) {
    if (pattern.empty()) {
        return false;
    }
    if (pattern == "*") {
        return true;
    }
    return match_tokens(compile(decode_utf8(pattern)), decode_utf8(value));
}

bool list_match(const PatternList& patterns, const std::string& value) {
    if (!patterns.has_value()) {
        return true;
    }
    return std::any_of(patterns->begin(), patterns->end(),
                       [&value](const std::string& p) { return glob_match(p, value); });
}
