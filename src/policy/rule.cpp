// ---------------------------------------------------------------------------
// rule.cpp
//
// Channel 문자열 변환. 문서/로그에 쓰이는 표기는 소문자 고정이다.
// ---------------------------------------------------------------------------

#include "policy/rule.hpp"

std::string_view channel_to_string(Channel channel) noexcept {
    switch (channel) {
        case Channel::kChat:  return "chat";
        case Channel::kPhone: return "phone";
        default:              return "chat";
    }
}

std::optional<Channel> parse_channel(std::string_view text) noexcept {
    if (text == "chat") {
        return Channel::kChat;
    }
    if (text == "phone") {
        return Channel::kPhone;
    }
    return std::nullopt;
}
