#pragma once

// ---------------------------------------------------------------------------
// context_args.hpp
//
// CLI 인자 "key=value" 목록을 EvalContext 로 변환한다.
//
//   key: mode | model | channel | tool | mcp_server | risk | user | session
//   "--all" 은 감사 뷰(evaluate_all) 출력 플래그.
//
// 같은 key 가 반복되면 마지막 값이 적용된다. value 는 빈 문자열일 수 있다.
// ---------------------------------------------------------------------------

#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "common/types.hpp"  // EvalContext

struct CliRequest {
    EvalContext context{};
    bool        show_all{false};  // --all
};

// 알 수 없는 key, '=' 누락, 알 수 없는 플래그 → std::unexpected(사유)
[[nodiscard]] std::expected<CliRequest, std::string>
parse_context_args(std::span<const std::string_view> args);
