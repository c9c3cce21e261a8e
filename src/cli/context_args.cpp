// ---------------------------------------------------------------------------
// context_args.cpp
// ---------------------------------------------------------------------------

#include "cli/context_args.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

namespace {

using ContextField = std::string EvalContext::*;

constexpr std::array<std::pair<std::string_view, ContextField>, 8> kFields{{
    {"mode",       &EvalContext::mode},
    {"model",      &EvalContext::model},
    {"channel",    &EvalContext::channel},
    {"tool",       &EvalContext::tool},
    {"mcp_server", &EvalContext::mcp_server},
    {"risk",       &EvalContext::risk},
    {"user",       &EvalContext::user},
    {"session",    &EvalContext::session},
}};

}  // namespace

std::expected<CliRequest, std::string>
parse_context_args(std::span<const std::string_view> args) {
    CliRequest request{};

    for (const auto arg : args) {
        if (arg == "--all") {
            request.show_all = true;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(fmt::format("unknown option '{}'", arg));
        }

        const auto eq_pos = arg.find('=');
        if (eq_pos == std::string_view::npos) {
            return std::unexpected(fmt::format("expected key=value, got '{}'", arg));
        }

        const auto key   = arg.substr(0, eq_pos);
        const auto value = arg.substr(eq_pos + 1);

        bool known = false;
        for (const auto& [name, member] : kFields) {
            if (name == key) {
                request.context.*member = std::string(value);
                known = true;
                break;
            }
        }
        if (!known) {
            return std::unexpected(fmt::format("unknown context key '{}'", key));
        }
    }

    return request;
}
