// ---------------------------------------------------------------------------
// condition_matcher.cpp
// ---------------------------------------------------------------------------

#include "policy/condition_matcher.hpp"

#include "policy/glob_matcher.hpp"

bool condition_matches(const Condition& condition, const EvalContext& ctx) {
    if (!list_match(condition.modes, ctx.mode)) {
        return false;
    }
    if (!list_match(condition.models, ctx.model)) {
        return false;
    }
    if (!list_match(condition.channels, ctx.channel)) {
        return false;
    }
    if (!list_match(condition.tools, ctx.tool)) {
        return false;
    }
    if (!list_match(condition.risk, ctx.risk)) {
        return false;
    }
    if (!list_match(condition.users, ctx.user)) {
        return false;
    }
    if (!list_match(condition.sessions, ctx.session)) {
        return false;
    }

    // mcp_servers: 서버가 지정된 정책은 서버 없는 호출에 적용하지 않는다.
    // "*" 패턴이라도 마찬가지다.
    if (condition.mcp_servers.has_value()) {
        if (ctx.mcp_server.empty()) {
            return false;
        }
        if (!list_match(condition.mcp_servers, ctx.mcp_server)) {
            return false;
        }
    }

    return true;
}
