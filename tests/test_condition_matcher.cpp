// ---------------------------------------------------------------------------
// test_condition_matcher.cpp
//
// condition_matches 단위 테스트.
//
// [테스트 범위]
// - catch-all (모든 필드 nullopt)
// - 필드별 매칭, 필드 간 AND, 필드 내 OR
// - 빈 컨텍스트 값과 "*" 패턴
// - mcp_servers 의 3가지 규칙 (nullopt / 서버 없음 / list_match)
// ---------------------------------------------------------------------------

#include "policy/condition_matcher.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

PatternList patterns(std::vector<std::string> items) {
    return PatternList{std::move(items)};
}

EvalContext make_ctx(const std::string& tool = "bash", const std::string& mode = "interactive") {
    EvalContext ctx{};
    ctx.tool = tool;
    ctx.mode = mode;
    return ctx;
}

}  // namespace

// ===========================================================================
// catch-all
// ===========================================================================

TEST(ConditionMatcher, EmptyCondition_MatchesEverything) {
    const Condition cond{};
    EXPECT_TRUE(condition_matches(cond, EvalContext{}));
    EXPECT_TRUE(condition_matches(cond, make_ctx("anything", "background")));
}

// ===========================================================================
// 필드별 매칭
// ===========================================================================

TEST(ConditionMatcher, Modes) {
    Condition cond{};
    cond.modes = patterns({"background"});
    EXPECT_TRUE(condition_matches(cond, make_ctx("bash", "background")));
    EXPECT_FALSE(condition_matches(cond, make_ctx("bash", "interactive")));
}

TEST(ConditionMatcher, ModelsGlob) {
    Condition cond{};
    cond.models = patterns({"gpt-*"});

    EvalContext ctx = make_ctx();
    ctx.model = "gpt-5.2";
    EXPECT_TRUE(condition_matches(cond, ctx));

    ctx.model = "claude-sonnet-4.6";
    EXPECT_FALSE(condition_matches(cond, ctx));
}

TEST(ConditionMatcher, ChannelsRiskUsersSessions) {
    Condition cond{};
    cond.channels = patterns({"slack"});
    cond.risk     = patterns({"high"});
    cond.users    = patterns({"alice", "bob"});
    cond.sessions = patterns({"prod-*"});

    EvalContext ctx = make_ctx();
    ctx.channel = "slack";
    ctx.risk    = "high";
    ctx.user    = "bob";
    ctx.session = "prod-42";
    EXPECT_TRUE(condition_matches(cond, ctx));

    ctx.user = "mallory";
    EXPECT_FALSE(condition_matches(cond, ctx));
}

TEST(ConditionMatcher, AndAcrossFields) {
    Condition cond{};
    cond.modes = patterns({"background"});
    cond.tools = patterns({"bash"});

    EXPECT_TRUE(condition_matches(cond, make_ctx("bash", "background")));
    EXPECT_FALSE(condition_matches(cond, make_ctx("grep", "background")));
    EXPECT_FALSE(condition_matches(cond, make_ctx("bash", "interactive")));
}

TEST(ConditionMatcher, OrWithinField) {
    Condition cond{};
    cond.tools = patterns({"view", "grep", "glob"});

    EXPECT_TRUE(condition_matches(cond, make_ctx("view")));
    EXPECT_TRUE(condition_matches(cond, make_ctx("glob")));
    EXPECT_FALSE(condition_matches(cond, make_ctx("edit")));
}

TEST(ConditionMatcher, EmptyListField_RejectsEverything) {
    Condition cond{};
    cond.tools = patterns({});
    EXPECT_FALSE(condition_matches(cond, make_ctx("bash")));
    EXPECT_FALSE(condition_matches(cond, make_ctx("")));
}

TEST(ConditionMatcher, EmptyContextValue_MatchesStarOnly) {
    Condition cond{};
    cond.risk = patterns({"*"});
    EXPECT_TRUE(condition_matches(cond, make_ctx()));  // risk 미설정

    cond.risk = patterns({"low"});
    EXPECT_FALSE(condition_matches(cond, make_ctx()));
}

// ===========================================================================
// mcp_servers
// ===========================================================================

TEST(ConditionMatcher, McpServers_Nullopt_NoConstraint) {
    const Condition cond{};
    EvalContext ctx = make_ctx("deploy");
    EXPECT_TRUE(condition_matches(cond, ctx));

    ctx.mcp_server = "azure-mcp-server";
    EXPECT_TRUE(condition_matches(cond, ctx));
}

TEST(ConditionMatcher, McpServers_PatternMatches) {
    Condition cond{};
    cond.mcp_servers = patterns({"azure-*"});

    EvalContext ctx = make_ctx("deploy");
    ctx.mcp_server = "azure-mcp-server";
    EXPECT_TRUE(condition_matches(cond, ctx));

    ctx.mcp_server = "github-mcp";
    EXPECT_FALSE(condition_matches(cond, ctx));
}

TEST(ConditionMatcher, McpServers_NoServerInContext_DoesNotMatch) {
    Condition cond{};
    cond.mcp_servers = patterns({"azure-*"});
    EXPECT_FALSE(condition_matches(cond, make_ctx("deploy")));
}

TEST(ConditionMatcher, McpServers_StarPattern_StillRequiresServer) {
    // 다른 필드와 달리 "*" 도 빈 서버값과는 일치하지 않는다
    Condition cond{};
    cond.mcp_servers = patterns({"*"});
    EXPECT_FALSE(condition_matches(cond, make_ctx("deploy")));

    EvalContext ctx = make_ctx("deploy");
    ctx.mcp_server = "any-server";
    EXPECT_TRUE(condition_matches(cond, ctx));
}

TEST(ConditionMatcher, McpServers_EmptyList_NoServer_DoesNotMatch) {
    Condition cond{};
    cond.mcp_servers = patterns({});
    EXPECT_FALSE(condition_matches(cond, make_ctx("deploy")));
}

// ===========================================================================
// 값 전체 비교
// ===========================================================================

TEST(ConditionMatcher, ToolWithEmbeddedNul_DoesNotMatchExactTool) {
    Condition cond{};
    cond.tools = patterns({"bash"});
    EXPECT_FALSE(condition_matches(cond, make_ctx(std::string("bash\0rm -rf", 11))));
    EXPECT_TRUE(condition_matches(cond, make_ctx("bash")));
}

TEST(ConditionMatcher, UserGlob_MatchesNonAsciiCharacter) {
    Condition cond{};
    cond.users = patterns({"user-?"});

    EvalContext ctx = make_ctx();
    ctx.user = "user-\xc3\xbc";
    EXPECT_TRUE(condition_matches(cond, ctx));
}
