#include "cli/context_args.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_engine.hpp"
#include "policy/policy_loader.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitUsage = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

void print_usage(const char* argv0) {
    fmt::print(stderr,
               "usage: {} [--all] key=value ...\n"
               "  keys: mode model channel tool mcp_server risk user session\n"
               "  env : TOOLGATE_POLICY_PATH, TOOLGATE_LOG_PATH, TOOLGATE_LOG_LEVEL\n",
               argv0);
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const std::string policy_path = env_str("TOOLGATE_POLICY_PATH", "config/policies/balanced.yaml");
    const std::string log_path    = env_str("TOOLGATE_LOG_PATH",    "/tmp/toolgate.log");
    const std::string log_level   = env_str("TOOLGATE_LOG_LEVEL",   "info");

    const LogLevel level = parse_log_level(log_level);
    // 진단 로그(spdlog 기본 로거)는 판정 출력과 섞이지 않도록 debug 가 아니면 warn 이상만
    spdlog::set_level(level == LogLevel::kDebug ? spdlog::level::debug : spdlog::level::warn);

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    std::vector<std::string_view> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    const auto request = parse_context_args(args);
    if (!request) {
        fmt::print(stderr, "toolgate: {}\n", request.error());
        print_usage(argv[0]);
        return kExitUsage;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    // 판정 결과는 stdout 으로 출력하므로 구조화 로그는 파일로만 보낸다.
    std::unique_ptr<StructuredLogger> logger;
    try {
        logger = std::make_unique<StructuredLogger>(level, log_path, false);
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "toolgate: {}\n", e.what());
        return EXIT_FAILURE;
    }

    // ── 정책 로드 ───────────────────────────────────────────────────────
    const auto policy_set = PolicyLoader::load(policy_path);

    PolicyLoadLog load_log{};
    load_log.source    = policy_path;
    load_log.success   = policy_set.has_value();
    load_log.timestamp = std::chrono::system_clock::now();
    if (!policy_set) {
        load_log.error = policy_set.error().message;
        logger->log_policy_load(load_log);
        fmt::print(stderr, "toolgate: {}\n", policy_set.error().message);
        return EXIT_FAILURE;
    }
    load_log.policy_set   = policy_set->metadata.name;
    load_log.version      = policy_set->metadata.version;
    load_log.policy_count = policy_set->policies.size();
    logger->log_policy_load(load_log);

    const PolicyEngine engine(*policy_set);

    // ── 판정 ────────────────────────────────────────────────────────────
    const auto started = std::chrono::steady_clock::now();
    const auto verdict = engine.evaluate(request->context);
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    fmt::print("effect={} channel={} policy_id={}\n",
               verdict.effect.str(),
               channel_to_string(verdict.channel),
               verdict.policy_id.value_or("-"));

    if (request->show_all) {
        for (const auto& report : engine.evaluate_all(request->context)) {
            fmt::print("  [{}] priority={} id={} effect={} enabled={} name='{}'\n",
                       report.matched ? "match" : "-----",
                       report.priority,
                       report.policy_id,
                       report.effect.str(),
                       report.enabled,
                       report.name);
        }
    }

    DecisionLog decision{};
    decision.context   = request->context;
    decision.effect    = verdict.effect.str();
    decision.channel   = std::string(channel_to_string(verdict.channel));
    decision.policy_id = verdict.policy_id;
    decision.timestamp = std::chrono::system_clock::now();
    decision.duration  = elapsed;
    logger->log_decision(decision);
    logger->flush();

    return EXIT_SUCCESS;
}
