// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인 파싱 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\"") != std::string::npos;
    }

    // 문자열 값은 따옴표 없이, 그 외(number/bool/null)는 원문 그대로 반환
    std::string get_field(const std::string& field) const {
        std::string search_key = "\"" + field + "\":";
        size_t      pos         = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }
        pos += search_key.length();

        std::ostringstream oss;
        if (pos < parsed_.size() && parsed_[pos] == '"') {
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else {
            while (pos < parsed_.size() && parsed_[pos] != ',' && parsed_[pos] != '}') {
                oss << parsed_[pos];
                ++pos;
            }
        }
        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "toolgate_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    static DecisionLog make_decision() {
        DecisionLog entry;
        entry.context.mode       = "background";
        entry.context.model      = "gpt-5.2";
        entry.context.channel    = "slack";
        entry.context.tool       = "bash";
        entry.context.mcp_server = "";
        entry.context.risk       = "high";
        entry.context.user       = "alice";
        entry.context.session    = "prod-42";
        entry.effect             = "deny";
        entry.channel            = "chat";
        entry.policy_id          = "deny-background-high";
        entry.timestamp          = std::chrono::system_clock::now();
        entry.duration           = std::chrono::microseconds(42);
        return entry;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: DecisionLog JSON 직렬화
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DecisionLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    logger.log_decision(make_decision());
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0U) << "No log lines found";

    JsonLineParser parser(lines[0]);
    for (const auto* field : {"event", "mode", "model", "channel", "tool", "mcp_server", "risk",
                              "user", "session", "effect", "response_channel", "policy_id",
                              "timestamp", "duration_us"}) {
        EXPECT_TRUE(parser.has_field(field)) << field;
    }

    EXPECT_EQ(parser.get_field("event"), "decision");
    EXPECT_EQ(parser.get_field("mode"), "background");
    EXPECT_EQ(parser.get_field("tool"), "bash");
    EXPECT_EQ(parser.get_field("effect"), "deny");
    EXPECT_EQ(parser.get_field("response_channel"), "chat");
    EXPECT_EQ(parser.get_field("policy_id"), "deny-background-high");
    EXPECT_EQ(parser.get_field("duration_us"), "42");
}

// ---------------------------------------------------------------------------
// Test: 기본값 판정은 policy_id 가 null
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DecisionLogDefaultVerdictHasNullPolicyId) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    auto entry      = make_decision();
    entry.policy_id = std::nullopt;
    logger.log_decision(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0U);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("policy_id"), "null");
    EXPECT_NE(lines[0].find("\"policy_id\":null"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: PolicyLoadLog 성공/실패
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, PolicyLoadLogFields) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    PolicyLoadLog ok;
    ok.source       = "config/policies/balanced.yaml";
    ok.policy_set   = "balanced";
    ok.version      = "1.0.0";
    ok.policy_count = 6;
    ok.success      = true;
    ok.timestamp    = std::chrono::system_clock::now();
    logger.log_policy_load(ok);

    PolicyLoadLog failed;
    failed.source    = "missing.yaml";
    failed.success   = false;
    failed.error     = "cannot resolve config path";
    failed.timestamp = std::chrono::system_clock::now();
    logger.log_policy_load(failed);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 2U);

    JsonLineParser first(lines[0]);
    EXPECT_EQ(first.get_field("event"), "policy_load");
    EXPECT_EQ(first.get_field("policy_set"), "balanced");
    EXPECT_EQ(first.get_field("policy_count"), "6");
    EXPECT_EQ(first.get_field("success"), "true");

    JsonLineParser second(lines[1]);
    EXPECT_EQ(second.get_field("success"), "false");
    EXPECT_EQ(second.get_field("error"), "cannot resolve config path");
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kWarn, log_file_, false);

    // Info 레벨 (필터되어야 함)
    logger.log_decision(make_decision());

    PolicyLoadLog ok;
    ok.success   = true;
    ok.timestamp = std::chrono::system_clock::now();
    logger.log_policy_load(ok);

    // Warn 레벨 (기록되어야 함)
    PolicyLoadLog failed;
    failed.success   = false;
    failed.error     = "bad kind";
    failed.timestamp = std::chrono::system_clock::now();
    logger.log_policy_load(failed);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1U);
    EXPECT_NE(lines[0].find("bad kind"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅 (크래시 없음)
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingNoCrash) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    const int                num_threads     = 4;
    const int                logs_per_thread = 10;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < logs_per_thread; ++i) {
                auto entry         = make_decision();
                entry.context.user = "user_" + std::to_string(t);
                entry.context.tool = "tool_" + std::to_string(i);
                logger.log_decision(entry);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }
    logger.flush();

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kInfo, log_file_, false);

    auto entry         = make_decision();
    entry.context.user = "user\"with\\quotes";
    entry.context.tool = "multi\nline";
    logger.log_decision(entry);
    logger.flush();

    auto lines = read_log_lines();
    // 개행이 이스케이프되어 한 줄로 기록되어야 한다
    ASSERT_EQ(lines.size(), 1U);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("user"), "user\"with\\quotes");
    EXPECT_NE(lines[0].find("multi\\nline"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(LogLevel::kDebug, log_file_, false);

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");
    logger.flush();

    std::ifstream file(log_file_);
    EXPECT_TRUE(file.is_open()) << "Log file was not created";

    file.seekg(0, std::ios::end);
    std::streamsize file_size = file.tellg();
    EXPECT_GT(file_size, 0) << "Log file is empty";
}

// ---------------------------------------------------------------------------
// Test: 생성 실패 시 runtime_error
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, UnwritablePathThrows) {
    // 일반 파일을 디렉터리로 사용하려 하면 싱크 생성이 실패한다
    const fs::path blocker = log_dir_ / "blocker";
    std::ofstream(blocker) << "x";

    EXPECT_THROW(StructuredLogger(LogLevel::kInfo, blocker / "nested" / "test.log", false),
                 std::runtime_error);
}

// ---------------------------------------------------------------------------
// Test: parse_log_level
// ---------------------------------------------------------------------------
TEST(LogLevel, ParseKnownAndUnknown) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level(""), LogLevel::kInfo);
}
