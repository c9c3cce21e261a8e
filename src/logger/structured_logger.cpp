// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프 (기본적인 구현)
// ---------------------------------------------------------------------------
static std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        default:               return spdlog::level::info;
    }
}

LogLevel parse_log_level(std::string_view text) noexcept {
    if (text == "debug") {
        return LogLevel::kDebug;
    }
    if (text == "warn" || text == "warning") {
        return LogLevel::kWarn;
    }
    if (text == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level,
                                   const std::filesystem::path& log_path,
                                   bool to_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        if (to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (10MB, 3개 파일 유지)
        const std::size_t max_file_size = 10 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 전역 레지스트리에 등록하지 않는다 (인스턴스 간 이름 충돌 방지)
        logger_ = std::make_shared<spdlog::logger>("toolgate", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 메시지만 출력
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    const auto& ctx = entry.context;

    std::ostringstream json;
    json << R"({"event":"decision","mode":")" << escape_json_string(ctx.mode)
         << R"(","model":")" << escape_json_string(ctx.model)
         << R"(","channel":")" << escape_json_string(ctx.channel)
         << R"(","tool":")" << escape_json_string(ctx.tool)
         << R"(","mcp_server":")" << escape_json_string(ctx.mcp_server)
         << R"(","risk":")" << escape_json_string(ctx.risk)
         << R"(","user":")" << escape_json_string(ctx.user)
         << R"(","session":")" << escape_json_string(ctx.session)
         << R"(","effect":")" << escape_json_string(entry.effect)
         << R"(","response_channel":")" << escape_json_string(entry.channel)
         << R"(","policy_id":)";

    if (entry.policy_id.has_value()) {
        json << '"' << escape_json_string(*entry.policy_id) << '"';
    } else {
        json << "null";
    }

    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_policy_load: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_policy_load(const PolicyLoadLog& entry) {
    const LogLevel level = entry.success ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"policy_load","source":")" << escape_json_string(entry.source)
         << R"(","policy_set":")" << escape_json_string(entry.policy_set)
         << R"(","version":")" << escape_json_string(entry.version)
         << R"(","policy_count":)" << entry.policy_count
         << R"(,"success":)" << (entry.success ? "true" : "false")
         << R"(,"error":")" << escape_json_string(entry.error)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (entry.success) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
