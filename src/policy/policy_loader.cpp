// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 문서를 로드하여 PolicySet 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 선택 필드 누락 시 구조체 기본값을 적용한다.
//     apiVersion → "agent-policy/v1", kind → "PolicySet",
//     metadata.name → "unnamed", defaults → {ask, chat},
//     policy.enabled → true, policy.priority → 100, policy.channel → chat
// - 필수 필드(policy.id, policy.effect) 누락은 kMissingField.
// - effect 는 열린 열거형이므로 어떤 문자열이든 수용한다.
//   channel 은 닫힌 열거형이므로 "chat" | "phone" 외의 값은 kInvalidValue.
// - YAML 문서 전체를 로그에 출력하지 않는다.
//
// [condition 필드 해석]
// - 키 없음 또는 null       → std::nullopt (don't care)
// - sequence (빈 목록 포함) → 그대로 보존. 빈 목록은 "아무것도 일치 안 함".
// - 그 외 (scalar, map)     → kInvalidValue. 단일 문자열을 목록으로 암묵
//                             변환하지 않는다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr const char* kExpectedKind = "PolicySet";

// ---------------------------------------------------------------------------
// 내부 헬퍼: 오류 로그 출력 후 std::unexpected 생성
// ---------------------------------------------------------------------------
[[nodiscard]] std::unexpected<LoadError> fail(LoadErrorCode code, std::string message) {
    spdlog::error("{}", message);
    return std::unexpected(LoadError{code, std::move(message)});
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 패턴 목록 읽기 (Condition 필드 하나)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PatternList, LoadError>
read_pattern_list(const YAML::Node& node, const char* field, const std::string& policy_id) {
    if (!node || node.IsNull()) {
        return PatternList{};
    }
    if (!node.IsSequence()) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: policy '{}' condition.{} must be a sequence",
                                policy_id, field));
    }

    std::vector<std::string> patterns;
    patterns.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return fail(LoadErrorCode::kInvalidValue,
                        fmt::format("policy_loader: policy '{}' condition.{} contains a non-scalar item",
                                    policy_id, field));
        }
        patterns.push_back(item.as<std::string>());
    }
    return PatternList{std::move(patterns)};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: channel 값 읽기. 없으면 fallback.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Channel, LoadError>
read_channel(const YAML::Node& node, Channel fallback, const std::string& where) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: {} channel must be a scalar", where));
    }
    const auto raw     = node.as<std::string>();
    const auto channel = parse_channel(raw);
    if (!channel.has_value()) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: {} has invalid channel '{}' (expected chat|phone)",
                                where, raw));
    }
    return *channel;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Condition 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Condition, LoadError>
parse_condition(const YAML::Node& cond_node, const std::string& policy_id) {
    Condition cond{};
    if (!cond_node || cond_node.IsNull()) {
        return cond;
    }
    if (!cond_node.IsMap()) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: policy '{}' condition is not a map", policy_id));
    }

    const std::pair<const char*, PatternList Condition::*> fields[] = {
        {"modes",       &Condition::modes},
        {"models",      &Condition::models},
        {"channels",    &Condition::channels},
        {"tools",       &Condition::tools},
        {"mcp_servers", &Condition::mcp_servers},
        {"risk",        &Condition::risk},
        {"users",       &Condition::users},
        {"sessions",    &Condition::sessions},
    };

    for (const auto& [key, member] : fields) {
        auto patterns = read_pattern_list(cond_node[key], key, policy_id);
        if (!patterns) {
            return std::unexpected(std::move(patterns.error()));
        }
        cond.*member = std::move(*patterns);
    }

    return cond;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Policy 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Policy, LoadError>
parse_policy(const YAML::Node& policy_node, std::size_t index) {
    if (!policy_node.IsMap()) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: policies[{}] is not a map", index));
    }

    Policy policy{};

    const YAML::Node& id_node = policy_node["id"];
    if (!id_node || !id_node.IsScalar()) {
        return fail(LoadErrorCode::kMissingField,
                    fmt::format("policy_loader: policies[{}] has no 'id'", index));
    }
    policy.id = id_node.as<std::string>();

    const YAML::Node& effect_node = policy_node["effect"];
    if (!effect_node || !effect_node.IsScalar()) {
        return fail(LoadErrorCode::kMissingField,
                    fmt::format("policy_loader: policy '{}' has no 'effect'", policy.id));
    }
    policy.effect = Effect{effect_node.as<std::string>()};

    policy.name        = read_string(policy_node["name"], "");
    policy.description = read_string(policy_node["description"], "");

    try {
        if (policy_node["enabled"] && !policy_node["enabled"].IsNull()) {
            policy.enabled = policy_node["enabled"].as<bool>();
        }
    } catch (const YAML::BadConversion& e) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: policy '{}' enabled is not a boolean: {}",
                                policy.id, e.what()));
    }

    try {
        if (policy_node["priority"] && !policy_node["priority"].IsNull()) {
            policy.priority = policy_node["priority"].as<int>();
        }
    } catch (const YAML::BadConversion& e) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: policy '{}' priority is not an integer: {}",
                                policy.id, e.what()));
    }

    auto condition = parse_condition(policy_node["condition"], policy.id);
    if (!condition) {
        return std::unexpected(std::move(condition.error()));
    }
    policy.condition = std::move(*condition);

    auto channel = read_channel(policy_node["channel"], Channel::kChat,
                                fmt::format("policy '{}'", policy.id));
    if (!channel) {
        return std::unexpected(std::move(channel.error()));
    }
    policy.channel = *channel;

    return policy;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Defaults 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Defaults, LoadError> parse_defaults(const YAML::Node& node) {
    Defaults defaults{};
    if (!node || node.IsNull()) {
        return defaults;
    }
    if (!node.IsMap()) {
        return fail(LoadErrorCode::kInvalidValue, "policy_loader: 'defaults' is not a map");
    }

    defaults.effect = Effect{read_string(node["effect"], defaults.effect.str())};

    auto channel = read_channel(node["channel"], defaults.channel, "defaults");
    if (!channel) {
        return std::unexpected(std::move(channel.error()));
    }
    defaults.channel = *channel;
    return defaults;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: Metadata 파싱
// labels 의 scalar 가 아닌 값은 건너뛴다 (판정에 영향 없음).
// ---------------------------------------------------------------------------
[[nodiscard]] Metadata parse_metadata(const YAML::Node& node) {
    Metadata meta{};
    if (!node || !node.IsMap()) {
        return meta;
    }

    meta.name        = read_string(node["name"], meta.name);
    meta.description = read_string(node["description"], meta.description);
    meta.version     = read_string(node["version"], meta.version);

    const YAML::Node& labels = node["labels"];
    if (labels && labels.IsMap()) {
        for (const auto& kv : labels) {
            if (kv.first.IsScalar() && kv.second.IsScalar()) {
                meta.labels.emplace(kv.first.as<std::string>(), kv.second.as<std::string>());
            } else {
                spdlog::warn("policy_loader: metadata.labels has a non-scalar entry, ignoring");
            }
        }
    }
    return meta;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: context_fallbacks 파싱 (mode → mode)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::map<std::string, std::string>, LoadError>
parse_context_fallbacks(const YAML::Node& node) {
    std::map<std::string, std::string> fallbacks;
    if (!node || node.IsNull()) {
        return fallbacks;
    }
    if (!node.IsMap()) {
        return fail(LoadErrorCode::kInvalidValue, "policy_loader: 'context_fallbacks' is not a map");
    }
    for (const auto& kv : node) {
        if (!kv.first.IsScalar() || !kv.second.IsScalar()) {
            return fail(LoadErrorCode::kInvalidValue,
                        "policy_loader: 'context_fallbacks' entries must map a mode to a mode");
        }
        fallbacks.insert_or_assign(kv.first.as<std::string>(), kv.second.as<std::string>());
    }
    return fallbacks;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 최상위 문서 → PolicySet
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PolicySet, LoadError>
parse_document(const YAML::Node& root, const std::string& source) {
    if (!root || !root.IsMap()) {
        return fail(LoadErrorCode::kNotAMapping,
                    fmt::format("policy_loader: '{}' is not a valid YAML map (top-level)", source));
    }

    PolicySet set{};

    // 1. kind 검사: 어떤 상태도 만들기 전에 거부
    set.kind = read_string(root["kind"], set.kind);
    if (set.kind != kExpectedKind) {
        return fail(LoadErrorCode::kUnsupportedKind,
                    fmt::format("policy_loader: unsupported kind '{}' in '{}' (expected {})",
                                set.kind, source, kExpectedKind));
    }
    set.api_version = read_string(root["apiVersion"], set.api_version);

    // 2. 각 섹션 파싱 (yaml-cpp 예외는 kInvalidValue 로 변환)
    try {
        set.metadata = parse_metadata(root["metadata"]);

        auto defaults = parse_defaults(root["defaults"]);
        if (!defaults) {
            return std::unexpected(std::move(defaults.error()));
        }
        set.defaults = std::move(*defaults);

        const YAML::Node& policies_node = root["policies"];
        if (policies_node && !policies_node.IsNull()) {
            if (!policies_node.IsSequence()) {
                return fail(LoadErrorCode::kInvalidValue,
                            fmt::format("policy_loader: 'policies' in '{}' is not a sequence", source));
            }
            set.policies.reserve(policies_node.size());
            std::size_t index = 0;
            for (const auto& policy_node : policies_node) {
                auto policy = parse_policy(policy_node, index++);
                if (!policy) {
                    return std::unexpected(std::move(policy.error()));
                }
                set.policies.push_back(std::move(*policy));
            }
        }

        auto fallbacks = parse_context_fallbacks(root["context_fallbacks"]);
        if (!fallbacks) {
            return std::unexpected(std::move(fallbacks.error()));
        }
        set.context_fallbacks = std::move(*fallbacks);
    } catch (const YAML::Exception& e) {
        return fail(LoadErrorCode::kInvalidValue,
                    fmt::format("policy_loader: error parsing '{}': {}", source, e.what()));
    }

    spdlog::info("policy_loader: policy set '{}' loaded successfully: policies={}, fallbacks={}",
                 set.metadata.name, set.policies.size(), set.context_fallbacks.size());
    return set;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<PolicySet, LoadError>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(LoadErrorCode::kFileError,
                    fmt::format("policy_loader: cannot resolve config path '{}': {}",
                                config_path.string(), ec.message()));
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(LoadErrorCode::kFileError,
                    fmt::format("policy_loader: cannot open file '{}': {}",
                                canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(LoadErrorCode::kYamlSyntax,
                    fmt::format("policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                canonical_path.string(),
                                e.mark.line + 1,   // yaml-cpp는 0-based
                                e.mark.column + 1,
                                e.what()));
    } catch (const YAML::Exception& e) {
        return fail(LoadErrorCode::kYamlSyntax,
                    fmt::format("policy_loader: YAML error in '{}': {}",
                                canonical_path.string(), e.what()));
    }

    return parse_document(root, canonical_path.string());
}

// ---------------------------------------------------------------------------
// PolicyLoader::load_from_string 구현
// ---------------------------------------------------------------------------
std::expected<PolicySet, LoadError>
PolicyLoader::load_from_string(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        return fail(LoadErrorCode::kYamlSyntax,
                    fmt::format("policy_loader: YAML parse error at line {}, col {}: {}",
                                e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(LoadErrorCode::kYamlSyntax,
                    fmt::format("policy_loader: YAML error: {}", e.what()));
    }

    return parse_document(root, "<string>");
}
