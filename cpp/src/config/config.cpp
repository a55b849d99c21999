// ==============================================================================
// config.cpp - YAML конфигурация (yaml-cpp)
// ==============================================================================

#include "indexlens/config.hpp"

#include "indexlens/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace indexlens::config {

namespace {

/// Прочитать строковый ключ, если он задан
std::optional<std::string> get_string(const YAML::Node& node, const char* key) {
    if (!node || !node[key]) {
        return std::nullopt;
    }
    return node[key].as<std::string>();
}

/// Прочитать ключ-перечисление; неизвестное значение - ошибка
template <typename T, typename Parser>
bool read_enum(const YAML::Node& node, const char* key, Parser parse, T& target,
               std::string& error) {
    auto raw = get_string(node, key);
    if (!raw) {
        return true;
    }
    auto value = parse(*raw);
    if (!value) {
        error = std::string("invalid value '") + *raw + "' for parser." + key;
        return false;
    }
    target = *value;
    return true;
}

ConfigResult parse_root(const YAML::Node& root) {
    ConfigResult result;
    Config& cfg = result.config;

    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = "configuration root must be a mapping";
        return result;
    }

    // input
    if (const YAML::Node input = root["input"]) {
        if (auto delimiter = get_string(input, "delimiter")) {
            auto parsed = delimiter_from_string(*delimiter);
            if (!parsed) {
                result.error = "invalid input.delimiter '" + *delimiter + "'";
                return result;
            }
            cfg.delimiter = *parsed;
        }
        if (const YAML::Node columns = input["columns"]) {
            if (!columns.IsMap()) {
                result.error = "input.columns must be a mapping";
                return result;
            }
            if (auto v = get_string(columns, "index")) {
                cfg.columns.index = *v;
            }
            if (auto v = get_string(columns, "first_timestamp")) {
                cfg.columns.first_timestamp = *v;
            }
            if (auto v = get_string(columns, "last_timestamp")) {
                cfg.columns.last_timestamp = *v;
            }
            if (auto v = get_string(columns, "daily_ingest_mb")) {
                cfg.columns.daily_ingest_mb = *v;
            }
        }
    }

    // parser
    if (const YAML::Node parser = root["parser"]) {
        if (!read_enum(parser, "order", decision_order_from_string, cfg.parser.order,
                       result.error) ||
            !read_enum(parser, "strip", strip_mode_from_string, cfg.parser.strip, result.error) ||
            !read_enum(parser, "fallback_environment", fallback_environment_from_string,
                       cfg.parser.fallback_environment, result.error) ||
            !read_enum(parser, "structured_environment", structured_environment_from_string,
                       cfg.parser.structured_environment, result.error)) {
            return result;
        }
    }

    // bulk
    if (const YAML::Node bulk = root["bulk"]) {
        cfg.bulk_index = get_string(bulk, "index");
    }

    result.ok = true;
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = "cannot open config file: " + platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

ConfigResult parse_config(std::string_view yaml) {
    ConfigResult result;
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        return parse_root(root);
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

// ----------------------------------------------------------------------------
// Приоритет источников
// ----------------------------------------------------------------------------

std::optional<std::string> resolve_bulk_index(const std::optional<std::string>& cli,
                                              const Config& cfg) {
    if (cli && !cli->empty()) {
        return cli;
    }
    if (cfg.bulk_index && !cfg.bulk_index->empty()) {
        return cfg.bulk_index;
    }
    return platform::get_env("ES_INDEX");
}

// ----------------------------------------------------------------------------
// Значения перечислений
// ----------------------------------------------------------------------------

std::optional<DecisionOrder> decision_order_from_string(std::string_view s) {
    if (s == "structured-first") {
        return DecisionOrder::StructuredFirst;
    }
    if (s == "source") {
        return DecisionOrder::Source;
    }
    return std::nullopt;
}

std::optional<StripMode> strip_mode_from_string(std::string_view s) {
    if (s == "character-class") {
        return StripMode::CharacterClass;
    }
    if (s == "literal-prefix") {
        return StripMode::LiteralPrefix;
    }
    return std::nullopt;
}

std::optional<FallbackEnvironment> fallback_environment_from_string(std::string_view s) {
    if (s == "application") {
        return FallbackEnvironment::Application;
    }
    if (s == "token") {
        return FallbackEnvironment::Token;
    }
    return std::nullopt;
}

std::optional<StructuredEnvironment> structured_environment_from_string(std::string_view s) {
    if (s == "unset") {
        return StructuredEnvironment::Unset;
    }
    if (s == "default") {
        return StructuredEnvironment::Default;
    }
    return std::nullopt;
}

std::optional<char> delimiter_from_string(std::string_view s) {
    if (s == "\\t" || s == "tab" || s == "\t") {
        return '\t';
    }
    if (s.size() != 1 || s[0] == '"' || s[0] == '\n' || s[0] == '\r') {
        return std::nullopt;
    }
    return s[0];
}

}  // namespace indexlens::config
