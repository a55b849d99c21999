// ==============================================================================
// indexlens/config.hpp - YAML конфигурация
// ==============================================================================
//
// Формат файла (все ключи необязательны):
//
//   input:
//     delimiter: ";"
//     columns:
//       index: index
//       first_timestamp: first_timestamp
//       last_timestamp: last_timestamp
//       daily_ingest_mb: daily_ingest_mb
//   parser:
//     order: structured-first          # | source
//     strip: character-class           # | literal-prefix
//     fallback_environment: application # | token
//     structured_environment: unset    # | default
//   bulk:
//     index: index-metadata
//
// Приоритет: флаги CLI > файл > окружение (ES_INDEX) > значения по умолчанию.
//
// ==============================================================================

#ifndef INDEXLENS_CONFIG_HPP
#define INDEXLENS_CONFIG_HPP

#include <indexlens/identifier.hpp>
#include <indexlens/record.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace indexlens::config {

struct Config {
    char delimiter = ';';
    record::ColumnMapping columns;
    ParseOptions parser;

    /// Целевой индекс для bulk NDJSON
    std::optional<std::string> bulk_index;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;
};

/// Загрузить конфигурацию из файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML строки
ConfigResult parse_config(std::string_view yaml);

/// Целевой индекс bulk: --es-index > bulk.index > ES_INDEX.
/// Пустое значение на любом уровне считается незаданным.
std::optional<std::string> resolve_bulk_index(const std::optional<std::string>& cli,
                                              const Config& cfg);

// ----------------------------------------------------------------------------
// Значения перечислений (общие для YAML и CLI)
// ----------------------------------------------------------------------------

std::optional<DecisionOrder> decision_order_from_string(std::string_view s);
std::optional<StripMode> strip_mode_from_string(std::string_view s);
std::optional<FallbackEnvironment> fallback_environment_from_string(std::string_view s);
std::optional<StructuredEnvironment> structured_environment_from_string(std::string_view s);

/// Разделитель: ровно один символ, либо "\t" / "tab"
std::optional<char> delimiter_from_string(std::string_view s);

}  // namespace indexlens::config

#endif  // INDEXLENS_CONFIG_HPP
