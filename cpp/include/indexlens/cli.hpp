// ==============================================================================
// indexlens/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диспетчеризация подкоманд
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef INDEXLENS_CLI_HPP
#define INDEXLENS_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace indexlens::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;    // --no-banner
    unsigned num_threads = 0;  // --num-threads (0 = число CPU)
    int verbose = 0;           // -v (repeatable)
    bool quiet = false;        // -q
};

/// Флаги совместимости разбора (перекрывают значения из --config)
struct ParserFlags {
    bool source_order = false;                    // --source-order
    bool literal_prefix = false;                  // --literal-prefix
    bool fallback_token_environment = false;      // --fallback-token-environment
    bool structured_default_environment = false;  // --structured-default-environment
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// parse - разбор имён индексов из аргументов и/или stdin
struct ParseCommand {
    std::vector<std::string> identifiers;  // positional
    bool from_stdin = false;               // --stdin
    bool json = false;                     // -j, --json
    bool jsonl = false;                    // --jsonl
    bool csv = false;                      // --csv
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<std::filesystem::path> config;  // --config
    ParserFlags parser;
};

/// prep - обогащение табличных отчётов результатами разбора
struct PrepCommand {
    std::vector<std::filesystem::path> paths;     // positional: файлы или директории
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<std::filesystem::path> bulk;    // --bulk
    std::optional<std::string> es_index;          // --es-index
    std::optional<char> delimiter;                // -d, --delimiter
    std::optional<std::filesystem::path> config;  // --config
    bool skip_errors = false;                     // --skip-errors
    ParserFlags parser;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ParseCommand, PrepCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для подкоманды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Classify index names into dataset, namespace and environment";

}  // namespace indexlens::cli

#endif  // INDEXLENS_CLI_HPP
