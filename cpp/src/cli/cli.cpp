// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: формат help и ошибок повторяет clap
// ("error: ..." + Usage + подсказка про --help).
//
// ==============================================================================

#include "indexlens/cli.hpp"

#include "indexlens/config.hpp"
#include "indexlens/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace indexlens::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string usage_line(const std::optional<std::string>& command) {
    if (!command) {
        return "Usage: indexlens [OPTIONS] <COMMAND>";
    }
    if (*command == "parse") {
        return "Usage: indexlens parse [OPTIONS] [IDENTIFIER]...";
    }
    if (*command == "prep") {
        return "Usage: indexlens prep [OPTIONS] <PATH>...";
    }
    return "Usage: indexlens [OPTIONS] <COMMAND>";
}

/// Сообщение об ошибке парсинга в стиле clap
std::string render_usage_error(const std::string& error_msg,
                               const std::optional<std::string>& command) {
    return "error: " + error_msg + "\n\n" + usage_line(command) +
           "\n\nFor more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& error_msg,
                        const std::optional<std::string>& command) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg, command);
    return result;
}

/// Аргумент, требующий значения: "--opt VALUE" или "--opt=VALUE"
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start) : argc_(argc), argv_(argv), i_(start) {}

    bool done() const { return i_ >= argc_; }
    const char* current() const { return argv_[i_]; }
    void advance() { ++i_; }

    /// Совпадает ли текущий аргумент с одним из имён (с учётом "--long=value")
    bool is(const char* short_name, const char* long_name) const {
        const char* arg = current();
        if (short_name != nullptr && str_eq(arg, short_name)) {
            return true;
        }
        if (long_name == nullptr) {
            return false;
        }
        if (str_eq(arg, long_name)) {
            return true;
        }
        std::size_t len = std::strlen(long_name);
        return std::strncmp(arg, long_name, len) == 0 && arg[len] == '=';
    }

    /// Забрать значение опции; nullopt если значения нет
    std::optional<std::string> take_value() {
        const char* arg = current();
        const char* eq = std::strchr(arg, '=');
        if (starts_with(arg, "--") && eq != nullptr) {
            return std::string(eq + 1);
        }
        if (i_ + 1 >= argc_) {
            return std::nullopt;
        }
        ++i_;
        return std::string(argv_[i_]);
    }

private:
    int argc_;
    char** argv_;
    int i_;
};

/// Флаги совместимости разбора, общие для parse и prep
bool parse_parser_flag(const ArgCursor& args, ParserFlags& flags) {
    if (args.is(nullptr, "--source-order")) {
        flags.source_order = true;
    } else if (args.is(nullptr, "--literal-prefix")) {
        flags.literal_prefix = true;
    } else if (args.is(nullptr, "--fallback-token-environment")) {
        flags.fallback_token_environment = true;
    } else if (args.is(nullptr, "--structured-default-environment")) {
        flags.structured_default_environment = true;
    } else {
        return false;
    }
    return true;
}

std::string missing_value(const char* placeholder) {
    return std::string("a value is required for '") + placeholder + "' but none was supplied";
}

std::optional<unsigned> parse_thread_count(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long n = std::strtoul(value.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || value[0] == '-' || n > 4096) {
        return std::nullopt;
    }
    return static_cast<unsigned>(n);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("indexlens ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    static const char* PARSER_OPTIONS =
        "      --config <CONFIG>                 YAML configuration file\n"
        "      --source-order                    Send every '.ds-' name to the textual parser\n"
        "      --literal-prefix                  Strip exactly one '.ds-' prefix\n"
        "      --fallback-token-environment      Report the extracted token as environment\n"
        "      --structured-default-environment  Use 'default' when a namespace has no '-'\n";

    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: indexlens [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  parse  Classify index names given on the command line or stdin\n"
               "  prep   Enrich index report files with classification fields\n"
               "  help   Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner                  Hide the banner\n"
               "      --num-threads <NUM_THREADS>  Limit the thread number (default: num of CPUs)\n"
               "  -v...                            Print verbose output\n"
               "  -q                               Suppress informational output\n"
               "  -h, --help                       Print help\n"
               "  -V, --version                    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Classify a single backing index:\n"
               "        ./indexlens parse .ds-logs-nginx.access-2024.01.15-000003\n"
               "\n"
               "    Enrich a cluster report and write a bulk file:\n"
               "        ./indexlens prep prod-eu.csv -o prod-eu.out.csv --bulk prod-eu.ndjson "
               "--es-index index-metadata\n";
    } else if (*command == "parse") {
        return std::string(
                   "Classify index names given on the command line or stdin\n"
                   "\n"
                   "Usage: indexlens parse [OPTIONS] [IDENTIFIER]...\n"
                   "\n"
                   "Arguments:\n"
                   "  [IDENTIFIER]...  Index names to classify\n"
                   "\n"
                   "Options:\n"
                   "      --stdin                           Read index names from stdin, one "
                   "per line\n"
                   "  -j, --json                            Output as JSON\n"
                   "      --jsonl                           Output as JSON lines\n"
                   "      --csv                             Output as CSV\n"
                   "  -o, --output <OUTPUT>                 Save output to a file\n") +
               PARSER_OPTIONS + "  -h, --help                            Print help\n";
    } else if (*command == "prep") {
        return std::string(
                   "Enrich index report files with classification fields\n"
                   "\n"
                   "Usage: indexlens prep [OPTIONS] <PATH>...\n"
                   "\n"
                   "Arguments:\n"
                   "  <PATH>...  Report files or directories containing .csv reports\n"
                   "\n"
                   "Options:\n"
                   "  -d, --delimiter <DELIMITER>           Input field delimiter [default: ;]\n"
                   "  -j, --json                            Output as JSON\n"
                   "      --jsonl                           Output as JSON lines\n"
                   "  -o, --output <OUTPUT>                 Save output to a file\n"
                   "      --bulk <BULK>                     Also write a bulk NDJSON file\n"
                   "      --es-index <ES_INDEX>             Target index for bulk actions "
                   "[env: ES_INDEX]\n"
                   "      --skip-errors                     Skip errors and continue "
                   "processing\n") +
               PARSER_OPTIONS + "  -h, --help                            Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: help в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    ArgCursor args(argc, argv, 1);
    for (; !args.done(); args.advance()) {
        const char* arg = args.current();

        if (args.is(nullptr, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
        } else if (str_eq(arg, "-vv")) {
            result.global.verbose += 2;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (args.is(nullptr, "--num-threads")) {
            auto value = args.take_value();
            if (!value) {
                return usage_error(result, missing_value("--num-threads <NUM_THREADS>"),
                                   std::nullopt);
            }
            auto threads = parse_thread_count(*value);
            if (!threads) {
                return usage_error(result,
                                   "invalid value '" + *value +
                                       "' for '--num-threads <NUM_THREADS>': invalid digit found "
                                       "in string",
                                   std::nullopt);
            }
            result.global.num_threads = *threads;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                               std::nullopt);
        } else {
            break;
        }
    }

    if (args.done()) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const std::string cmd = args.current();
    args.advance();

    if (cmd == "help") {
        result.ok = true;
        if (!args.done()) {
            result.command = HelpCommand{std::string(args.current())};
        } else {
            result.command = HelpCommand{};
        }
        return result;
    }

    if (cmd == "parse") {
        ParseCommand parse_cmd;
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"parse"};
                return result;
            } else if (args.is(nullptr, "--stdin")) {
                parse_cmd.from_stdin = true;
            } else if (args.is("-j", "--json")) {
                parse_cmd.json = true;
            } else if (args.is(nullptr, "--jsonl")) {
                parse_cmd.jsonl = true;
            } else if (args.is(nullptr, "--csv")) {
                parse_cmd.csv = true;
            } else if (args.is("-o", "--output")) {
                auto value = args.take_value();
                if (!value) {
                    return usage_error(result, missing_value("--output <OUTPUT>"), cmd);
                }
                parse_cmd.output = platform::path_from_utf8(*value);
            } else if (args.is(nullptr, "--config")) {
                auto value = args.take_value();
                if (!value) {
                    return usage_error(result, missing_value("--config <CONFIG>"), cmd);
                }
                parse_cmd.config = platform::path_from_utf8(*value);
            } else if (parse_parser_flag(args, parse_cmd.parser)) {
                // флаг совместимости разбора
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (str_eq(arg, "--")) {
                // Всё после "--" - имена индексов (в том числе начинающиеся с '-')
                for (args.advance(); !args.done(); args.advance()) {
                    parse_cmd.identifiers.emplace_back(args.current());
                }
                break;
            } else if (arg[0] == '-' && arg[1] != '\0') {
                return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                                   cmd);
            } else {
                parse_cmd.identifiers.emplace_back(arg);
            }
        }

        int formats = int(parse_cmd.json) + int(parse_cmd.jsonl) + int(parse_cmd.csv);
        if (formats > 1) {
            return usage_error(result, "the output formats --json, --jsonl and --csv are exclusive",
                               cmd);
        }
        if (parse_cmd.identifiers.empty() && !parse_cmd.from_stdin) {
            return usage_error(result,
                               "the following required arguments were not provided:\n"
                               "  <IDENTIFIER>... or --stdin",
                               cmd);
        }

        result.ok = true;
        result.command = std::move(parse_cmd);
        return result;
    }

    if (cmd == "prep") {
        PrepCommand prep_cmd;
        for (; !args.done(); args.advance()) {
            const char* arg = args.current();
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"prep"};
                return result;
            } else if (args.is("-j", "--json")) {
                prep_cmd.json = true;
            } else if (args.is(nullptr, "--jsonl")) {
                prep_cmd.jsonl = true;
            } else if (args.is(nullptr, "--skip-errors")) {
                prep_cmd.skip_errors = true;
            } else if (args.is("-o", "--output")) {
                auto value = args.take_value();
                if (!value) {
                    return usage_error(result, missing_value("--output <OUTPUT>"), cmd);
                }
                prep_cmd.output = platform::path_from_utf8(*value);
            } else if (args.is(nullptr, "--bulk")) {
                auto value = args.take_value();
                if (!value) {
                    return usage_error(result, missing_value("--bulk <BULK>"), cmd);
                }
                prep_cmd.bulk = platform::path_from_utf8(*value);
            } else if (args.is(nullptr, "--es-index")) {
                auto value = args.take_value();
                if (!value || value->empty()) {
                    return usage_error(result, missing_value("--es-index <ES_INDEX>"), cmd);
                }
                prep_cmd.es_index = *value;
            } else if (args.is("-d", "--delimiter")) {
                auto value = args.take_value();
                if (!value) {
                    return usage_error(result, missing_value("--delimiter <DELIMITER>"), cmd);
                }
                auto delimiter = config::delimiter_from_string(*value);
                if (!delimiter) {
                    return usage_error(result,
                                       "invalid value '" + *value +
                                           "' for '--delimiter <DELIMITER>': expected a single "
                                           "character",
                                       cmd);
                }
                prep_cmd.delimiter = *delimiter;
            } else if (args.is(nullptr, "--config")) {
                auto value = args.take_value();
                if (!value) {
                    return usage_error(result, missing_value("--config <CONFIG>"), cmd);
                }
                prep_cmd.config = platform::path_from_utf8(*value);
            } else if (parse_parser_flag(args, prep_cmd.parser)) {
                // флаг совместимости разбора
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (str_eq(arg, "-v")) {
                result.global.verbose++;
            } else if (arg[0] == '-' && arg[1] != '\0') {
                return usage_error(result, std::string("unexpected argument '") + arg + "' found",
                                   cmd);
            } else {
                prep_cmd.paths.push_back(platform::path_from_utf8(arg));
            }
        }

        if (prep_cmd.json && prep_cmd.jsonl) {
            return usage_error(result, "the output formats --json and --jsonl are exclusive", cmd);
        }
        if (prep_cmd.paths.empty()) {
            return usage_error(result,
                               "the following required arguments were not provided:\n"
                               "  <PATH>...",
                               cmd);
        }

        result.ok = true;
        result.command = std::move(prep_cmd);
        return result;
    }

    return usage_error(result, "unrecognized subcommand '" + cmd + "'", std::nullopt);
}

}  // namespace indexlens::cli
