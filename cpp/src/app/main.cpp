// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Сборка настроек: флаги CLI > --config > ES_INDEX > значения по умолчанию
// 4. Dispatch команды
// 5. Возврат exit code
//
// ==============================================================================

#include "indexlens/batch.hpp"
#include "indexlens/cli.hpp"
#include "indexlens/config.hpp"
#include "indexlens/discovery.hpp"
#include "indexlens/identifier.hpp"
#include "indexlens/output.hpp"
#include "indexlens/platform.hpp"
#include "indexlens/record.hpp"
#include "indexlens/table_reader.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <rapidjson/document.h>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
    _           _            _
   (_)_ __   __| | _____  _ | | ___ _ __  ___
   | | '_ \ / _` |/ _ \ \/ /| |/ _ \ '_ \/ __|
   | | | | | (_| |  __/>  < | |  __/ | | \__ \
   |_|_| |_|\__,_|\___/_/\_\|_|\___|_| |_|___/
)";

void print_banner(indexlens::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(indexlens::output::Stream::Stderr, BANNER);
    writer.write_line(indexlens::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Настройки
// ----------------------------------------------------------------------------

/// Загрузить --config, если задан. false - ошибка уже выведена.
bool load_settings(const std::optional<std::filesystem::path>& path,
                   indexlens::config::Config& cfg, indexlens::output::Writer& writer) {
    using namespace indexlens;

    if (!path.has_value()) {
        return true;
    }
    auto result = config::load_config(*path);
    if (!result.ok) {
        writer.error("failed to load config '" + platform::path_to_utf8(*path) + "' - " +
                     result.error);
        return false;
    }
    writer.debug("Loaded configuration from " + platform::path_to_utf8(*path));
    cfg = std::move(result.config);
    return true;
}

/// Флаги CLI поверх настроек из файла
void apply_parser_flags(const indexlens::cli::ParserFlags& flags, indexlens::ParseOptions& opts) {
    using namespace indexlens;

    if (flags.source_order) {
        opts.order = DecisionOrder::Source;
    }
    if (flags.literal_prefix) {
        opts.strip = StripMode::LiteralPrefix;
    }
    if (flags.fallback_token_environment) {
        opts.fallback_environment = FallbackEnvironment::Token;
    }
    if (flags.structured_default_environment) {
        opts.structured_environment = StructuredEnvironment::Default;
    }
}

/// Трассировка ухода имени в текстовый разбор (-vv)
void attach_fallback_trace(indexlens::ParseOptions& opts, indexlens::output::Writer& writer) {
    if (writer.config().verbose <= 1) {
        return;
    }
    // Вызывается из рабочих потоков parse_batch
    static std::mutex trace_mutex;
    opts.on_fallback = [&writer](std::string_view identifier) {
        std::lock_guard<std::mutex> lock(trace_mutex);
        writer.trace("Falling back to textual parsing for '" + std::string(identifier) + "'");
    };
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

std::vector<std::string> read_stdin_identifiers() {
    std::vector<std::string> identifiers;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            identifiers.push_back(std::move(line));
        }
    }
    return identifiers;
}

int run_parse(const indexlens::cli::ParseCommand& cmd, const indexlens::cli::GlobalOptions& global,
              indexlens::output::Writer& writer) {
    using namespace indexlens;

    config::Config cfg;
    if (!load_settings(cmd.config, cfg, writer)) {
        return 1;
    }
    ParseOptions opts = cfg.parser;
    apply_parser_flags(cmd.parser, opts);

    std::vector<std::string> identifiers = cmd.identifiers;
    if (cmd.from_stdin) {
        auto lines = read_stdin_identifiers();
        identifiers.insert(identifiers.end(), std::make_move_iterator(lines.begin()),
                           std::make_move_iterator(lines.end()));
    }
    writer.debug("Parsing " + std::to_string(identifiers.size()) + " index names");

    // Вывод в файл, если указан
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("unable to create output file: " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    attach_fallback_trace(opts, writer);
    const auto results = parse_batch(identifiers, opts, global.num_threads);

    if (cmd.json || cmd.jsonl) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& allocator = doc.GetAllocator();

        for (std::size_t i = 0; i < results.size(); ++i) {
            rapidjson::Value object(rapidjson::kObjectType);
            object.AddMember(
                "identifier",
                rapidjson::Value(identifiers[i].c_str(),
                                 static_cast<rapidjson::SizeType>(identifiers[i].size()), allocator),
                allocator);
            record::parsed_to_json(results[i], object, allocator);

            if (cmd.jsonl) {
                out->write_json_line(object);
            } else {
                doc.PushBack(object, allocator);
            }
        }
        if (cmd.json) {
            out->write_json_pretty(doc);
        }
    } else if (cmd.csv) {
        std::vector<std::string> header = {"identifier"};
        auto parsed_header = record::parsed_csv_header();
        header.insert(header.end(), parsed_header.begin(), parsed_header.end());
        out->write_line(output::Stream::Stdout, output::format_csv_row(header));

        for (std::size_t i = 0; i < results.size(); ++i) {
            std::vector<std::string> cells = {identifiers[i]};
            auto parsed_cells = record::parsed_csv_cells(results[i]);
            cells.insert(cells.end(), parsed_cells.begin(), parsed_cells.end());
            out->write_line(output::Stream::Stdout, output::format_csv_row(cells));
        }
    } else {
        // Таблица (по умолчанию)
        output::Table table;
        std::vector<std::string> header = {"identifier"};
        auto parsed_header = record::parsed_csv_header();
        header.insert(header.end(), parsed_header.begin(), parsed_header.end());
        table.set_headers(header);

        for (std::size_t i = 0; i < results.size(); ++i) {
            std::vector<std::string> cells = {identifiers[i]};
            auto parsed_cells = record::parsed_csv_cells(results[i]);
            cells.insert(cells.end(), parsed_cells.begin(), parsed_cells.end());
            table.add_row(cells);
        }
        if (table.row_count() > 0) {
            table.print(*out);
        }
    }

    std::size_t unrecognized = 0;
    for (const auto& parsed : results) {
        if (!parsed.recognized()) {
            ++unrecognized;
        }
    }
    writer.info("Parsed " + std::to_string(results.size()) + " index names (" +
                std::to_string(unrecognized) + " unrecognized)");

    if (cmd.output.has_value()) {
        writer.info("Saved output to " + platform::path_to_utf8(*cmd.output));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// prep
// ----------------------------------------------------------------------------

/// Прочитать один отчёт. false - фатальная ошибка (уже выведена).
/// При skip_errors битые файлы и строки выводятся как предупреждения и пропускаются.
bool load_report(const std::filesystem::path& file, const indexlens::config::Config& cfg,
                 bool skip_errors, std::vector<indexlens::record::IndexRecord>& records,
                 indexlens::output::Writer& writer) {
    using namespace indexlens;

    auto report_error = [&](const std::string& message) {
        if (skip_errors) {
            writer.warn(message);
            return true;
        }
        writer.error(message);
        return false;
    };

    auto opened = io::TableReader::open(file, cfg.delimiter);
    if (!opened) {
        return report_error(opened.error.format());
    }
    auto& reader = *opened.reader;

    auto columns = record::resolve_columns(reader, cfg.columns);
    if (!columns.ok) {
        return report_error("failed to load file '" + platform::path_to_utf8(file) + "' - " +
                            columns.error);
    }

    const std::string cluster = record::cluster_name_from_path(file);
    std::size_t loaded = 0;

    io::Row row;
    while (reader.next(row)) {
        auto built = record::read_record(row, columns.columns, cluster);
        if (!built.ok) {
            if (!report_error("failed to parse row in '" + platform::path_to_utf8(file) +
                              "' - " + built.error)) {
                return false;
            }
            continue;
        }
        records.push_back(std::move(built.record));
        ++loaded;
    }

    if (const auto& err = reader.last_error()) {
        if (!report_error(err->format())) {
            return false;
        }
    }

    writer.debug("Loaded " + std::to_string(loaded) + " rows from " +
                 platform::path_to_utf8(file) + " (cluster: " + cluster + ")");
    return true;
}

int write_bulk(const std::vector<indexlens::record::IndexRecord>& records,
               const std::filesystem::path& path, const std::string& target_index,
               indexlens::output::Writer& writer) {
    using namespace indexlens;

    output::OutputConfig bulk_cfg = writer.config();
    bulk_cfg.output_path = path;
    output::Writer bulk_writer(bulk_cfg);
    if (!bulk_writer.has_output_file()) {
        writer.error("unable to create bulk file: " + platform::path_to_utf8(path));
        return 1;
    }

    for (const auto& rec : records) {
        bulk_writer.write(output::Stream::Stdout, record::format_bulk_action(rec, target_index));
    }

    writer.info("Wrote " + std::to_string(records.size()) + " bulk actions for index '" +
                target_index + "' to " + platform::path_to_utf8(path));
    return 0;
}

int run_prep(const indexlens::cli::PrepCommand& cmd, const indexlens::cli::GlobalOptions& global,
             indexlens::output::Writer& writer) {
    using namespace indexlens;

    config::Config cfg;
    if (!load_settings(cmd.config, cfg, writer)) {
        return 1;
    }
    apply_parser_flags(cmd.parser, cfg.parser);
    attach_fallback_trace(cfg.parser, writer);
    if (cmd.delimiter.has_value()) {
        cfg.delimiter = *cmd.delimiter;
    }

    std::optional<std::string> es_index = config::resolve_bulk_index(cmd.es_index, cfg);
    if (cmd.bulk.has_value() && !es_index) {
        writer.error("no target index for bulk output, use --es-index, bulk.index or ES_INDEX");
        return 1;
    }

    // Находим отчёты
    io::DiscoveryOptions disc_opt;
    disc_opt.skip_errors = cmd.skip_errors;
    disc_opt.extensions = std::unordered_set<std::string>{"csv"};

    auto files = io::discover_files(cmd.paths, disc_opt);
    if (files.empty()) {
        writer.error("No report files were found in the provided paths");
        return 1;
    }
    writer.info("Loading " + std::to_string(files.size()) + " report files");

    std::vector<record::IndexRecord> records;
    for (const auto& file : files) {
        if (!load_report(file, cfg, cmd.skip_errors, records, writer)) {
            return 1;
        }
    }
    record::classify_records(records, cfg.parser, global.num_threads);

    // Вывод в файл, если указан
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("unable to create output file: " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    if (cmd.json || cmd.jsonl) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& allocator = doc.GetAllocator();
        for (const auto& rec : records) {
            rapidjson::Value object = record::record_to_json(rec, allocator);
            if (cmd.jsonl) {
                out->write_json_line(object);
            } else {
                doc.PushBack(object, allocator);
            }
        }
        if (cmd.json) {
            out->write_json_pretty(doc);
        }
    } else {
        // CSV с тем же разделителем, что и на входе
        out->write_line(output::Stream::Stdout,
                        output::format_csv_row(record::record_csv_header(), cfg.delimiter));
        for (const auto& rec : records) {
            out->write_line(output::Stream::Stdout,
                            output::format_csv_row(record::record_csv_cells(rec), cfg.delimiter));
        }
    }

    if (cmd.bulk.has_value()) {
        int rc = write_bulk(records, *cmd.bulk, *es_index, writer);
        if (rc != 0) {
            return rc;
        }
    }

    writer.info("Prepared " + std::to_string(records.size()) + " index records from " +
                std::to_string(files.size()) + " files");
    if (cmd.output.has_value()) {
        writer.info("Saved output to " + platform::path_to_utf8(*cmd.output));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace indexlens;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга печатаются как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ParseCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_parse(cmd, parse_result.global, writer);
            } else if constexpr (std::is_same_v<T, cli::PrepCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_prep(cmd, parse_result.global, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
