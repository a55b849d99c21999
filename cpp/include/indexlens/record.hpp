// ==============================================================================
// indexlens/record.hpp - Сводная запись отчёта
// ==============================================================================
//
// Назначение:
// - Объединение строки входного отчёта с результатом разбора имени индекса
// - Сериализация в CSV / JSON (RapidJSON)
// - Формирование пар bulk NDJSON для загрузки в хранилище документов
//
// ==============================================================================

#ifndef INDEXLENS_RECORD_HPP
#define INDEXLENS_RECORD_HPP

#include <indexlens/identifier.hpp>
#include <indexlens/table_reader.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace indexlens::record {

// ----------------------------------------------------------------------------
// Колонки входного отчёта
// ----------------------------------------------------------------------------

/// Имена колонок во входной таблице
struct ColumnMapping {
    std::string index = "index";
    std::string first_timestamp = "first_timestamp";
    std::string last_timestamp = "last_timestamp";
    std::string daily_ingest_mb = "daily_ingest_mb";
};

/// Позиции колонок, найденные в заголовке
struct ColumnIndices {
    std::size_t index = 0;
    std::size_t first_timestamp = 0;
    std::size_t last_timestamp = 0;
    std::size_t daily_ingest_mb = 0;
};

struct ColumnResult {
    bool ok = false;
    ColumnIndices columns;
    std::string error;
};

/// Найти все колонки в заголовке; отсутствие любой из них - ошибка
ColumnResult resolve_columns(const io::TableReader& reader, const ColumnMapping& mapping);

// ----------------------------------------------------------------------------
// IndexRecord
// ----------------------------------------------------------------------------

struct IndexRecord {
    std::string index_name;
    std::string cluster;
    std::string first_timestamp;
    std::string last_timestamp;
    std::int64_t daily_ingest_bytes = 0;

    ParsedIdentifier parsed;

    /// Классификация окружения по ключевым словам имени
    std::string environment_class;
};

struct RecordResult {
    bool ok = false;
    IndexRecord record;
    std::string error;
};

/// Прочитать поля строки отчёта; имя индекса не разбирается
RecordResult read_record(const io::Row& row, const ColumnIndices& columns,
                         const std::string& cluster);

/// Собрать запись из строки отчёта (read_record + разбор имени)
RecordResult build_record(const io::Row& row, const ColumnIndices& columns,
                          const std::string& cluster, const ParseOptions& opts = {});

/// Разобрать имена всех записей через parse_batch (threads == 0 - число ядер)
void classify_records(std::vector<IndexRecord>& records, const ParseOptions& opts = {},
                      unsigned threads = 0);

/// Имя кластера по имени файла: всё до первой точки ("prod-eu.csv" -> "prod-eu")
std::string cluster_name_from_path(const std::filesystem::path& path);

/// Разобрать объём в МБ; допускается десятичная запятая ("12,5")
std::optional<double> parse_ingest_mb(std::string_view text);

/// Байтовый объём помещается в int64
bool ingest_mb_fits(double mb);

/// МБ -> байты, с отбрасыванием дробной части; требует ingest_mb_fits(mb)
std::int64_t ingest_bytes_from_mb(double mb);

// ----------------------------------------------------------------------------
// CSV
// ----------------------------------------------------------------------------

/// Колонки результата разбора имени
std::vector<std::string> parsed_csv_header();

/// Значения результата разбора (null -> пустая строка)
std::vector<std::string> parsed_csv_cells(const ParsedIdentifier& parsed);

/// Полный заголовок сводной записи
std::vector<std::string> record_csv_header();

std::vector<std::string> record_csv_cells(const IndexRecord& record);

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

/// Добавить поля разбора в JSON объект (null -> JSON null)
void parsed_to_json(const ParsedIdentifier& parsed, rapidjson::Value& object,
                    rapidjson::Document::AllocatorType& allocator);

/// Сводная запись как JSON объект
rapidjson::Value record_to_json(const IndexRecord& record,
                                rapidjson::Document::AllocatorType& allocator);

// ----------------------------------------------------------------------------
// Bulk
// ----------------------------------------------------------------------------

/// Две строки NDJSON: action {"index":{"_index":..,"_id":..}} и документ.
/// _id - document_id(index_name), повторная загрузка перезаписывает документ.
std::string format_bulk_action(const IndexRecord& record, std::string_view target_index);

}  // namespace indexlens::record

#endif  // INDEXLENS_RECORD_HPP
