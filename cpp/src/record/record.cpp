// ==============================================================================
// record.cpp - Сводная запись отчёта
// ==============================================================================

#include "indexlens/record.hpp"

#include "indexlens/batch.hpp"
#include "indexlens/digest.hpp"
#include "indexlens/platform.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace indexlens::record {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

const std::string& value_or_empty(const std::optional<std::string>& value) {
    static const std::string empty;
    return value ? *value : empty;
}

rapidjson::Value string_value(const std::string& s, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

void add_optional(rapidjson::Value& object, const char* key, const std::optional<std::string>& value,
                  rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value v;
    if (value) {
        v = string_value(*value, allocator);
    }
    object.AddMember(rapidjson::StringRef(key), v, allocator);
}

void add_string(rapidjson::Value& object, const char* key, const std::string& value,
                rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value v = string_value(value, allocator);
    object.AddMember(rapidjson::StringRef(key), v, allocator);
}

std::string to_compact_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace

// ----------------------------------------------------------------------------
// Колонки
// ----------------------------------------------------------------------------

ColumnResult resolve_columns(const io::TableReader& reader, const ColumnMapping& mapping) {
    ColumnResult result;

    struct Lookup {
        const std::string& name;
        std::size_t& target;
    };
    const Lookup lookups[] = {
        {mapping.index, result.columns.index},
        {mapping.first_timestamp, result.columns.first_timestamp},
        {mapping.last_timestamp, result.columns.last_timestamp},
        {mapping.daily_ingest_mb, result.columns.daily_ingest_mb},
    };

    for (const auto& lookup : lookups) {
        auto column = reader.column(lookup.name);
        if (!column) {
            result.error = "missing column '" + lookup.name + "' in " + reader.source();
            return result;
        }
        lookup.target = *column;
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Сборка записи
// ----------------------------------------------------------------------------

std::string cluster_name_from_path(const std::filesystem::path& path) {
    std::string name = platform::path_to_utf8(path.filename());
    std::size_t dot = name.find('.');
    if (dot != std::string::npos) {
        name.erase(dot);
    }
    return name;
}

std::optional<double> parse_ingest_mb(std::string_view text) {
    std::string normalized(trim(text));
    if (normalized.empty()) {
        return std::nullopt;
    }
    for (char& c : normalized) {
        if (c == ',') {
            c = '.';
        }
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(normalized.c_str(), &end);
    if (end != normalized.c_str() + normalized.size() || errno == ERANGE ||
        !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool ingest_mb_fits(double mb) {
    // 2^63 точно представимо в double; всё от -2^63 до 2^63 (не включая) влезает в int64
    constexpr double limit = static_cast<double>(std::numeric_limits<std::int64_t>::max());
    const double bytes = mb * BYTES_PER_MB;
    return bytes >= -limit && bytes < limit;
}

std::int64_t ingest_bytes_from_mb(double mb) {
    return static_cast<std::int64_t>(mb * BYTES_PER_MB);
}

RecordResult read_record(const io::Row& row, const ColumnIndices& columns,
                         const std::string& cluster) {
    RecordResult result;
    const std::string line = std::to_string(row.line);

    auto index_name = row.get(columns.index);
    auto first_ts = row.get(columns.first_timestamp);
    auto last_ts = row.get(columns.last_timestamp);
    auto ingest = row.get(columns.daily_ingest_mb);
    if (!index_name || !first_ts || !last_ts || !ingest) {
        result.error = "row at line " + line + " has " + std::to_string(row.cells.size()) +
                       " fields, header requires more";
        return result;
    }

    auto mb = parse_ingest_mb(*ingest);
    if (!mb || !ingest_mb_fits(*mb)) {
        result.error = "invalid daily_ingest_mb value '" + std::string(*ingest) + "' at line " +
                       line;
        return result;
    }

    IndexRecord& record = result.record;
    record.index_name = std::string(*index_name);
    record.cluster = cluster;
    record.first_timestamp = std::string(*first_ts);
    record.last_timestamp = std::string(*last_ts);
    record.daily_ingest_bytes = ingest_bytes_from_mb(*mb);
    record.environment_class = classify_environment(record.index_name);

    result.ok = true;
    return result;
}

RecordResult build_record(const io::Row& row, const ColumnIndices& columns,
                          const std::string& cluster, const ParseOptions& opts) {
    RecordResult result = read_record(row, columns, cluster);
    if (result.ok) {
        result.record.parsed = parse_identifier(result.record.index_name, opts);
    }
    return result;
}

void classify_records(std::vector<IndexRecord>& records, const ParseOptions& opts,
                      unsigned threads) {
    std::vector<std::string> names;
    names.reserve(records.size());
    for (const auto& rec : records) {
        names.push_back(rec.index_name);
    }

    auto parsed = parse_batch(names, opts, threads);
    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].parsed = std::move(parsed[i]);
    }
}

// ----------------------------------------------------------------------------
// CSV
// ----------------------------------------------------------------------------

std::vector<std::string> parsed_csv_header() {
    return {"scheme",      "type", "dataset",   "namespace",         "environment",
            "application", "date", "iteration", "environment_token"};
}

std::vector<std::string> parsed_csv_cells(const ParsedIdentifier& parsed) {
    return {scheme_to_string(parsed.scheme),
            value_or_empty(parsed.type),
            value_or_empty(parsed.dataset),
            value_or_empty(parsed.namespace_),
            value_or_empty(parsed.environment),
            value_or_empty(parsed.application),
            value_or_empty(parsed.date),
            value_or_empty(parsed.iteration),
            value_or_empty(parsed.environment_token)};
}

std::vector<std::string> record_csv_header() {
    std::vector<std::string> header = {"index_name", "cluster", "first_timestamp",
                                       "last_timestamp", "daily_ingest_bytes"};
    auto parsed = parsed_csv_header();
    header.insert(header.end(), parsed.begin(), parsed.end());
    header.push_back("environment_class");
    return header;
}

std::vector<std::string> record_csv_cells(const IndexRecord& record) {
    std::vector<std::string> cells = {record.index_name, record.cluster, record.first_timestamp,
                                      record.last_timestamp,
                                      std::to_string(record.daily_ingest_bytes)};
    auto parsed = parsed_csv_cells(record.parsed);
    cells.insert(cells.end(), parsed.begin(), parsed.end());
    cells.push_back(record.environment_class);
    return cells;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

void parsed_to_json(const ParsedIdentifier& parsed, rapidjson::Value& object,
                    rapidjson::Document::AllocatorType& allocator) {
    object.AddMember("scheme", rapidjson::StringRef(scheme_to_string(parsed.scheme)), allocator);
    add_optional(object, "type", parsed.type, allocator);
    add_optional(object, "dataset", parsed.dataset, allocator);
    add_optional(object, "namespace", parsed.namespace_, allocator);
    add_optional(object, "environment", parsed.environment, allocator);
    add_optional(object, "application", parsed.application, allocator);
    add_optional(object, "date", parsed.date, allocator);
    add_optional(object, "iteration", parsed.iteration, allocator);
    add_optional(object, "environment_token", parsed.environment_token, allocator);
}

rapidjson::Value record_to_json(const IndexRecord& record,
                                rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value object(rapidjson::kObjectType);
    add_string(object, "index_name", record.index_name, allocator);
    add_string(object, "cluster", record.cluster, allocator);
    add_string(object, "first_timestamp", record.first_timestamp, allocator);
    add_string(object, "last_timestamp", record.last_timestamp, allocator);
    object.AddMember("daily_ingest_bytes", rapidjson::Value(record.daily_ingest_bytes), allocator);
    parsed_to_json(record.parsed, object, allocator);
    add_string(object, "environment_class", record.environment_class, allocator);
    return object;
}

// ----------------------------------------------------------------------------
// Bulk
// ----------------------------------------------------------------------------

std::string format_bulk_action(const IndexRecord& record, std::string_view target_index) {
    rapidjson::Document doc;
    auto& allocator = doc.GetAllocator();

    rapidjson::Value meta(rapidjson::kObjectType);
    add_string(meta, "_index", std::string(target_index), allocator);
    add_string(meta, "_id", document_id(record.index_name), allocator);

    rapidjson::Value action(rapidjson::kObjectType);
    action.AddMember("index", meta, allocator);

    rapidjson::Value source = record_to_json(record, allocator);

    std::string out = to_compact_json(action);
    out += '\n';
    out += to_compact_json(source);
    out += '\n';
    return out;
}

}  // namespace indexlens::record
