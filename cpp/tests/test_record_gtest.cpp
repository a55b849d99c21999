// ==============================================================================
// test_record_gtest.cpp - Тесты сводных записей и bulk NDJSON (GoogleTest)
// ==============================================================================

#include "indexlens/digest.hpp"
#include "indexlens/record.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>
#include <vector>

namespace indexlens::record::test {

namespace {

constexpr const char* REPORT_HEADER = "index;first_timestamp;last_timestamp;daily_ingest_mb\n";

io::Row make_row(std::vector<std::string> cells, std::uint64_t line = 2) {
    io::Row row;
    row.cells = std::move(cells);
    row.line = line;
    return row;
}

}  // namespace

// ==============================================================================
// Колонки
// ==============================================================================

TEST(RecordTest, ResolveColumns_DefaultMapping_AnyOrder) {
    // Arrange
    auto table = io::TableReader::from_string(
        "daily_ingest_mb;extra;index;last_timestamp;first_timestamp\n");
    ASSERT_TRUE(table);

    // Act
    auto result = resolve_columns(*table.reader, ColumnMapping{});

    // Assert
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.columns.index, 2u);
    EXPECT_EQ(result.columns.first_timestamp, 4u);
    EXPECT_EQ(result.columns.last_timestamp, 3u);
    EXPECT_EQ(result.columns.daily_ingest_mb, 0u);
}

TEST(RecordTest, ResolveColumns_Missing_ErrorNamesColumn) {
    auto table = io::TableReader::from_string("index;first_timestamp\n", ';', "prod-eu.csv");
    ASSERT_TRUE(table);

    auto result = resolve_columns(*table.reader, ColumnMapping{});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "missing column 'last_timestamp' in prod-eu.csv");
}

TEST(RecordTest, ResolveColumns_CustomMapping) {
    auto table = io::TableReader::from_string("name;from;to;mb\n");
    ASSERT_TRUE(table);
    ColumnMapping mapping;
    mapping.index = "name";
    mapping.first_timestamp = "from";
    mapping.last_timestamp = "to";
    mapping.daily_ingest_mb = "mb";

    auto result = resolve_columns(*table.reader, mapping);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.columns.daily_ingest_mb, 3u);
}

// ==============================================================================
// Значения
// ==============================================================================

TEST(RecordTest, ClusterName_UpToFirstDot) {
    EXPECT_EQ(cluster_name_from_path("/data/prod-eu.report.csv"), "prod-eu");
    EXPECT_EQ(cluster_name_from_path("staging.csv"), "staging");
    EXPECT_EQ(cluster_name_from_path("noext"), "noext");
}

TEST(RecordTest, ParseIngestMb_DecimalCommaAndDot) {
    EXPECT_DOUBLE_EQ(*parse_ingest_mb("12,5"), 12.5);
    EXPECT_DOUBLE_EQ(*parse_ingest_mb(" 2.25 "), 2.25);
    EXPECT_DOUBLE_EQ(*parse_ingest_mb("0"), 0.0);
}

TEST(RecordTest, ParseIngestMb_Invalid_Nullopt) {
    EXPECT_FALSE(parse_ingest_mb("").has_value());
    EXPECT_FALSE(parse_ingest_mb("abc").has_value());
    EXPECT_FALSE(parse_ingest_mb("1.5x").has_value());
    EXPECT_FALSE(parse_ingest_mb("nan").has_value());
}

TEST(RecordTest, IngestBytes_TruncatesFraction) {
    EXPECT_EQ(ingest_bytes_from_mb(1.0), 1048576);
    EXPECT_EQ(ingest_bytes_from_mb(1.5), 1572864);
    EXPECT_EQ(ingest_bytes_from_mb(0.1), 104857);
}

// ==============================================================================
// build_record
// ==============================================================================

TEST(RecordTest, BuildRecord_FullRow) {
    // Arrange
    ColumnIndices cols{0, 1, 2, 3};
    auto row = make_row({"metrics.payments.prod", "2024-01-01", "2024-02-01", "1,5"});

    // Act
    auto result = build_record(row, cols, "prod-eu");

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    const auto& rec = result.record;
    EXPECT_EQ(rec.index_name, "metrics.payments.prod");
    EXPECT_EQ(rec.cluster, "prod-eu");
    EXPECT_EQ(rec.first_timestamp, "2024-01-01");
    EXPECT_EQ(rec.last_timestamp, "2024-02-01");
    EXPECT_EQ(rec.daily_ingest_bytes, 1572864);
    EXPECT_EQ(rec.parsed.scheme, Scheme::LegacyDotted);
    EXPECT_EQ(rec.parsed.application, "metrics.payments");
    EXPECT_EQ(rec.environment_class, "prod");
}

TEST(RecordTest, BuildRecord_OptionsPassedToParser) {
    ColumnIndices cols{0, 1, 2, 3};
    auto row = make_row({".ds-logs-nginx.access-2024.01.15-000003", "a", "b", "1"});
    ParseOptions opts;
    opts.order = DecisionOrder::Source;

    auto result = build_record(row, cols, "c", opts);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.record.parsed.scheme, Scheme::DatastreamTextualFallback);
}

TEST(RecordTest, BuildRecord_ShortRow_Error) {
    ColumnIndices cols{0, 1, 2, 3};
    auto row = make_row({"logs.web", "2024-01-01"}, 7);

    auto result = build_record(row, cols, "c");

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("line 7"), std::string::npos);
}

TEST(RecordTest, BuildRecord_InvalidMb_Error) {
    ColumnIndices cols{0, 1, 2, 3};
    auto row = make_row({"logs.web", "a", "b", "lots"}, 3);

    auto result = build_record(row, cols, "c");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "invalid daily_ingest_mb value 'lots' at line 3");
}

TEST(RecordTest, IngestMbFits_Bounds) {
    EXPECT_TRUE(ingest_mb_fits(0.0));
    EXPECT_TRUE(ingest_mb_fits(-1.5));
    EXPECT_TRUE(ingest_mb_fits(8796093022207.0));  // (2^63 - 2^20) / 2^20
    EXPECT_FALSE(ingest_mb_fits(8796093022208.0));  // ровно 2^63 байт
    EXPECT_FALSE(ingest_mb_fits(1e300));
    EXPECT_FALSE(ingest_mb_fits(-1e300));
}

TEST(RecordTest, BuildRecord_HugeMb_Error) {
    // Arrange
    ColumnIndices cols{0, 1, 2, 3};
    auto row = make_row({"logs.web", "a", "b", "1e300"}, 5);

    // Act
    auto result = build_record(row, cols, "c");

    // Assert
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "invalid daily_ingest_mb value '1e300' at line 5");
}

TEST(RecordTest, ReadRecord_FieldsOnly_NameNotParsed) {
    ColumnIndices cols{0, 1, 2, 3};
    auto row = make_row({"metrics.payments.prod", "t1", "t2", "2"});

    auto result = read_record(row, cols, "prod-eu");

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.record.daily_ingest_bytes, 2097152);
    EXPECT_EQ(result.record.environment_class, "prod");
    EXPECT_EQ(result.record.parsed.scheme, Scheme::Unrecognized);
    EXPECT_FALSE(result.record.parsed.application.has_value());
}

TEST(RecordTest, ClassifyRecords_MatchesBuildRecord) {
    // Arrange
    ColumnIndices cols{0, 1, 2, 3};
    const std::vector<std::string> names = {
        "metrics.payments.prod", ".ds-logs-nginx.access-2024.01.15-000003",
        ".ds-logs-app-2024.1.15-000001", "randomname123", "a..b"};
    ParseOptions opts;
    opts.fallback_environment = FallbackEnvironment::Token;

    std::vector<IndexRecord> records;
    std::vector<IndexRecord> expected;
    for (const auto& name : names) {
        auto row = make_row({name, "t1", "t2", "1"});
        auto fields = read_record(row, cols, "c");
        ASSERT_TRUE(fields.ok);
        records.push_back(fields.record);
        expected.push_back(build_record(row, cols, "c", opts).record);
    }

    // Act
    classify_records(records, opts, 3);

    // Assert
    ASSERT_EQ(records.size(), expected.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        SCOPED_TRACE(names[i]);
        EXPECT_EQ(records[i].parsed.scheme, expected[i].parsed.scheme);
        EXPECT_EQ(records[i].parsed.application, expected[i].parsed.application);
        EXPECT_EQ(records[i].parsed.environment, expected[i].parsed.environment);
        EXPECT_EQ(records[i].parsed.environment_token, expected[i].parsed.environment_token);
    }
}

TEST(RecordTest, BuildRecord_FromTable_EndToEnd) {
    auto table = io::TableReader::from_string(std::string(REPORT_HEADER) +
                                              "randomname123;t1;t2;0,5\n");
    ASSERT_TRUE(table);
    auto cols = resolve_columns(*table.reader, ColumnMapping{});
    ASSERT_TRUE(cols.ok);

    io::Row row;
    ASSERT_TRUE(table.reader->next(row));
    auto result = build_record(row, cols.columns, "dev-cluster");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.record.parsed.scheme, Scheme::Unrecognized);
    EXPECT_EQ(result.record.daily_ingest_bytes, 524288);
    EXPECT_EQ(result.record.environment_class, "other");
}

// ==============================================================================
// CSV / JSON
// ==============================================================================

TEST(RecordTest, CsvCells_MatchHeaderWidth) {
    ColumnIndices cols{0, 1, 2, 3};
    auto result = build_record(make_row({"randomname123", "a", "b", "1"}), cols, "c");
    ASSERT_TRUE(result.ok);

    auto header = record_csv_header();
    auto cells = record_csv_cells(result.record);

    ASSERT_EQ(header.size(), cells.size());
    EXPECT_EQ(header.front(), "index_name");
    EXPECT_EQ(header.back(), "environment_class");
    EXPECT_EQ(cells[5], "unrecognized");
    // null -> пустая ячейка
    EXPECT_EQ(cells[6], "");
}

TEST(RecordTest, ParsedToJson_NullsForMissing) {
    rapidjson::Document doc;
    doc.SetObject();

    parsed_to_json(parse_identifier("metrics.payments.prod"), doc, doc.GetAllocator());

    EXPECT_STREQ(doc["scheme"].GetString(), "legacy-dotted");
    EXPECT_STREQ(doc["namespace"].GetString(), "payments");
    EXPECT_TRUE(doc["date"].IsNull());
    EXPECT_TRUE(doc["iteration"].IsNull());
}

TEST(RecordTest, RecordToJson_Fields) {
    ColumnIndices cols{0, 1, 2, 3};
    auto result = build_record(
        make_row({".ds-logs-nginx.access-2024.01.15-000003", "t1", "t2", "2"}), cols, "eu");
    ASSERT_TRUE(result.ok);
    rapidjson::Document doc;

    rapidjson::Value json = record_to_json(result.record, doc.GetAllocator());

    ASSERT_TRUE(json.IsObject());
    EXPECT_STREQ(json["cluster"].GetString(), "eu");
    EXPECT_EQ(json["daily_ingest_bytes"].GetInt64(), 2097152);
    EXPECT_STREQ(json["scheme"].GetString(), "datastream-structured");
    EXPECT_STREQ(json["iteration"].GetString(), "000003");
    EXPECT_TRUE(json["environment"].IsNull());
}

// ==============================================================================
// Bulk
// ==============================================================================

TEST(RecordTest, Sha256Hex_KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(RecordTest, DocumentId_StableForSameName) {
    EXPECT_EQ(document_id("logs.web"), document_id("logs.web"));
    EXPECT_NE(document_id("logs.web"), document_id("logs.api"));
    EXPECT_EQ(document_id("abc").size(), 64u);
}

TEST(RecordTest, FormatBulkAction_TwoLines) {
    // Arrange
    ColumnIndices cols{0, 1, 2, 3};
    auto result = build_record(make_row({"metrics.payments.prod", "t1", "t2", "1"}), cols, "eu");
    ASSERT_TRUE(result.ok);

    // Act
    std::string bulk = format_bulk_action(result.record, "index-metadata");

    // Assert
    ASSERT_FALSE(bulk.empty());
    EXPECT_EQ(bulk.back(), '\n');

    std::istringstream in(bulk);
    std::string action_line;
    std::string source_line;
    ASSERT_TRUE(std::getline(in, action_line));
    ASSERT_TRUE(std::getline(in, source_line));

    rapidjson::Document action;
    action.Parse(action_line.c_str());
    ASSERT_FALSE(action.HasParseError());
    EXPECT_STREQ(action["index"]["_index"].GetString(), "index-metadata");
    EXPECT_EQ(std::string(action["index"]["_id"].GetString()),
              document_id("metrics.payments.prod"));

    rapidjson::Document source;
    source.Parse(source_line.c_str());
    ASSERT_FALSE(source.HasParseError());
    EXPECT_STREQ(source["index_name"].GetString(), "metrics.payments.prod");
    EXPECT_STREQ(source["environment_class"].GetString(), "prod");
}

}  // namespace indexlens::record::test
