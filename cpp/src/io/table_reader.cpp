// ==============================================================================
// table_reader.cpp - Чтение табличных отчётов (CSV)
// ==============================================================================

#include "indexlens/table_reader.hpp"

#include "indexlens/platform.hpp"

#include <fstream>
#include <sstream>

namespace indexlens::io {

namespace {

constexpr std::string_view UTF8_BOM = "\xef\xbb\xbf";

TableResult make_error(TableErrorKind kind, std::string message, std::string path) {
    TableResult result;
    result.ok = false;
    result.error = TableError{kind, std::move(message), std::move(path)};
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// TableError / Row
// ----------------------------------------------------------------------------

std::string TableError::format() const {
    return "failed to load file '" + path + "' - " + message;
}

std::optional<std::string_view> Row::get(std::size_t column) const {
    if (column >= cells.size()) {
        return std::nullopt;
    }
    return std::string_view(cells[column]);
}

// ----------------------------------------------------------------------------
// TableReader
// ----------------------------------------------------------------------------

TableReader::TableReader(Token, std::string content, char delimiter, std::string source)
    : content_(std::move(content)), delimiter_(delimiter), source_(std::move(source)) {
    if (content_.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
        pos_ = UTF8_BOM.size();
    }
}

TableResult TableReader::open(const std::filesystem::path& file, char delimiter) {
    std::string path_str = platform::path_to_utf8(file);

    std::error_code ec;
    if (!std::filesystem::exists(file, ec) || ec) {
        return make_error(TableErrorKind::FileNotFound, "file not found", path_str);
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return make_error(TableErrorKind::IoError, "cannot open file", path_str);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return make_error(TableErrorKind::IoError, "read error", path_str);
    }

    return from_string(buffer.str(), delimiter, path_str);
}

TableResult TableReader::from_string(std::string content, char delimiter, std::string source) {
    TableResult result;
    result.reader =
        std::make_unique<TableReader>(Token{}, std::move(content), delimiter, std::move(source));

    auto& reader = *result.reader;
    if (!reader.read_record(reader.header_)) {
        if (reader.last_error_) {
            result.error = *reader.last_error_;
        } else {
            result.error =
                TableError{TableErrorKind::EmptyInput, "missing header row", reader.source_};
        }
        result.reader.reset();
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<std::size_t> TableReader::column(std::string_view name) const {
    for (std::size_t i = 0; i < header_.size(); ++i) {
        if (header_[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool TableReader::next(Row& out) {
    if (last_error_) {
        return false;
    }
    if (!read_record(out.cells)) {
        return false;
    }
    out.line = record_line_;
    return true;
}

bool TableReader::read_record(std::vector<std::string>& cells) {
    cells.clear();

    // Пустые строки пропускаются
    while (pos_ < content_.size()) {
        if (content_[pos_] == '\n') {
            ++pos_;
            ++line_;
        } else if (content_[pos_] == '\r' && pos_ + 1 < content_.size() &&
                   content_[pos_ + 1] == '\n') {
            pos_ += 2;
            ++line_;
        } else {
            break;
        }
    }
    if (pos_ >= content_.size()) {
        return false;
    }

    const std::uint64_t start_line = line_;
    record_line_ = start_line;
    std::string field;

    while (true) {
        field.clear();

        if (pos_ < content_.size() && content_[pos_] == '"') {
            // Поле в кавычках
            ++pos_;
            bool closed = false;
            while (pos_ < content_.size()) {
                char c = content_[pos_];
                if (c == '"') {
                    if (pos_ + 1 < content_.size() && content_[pos_ + 1] == '"') {
                        field += '"';
                        pos_ += 2;
                        continue;
                    }
                    ++pos_;
                    closed = true;
                    break;
                }
                if (c == '\n') {
                    ++line_;
                }
                field += c;
                ++pos_;
            }
            if (!closed) {
                last_error_ = TableError{TableErrorKind::ParseError,
                                         "unterminated quoted field starting at line " +
                                             std::to_string(start_line),
                                         source_};
                return false;
            }
        }

        // Остаток поля до разделителя или конца строки
        while (pos_ < content_.size() && content_[pos_] != delimiter_ && content_[pos_] != '\n') {
            field += content_[pos_];
            ++pos_;
        }

        if (pos_ < content_.size() && content_[pos_] == delimiter_) {
            cells.push_back(field);
            ++pos_;
            continue;
        }

        // Конец записи: '\n' или конец данных
        if (!field.empty() && field.back() == '\r') {
            field.pop_back();
        }
        cells.push_back(field);
        if (pos_ < content_.size()) {
            ++pos_;
            ++line_;
        }
        return true;
    }
}

}  // namespace indexlens::io
