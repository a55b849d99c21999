// ==============================================================================
// indexlens/table_reader.hpp - Чтение табличных отчётов (CSV)
// ==============================================================================
//
// Назначение:
// - Чтение текстовых таблиц с разделителем (по умолчанию ';') и строкой заголовка
// - Поиск колонок по имени
// - Поля в кавычках ("..." с экранированием ""), в том числе многострочные
//
// Использование:
// @code
//   auto result = TableReader::open(path, ';');
//   if (!result) {
//       writer.error(result.error.format());
//       return 1;
//   }
//   auto index_col = result.reader->column("index");
//   Row row;
//   while (result.reader->next(row)) {
//       // обработка строки
//   }
// @endcode
//
// ==============================================================================

#ifndef INDEXLENS_TABLE_READER_HPP
#define INDEXLENS_TABLE_READER_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace indexlens::io {

// ----------------------------------------------------------------------------
// TableError - ошибки чтения
// ----------------------------------------------------------------------------

enum class TableErrorKind {
    FileNotFound,   // Файл не найден
    IoError,        // Ошибка ввода-вывода
    EmptyInput,     // Нет строки заголовка
    ParseError,     // Незакрытая кавычка и т.п.
    MissingColumn,  // В заголовке нет нужной колонки
    ShortRow        // В строке меньше полей, чем требуется
};

struct TableError {
    TableErrorKind kind;
    std::string message;
    std::string path;

    /// "failed to load file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Row - строка данных
// ----------------------------------------------------------------------------

struct Row {
    std::vector<std::string> cells;

    /// Номер строки файла, с которой начинается запись (1 - заголовок)
    std::uint64_t line = 0;

    /// Значение поля; nullopt если строка короче
    std::optional<std::string_view> get(std::size_t column) const;
};

// ----------------------------------------------------------------------------
// TableReader
// ----------------------------------------------------------------------------

struct TableResult {
    bool ok = false;
    std::unique_ptr<class TableReader> reader;
    TableError error;

    explicit operator bool() const { return ok; }
};

class TableReader {
    // Создаётся только через open/from_string
    struct Token {
        explicit Token() = default;
    };

public:
    TableReader(Token, std::string content, char delimiter, std::string source);

    /// Открыть файл и прочитать заголовок
    static TableResult open(const std::filesystem::path& file, char delimiter = ';');

    /// Разобрать таблицу из памяти (source используется в сообщениях об ошибках)
    static TableResult from_string(std::string content, char delimiter = ';',
                                   std::string source = "<memory>");

    /// Колонки заголовка
    const std::vector<std::string>& header() const { return header_; }

    /// Индекс колонки по имени (точное совпадение)
    std::optional<std::size_t> column(std::string_view name) const;

    /// Получить следующую строку.
    /// false - строки закончились или ошибка разбора (см. last_error())
    bool next(Row& out);

    const std::optional<TableError>& last_error() const { return last_error_; }

    const std::string& source() const { return source_; }

    char delimiter() const { return delimiter_; }

private:
    /// Прочитать одну запись; false в конце данных
    bool read_record(std::vector<std::string>& cells);

    std::string content_;
    std::size_t pos_ = 0;
    std::uint64_t line_ = 1;
    std::uint64_t record_line_ = 0;
    char delimiter_;
    std::string source_;
    std::vector<std::string> header_;
    std::optional<TableError> last_error_;
};

}  // namespace indexlens::io

#endif  // INDEXLENS_TABLE_READER_HPP
