// ==============================================================================
// indexlens/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами ([+] [!] [x] [*] [~])
// - Форматирование результатов (таблицы/CSV/JSON/JSONL)
// - Цветной вывод (ANSI escape codes)
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef INDEXLENS_OUTPUT_HPP
#define INDEXLENS_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace indexlens::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение (компактно)
    void write_json(const rapidjson::Value& value);

    /// Записать JSON значение + newline (JSONL)
    void write_json_line(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);

    /// Префикс сообщения, окрашенный на TTY
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer
    void print(Writer& w);

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char left, char middle, char right) const;

    std::string format_row(const std::vector<std::string>& cells) const;

    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    mutable std::vector<size_t> col_widths_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Экранировать поле CSV: кавычки, если есть разделитель, '"' или перевод строки
std::string csv_escape(std::string_view field, char delimiter = ',');

/// Собрать строку CSV (без перевода строки)
std::string format_csv_row(const std::vector<std::string>& cells, char delimiter = ',');

/// ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace indexlens::output

#endif  // INDEXLENS_OUTPUT_HPP
