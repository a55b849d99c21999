// ==============================================================================
// indexlens/identifier.hpp - Разбор имён индексов
// ==============================================================================
//
// Назначение:
// - Определение схемы именования индекса (legacy dotted / data stream)
// - Извлечение dataset, namespace, environment, application, date, iteration
// - Нормализация в единую запись ParsedIdentifier
//
// Движок чистый: без состояния, без I/O, без исключений.
// Безопасен для вызова из любого числа потоков.
//
// ==============================================================================

#ifndef INDEXLENS_IDENTIFIER_HPP
#define INDEXLENS_IDENTIFIER_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace indexlens {

// ----------------------------------------------------------------------------
// Scheme - распознанная схема именования
// ----------------------------------------------------------------------------

enum class Scheme {
    LegacyDotted,               // "legacy-dotted"
    DatastreamTextualFallback,  // "datastream-textual-fallback"
    DatastreamStructured,       // "datastream-structured"
    Unrecognized                // "unrecognized"
};

/// Преобразовать Scheme в строку
const char* scheme_to_string(Scheme scheme);

/// Разобрать строковое имя схемы
std::optional<Scheme> scheme_from_string(std::string_view name);

// ----------------------------------------------------------------------------
// Параметры совместимости
// ----------------------------------------------------------------------------

/// Порядок проверки схем для имён с маркером ".ds-"
enum class DecisionOrder {
    StructuredFirst,  // структурные шаблоны, затем текстовый разбор
    Source            // маркер сразу ведёт в текстовый разбор
};

/// Способ удаления префикса ".ds-" в текстовом разборе
enum class StripMode {
    CharacterClass,  // срезать ведущие символы из {'.', 'd', 's', '-'}
    LiteralPrefix    // срезать ровно один ".ds-"
};

/// Что попадает в environment в текстовом разборе
enum class FallbackEnvironment {
    Application,  // значение application (историческое поведение)
    Token         // извлечённый суффикс namespace
};

/// environment в структурном разборе, если namespace без '-'
enum class StructuredEnvironment {
    Unset,   // остаётся пустым (историческое поведение)
    Default  // "default"
};

struct ParseOptions {
    DecisionOrder order = DecisionOrder::StructuredFirst;
    StripMode strip = StripMode::CharacterClass;
    FallbackEnvironment fallback_environment = FallbackEnvironment::Application;
    StructuredEnvironment structured_environment = StructuredEnvironment::Unset;

    /// Вызывается при входе в текстовый разбор (диагностика, может быть пустым)
    std::function<void(std::string_view)> on_fallback;
};

// ----------------------------------------------------------------------------
// ParsedIdentifier - результат разбора
// ----------------------------------------------------------------------------
//
// Для всех схем кроме Unrecognized:
//   application == dataset,                 если namespace отсутствует
//   application == dataset + "." + namespace иначе
//

struct ParsedIdentifier {
    Scheme scheme = Scheme::Unrecognized;

    std::optional<std::string> type;
    std::optional<std::string> dataset;
    std::optional<std::string> namespace_;
    std::optional<std::string> environment;
    std::optional<std::string> application;

    /// Дата создания в форме YYYY-MM-DD
    std::optional<std::string> date;

    /// Счётчик rollover как в исходной строке (ведущие нули сохраняются)
    std::optional<std::string> iteration;

    /// Суффикс окружения, извлечённый из namespace.
    /// В текстовом разборе environment по умолчанию содержит application,
    /// здесь лежит реально вычисленное значение.
    std::optional<std::string> environment_token;

    bool recognized() const { return scheme != Scheme::Unrecognized; }

    bool operator==(const ParsedIdentifier& other) const;
    bool operator!=(const ParsedIdentifier& other) const { return !(*this == other); }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Разобрать имя индекса. Никогда не бросает исключений.
/// Пустая строка и любое нераспознанное имя дают Scheme::Unrecognized.
ParsedIdentifier parse_identifier(std::string_view identifier, const ParseOptions& opts = {});

/// Имя содержит '.' и не начинается с ".ds-"
bool is_legacy_dotted(std::string_view identifier);

/// Имя ссылается на маркер data stream ".ds-"
bool has_datastream_marker(std::string_view identifier);

/// Разбор "<dataset>[.<namespace>...].<suffix>"
std::optional<ParsedIdentifier> parse_legacy_dotted(std::string_view identifier);

/// Текстовый разбор backing-индекса по '-'
std::optional<ParsedIdentifier> parse_datastream_fallback(std::string_view identifier,
                                                          const ParseOptions& opts = {});

/// Разбор ".ds-<type>-<dataset>[.<namespace>]-<YYYY.MM.DD>-<iteration>"
std::optional<ParsedIdentifier> parse_datastream_structured(std::string_view identifier,
                                                            const ParseOptions& opts = {});

/// Удалить префикс data stream согласно режиму
std::string_view strip_datastream_prefix(std::string_view identifier, StripMode mode);

/// Классификация окружения по ключевым словам (без учёта регистра):
/// nonprod, prod, dev, default, operations, иначе other
std::string classify_environment(std::string_view name);

}  // namespace indexlens

#endif  // INDEXLENS_IDENTIFIER_HPP
