// ==============================================================================
// identifier.cpp - Разбор имён индексов
// ==============================================================================
//
// Три независимые стратегии разбора и цепочка выбора между ними.
// Шаблоны разбираются вручную (без std::regex): каждая проверка соответствует
// одному фрагменту исходной грамматики имени.
//
// ==============================================================================

#include "indexlens/identifier.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace indexlens {

namespace {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr std::string_view DS_MARKER = ".ds-";
constexpr std::string_view DS_STRIP_CHARS = ".ds-";
constexpr const char* DEFAULT_ENVIRONMENT = "default";
constexpr const char* DEFAULT_TYPE = "logs";

// ----------------------------------------------------------------------------
// Классы символов
// ----------------------------------------------------------------------------

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

/// \w в ASCII: [A-Za-z0-9_]
bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/// [\w.-]
bool is_namespace_char(char c) {
    return is_word_char(c) || c == '.' || c == '-';
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_digit);
}

// ----------------------------------------------------------------------------
// Разбиение и склейка
// ----------------------------------------------------------------------------

/// Разбить по разделителю. Всегда возвращает хотя бы один элемент.
std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

/// Склеить parts[first, last) через sep
std::string join(const std::vector<std::string_view>& parts, std::size_t first, std::size_t last,
                 char sep) {
    std::string result;
    for (std::size_t i = first; i < last && i < parts.size(); ++i) {
        if (i > first) {
            result += sep;
        }
        result.append(parts[i]);
    }
    return result;
}

std::size_t word_run_end(std::string_view s, std::size_t pos) {
    while (pos < s.size() && is_word_char(s[pos])) {
        ++pos;
    }
    return pos;
}

// ----------------------------------------------------------------------------
// Токены
// ----------------------------------------------------------------------------

/// \d{4}\.\d{2}\.\d{2} начиная с pos
bool date_at(std::string_view s, std::size_t pos) {
    if (pos + 10 > s.size()) {
        return false;
    }
    for (std::size_t i = 0; i < 10; ++i) {
        char c = s[pos + i];
        bool want_dot = (i == 4 || i == 7);
        if (want_dot ? c != '.' : !is_digit(c)) {
            return false;
        }
    }
    return true;
}

bool is_date_token(std::string_view token) {
    return token.size() == 10 && date_at(token, 0);
}

/// \d+\.\d+\.\d+ в начале токена
bool starts_with_version_triplet(std::string_view token) {
    std::size_t pos = 0;
    for (int group = 0; group < 3; ++group) {
        if (group > 0) {
            if (pos >= token.size() || token[pos] != '.') {
                return false;
            }
            ++pos;
        }
        std::size_t digits_start = pos;
        while (pos < token.size() && is_digit(token[pos])) {
            ++pos;
        }
        if (pos == digits_start) {
            return false;
        }
    }
    return true;
}

std::string normalize_date(std::string_view raw) {
    std::string date(raw);
    std::replace(date.begin(), date.end(), '.', '-');
    return date;
}

/// Хвост "-<YYYY.MM.DD>-<digits>" начиная с pos (без привязки к концу строки)
struct DateIteration {
    std::string_view date;
    std::string_view iteration;
};

std::optional<DateIteration> date_iteration_at(std::string_view s, std::size_t pos) {
    if (pos >= s.size() || s[pos] != '-' || !date_at(s, pos + 1)) {
        return std::nullopt;
    }
    std::size_t sep = pos + 11;
    if (sep >= s.size() || s[sep] != '-') {
        return std::nullopt;
    }
    std::size_t iter_start = sep + 1;
    std::size_t iter_end = iter_start;
    while (iter_end < s.size() && is_digit(s[iter_end])) {
        ++iter_end;
    }
    if (iter_end == iter_start) {
        return std::nullopt;
    }
    return DateIteration{s.substr(pos + 1, 10), s.substr(iter_start, iter_end - iter_start)};
}

// ----------------------------------------------------------------------------
// Общая нормализация
// ----------------------------------------------------------------------------

/// Пустой namespace считается отсутствующим
void drop_empty_namespace(ParsedIdentifier& out) {
    if (out.namespace_ && out.namespace_->empty()) {
        out.namespace_.reset();
    }
}

void set_application(ParsedIdentifier& out) {
    std::string application = out.dataset.value_or("");
    if (out.namespace_) {
        application += '.';
        application += *out.namespace_;
    }
    out.application = std::move(application);
}

/// Отделить окружение по последнему '-': "team-prod" -> ("team", "prod")
std::optional<std::string> split_environment(std::string& ns) {
    std::size_t pos = ns.rfind('-');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string environment = ns.substr(pos + 1);
    ns.erase(pos);
    return environment;
}

ParsedIdentifier unrecognized() {
    return ParsedIdentifier{};
}

}  // namespace

// ----------------------------------------------------------------------------
// Scheme
// ----------------------------------------------------------------------------

const char* scheme_to_string(Scheme scheme) {
    switch (scheme) {
    case Scheme::LegacyDotted:
        return "legacy-dotted";
    case Scheme::DatastreamTextualFallback:
        return "datastream-textual-fallback";
    case Scheme::DatastreamStructured:
        return "datastream-structured";
    case Scheme::Unrecognized:
    default:
        return "unrecognized";
    }
}

std::optional<Scheme> scheme_from_string(std::string_view name) {
    if (name == "legacy-dotted") {
        return Scheme::LegacyDotted;
    }
    if (name == "datastream-textual-fallback") {
        return Scheme::DatastreamTextualFallback;
    }
    if (name == "datastream-structured") {
        return Scheme::DatastreamStructured;
    }
    if (name == "unrecognized") {
        return Scheme::Unrecognized;
    }
    return std::nullopt;
}

bool ParsedIdentifier::operator==(const ParsedIdentifier& other) const {
    return scheme == other.scheme && type == other.type && dataset == other.dataset &&
           namespace_ == other.namespace_ && environment == other.environment &&
           application == other.application && date == other.date &&
           iteration == other.iteration && environment_token == other.environment_token;
}

// ----------------------------------------------------------------------------
// Guards
// ----------------------------------------------------------------------------

bool is_legacy_dotted(std::string_view identifier) {
    return identifier.find('.') != std::string_view::npos && !starts_with(identifier, DS_MARKER);
}

bool has_datastream_marker(std::string_view identifier) {
    // Проверка ".ds-[\w.-]" покрывается поиском подстроки
    return starts_with(identifier, DS_MARKER) ||
           identifier.find(DS_MARKER) != std::string_view::npos;
}

std::string_view strip_datastream_prefix(std::string_view identifier, StripMode mode) {
    if (mode == StripMode::LiteralPrefix) {
        if (starts_with(identifier, DS_MARKER)) {
            identifier.remove_prefix(DS_MARKER.size());
        }
        return identifier;
    }
    // Срезается вся ведущая серия символов из набора, а не префикс:
    // ".ds-data-..." превращается в "ata-..."
    std::size_t pos = identifier.find_first_not_of(DS_STRIP_CHARS);
    if (pos == std::string_view::npos) {
        return {};
    }
    return identifier.substr(pos);
}

// ----------------------------------------------------------------------------
// legacy-dotted
// ----------------------------------------------------------------------------

std::optional<ParsedIdentifier> parse_legacy_dotted(std::string_view identifier) {
    if (!is_legacy_dotted(identifier)) {
        return std::nullopt;
    }

    auto parts = split(identifier, '.');
    const std::size_t n = parts.size();

    ParsedIdentifier out;
    out.scheme = Scheme::LegacyDotted;
    out.type = DEFAULT_TYPE;
    out.dataset = std::string(parts[0]);
    if (n > 2) {
        out.namespace_ = join(parts, 1, n - 1, '.');
    }
    out.environment = DEFAULT_ENVIRONMENT;

    // Суффикс-версия: окружение стоит перед ней
    std::string_view suffix = parts[n - 1];
    if (!suffix.empty() && starts_with_version_triplet(suffix)) {
        out.namespace_.reset();
        if (n > 3) {
            out.namespace_ = join(parts, 1, n - 2, '.');
        }
        if (n > 2) {
            out.environment = std::string(parts[n - 2]);
        }
    }

    drop_empty_namespace(out);
    set_application(out);
    out.environment_token = out.environment;
    return out;
}

// ----------------------------------------------------------------------------
// datastream-textual-fallback
// ----------------------------------------------------------------------------

std::optional<ParsedIdentifier> parse_datastream_fallback(std::string_view identifier,
                                                          const ParseOptions& opts) {
    if (!has_datastream_marker(identifier)) {
        return std::nullopt;
    }
    if (opts.on_fallback) {
        opts.on_fallback(identifier);
    }

    auto parts = split(strip_datastream_prefix(identifier, opts.strip), '-');
    const std::size_t n = parts.size();

    ParsedIdentifier out;
    out.scheme = Scheme::DatastreamTextualFallback;
    out.type = DEFAULT_TYPE;
    out.dataset = std::string(parts[0]);

    // Узкий срез: между dataset и датой/итерацией (при трёх токенах пустой)
    std::optional<std::string> ns;
    if (n > 2) {
        ns = join(parts, 1, n - 2, '-');
    }
    if (n > 1 && is_date_token(parts[n - 2])) {
        out.date = normalize_date(parts[n - 2]);
    }
    if (n > 1 && all_digits(parts[n - 1])) {
        out.iteration = std::string(parts[n - 1]);
    }

    // Широкий срез только если узкий не вычислялся вовсе
    if (!ns && n > 1) {
        ns = join(parts, 1, n, '-');
    }

    std::optional<std::string> token;
    if (ns && !ns->empty()) {
        token = split_environment(*ns);
    }
    if (!ns || ns->empty()) {
        token = DEFAULT_ENVIRONMENT;
    }

    out.namespace_ = std::move(ns);
    drop_empty_namespace(out);
    set_application(out);

    out.environment_token = token;
    // Историческая несовместимость: environment содержит application
    out.environment =
        (opts.fallback_environment == FallbackEnvironment::Token) ? token : out.application;
    return out;
}

// ----------------------------------------------------------------------------
// datastream-structured
// ----------------------------------------------------------------------------

std::optional<ParsedIdentifier> parse_datastream_structured(std::string_view identifier,
                                                            const ParseOptions& opts) {
    if (!starts_with(identifier, DS_MARKER)) {
        return std::nullopt;
    }

    // <type>-
    std::size_t pos = DS_MARKER.size();
    std::size_t type_end = word_run_end(identifier, pos);
    if (type_end == pos || type_end >= identifier.size() || identifier[type_end] != '-') {
        return std::nullopt;
    }
    std::string_view type = identifier.substr(pos, type_end - pos);

    // <dataset>
    pos = type_end + 1;
    std::size_t dataset_end = word_run_end(identifier, pos);
    if (dataset_end == pos) {
        return std::nullopt;
    }
    std::string_view dataset = identifier.substr(pos, dataset_end - pos);
    pos = dataset_end;

    std::optional<std::string_view> ns;
    std::optional<DateIteration> tail;

    // Основной шаблон: (.<namespace>)? - namespace жадный по [\w.-]
    if (pos < identifier.size() && identifier[pos] == '.') {
        std::size_t ns_start = pos + 1;
        std::size_t run_end = ns_start;
        while (run_end < identifier.size() && is_namespace_char(identifier[run_end])) {
            ++run_end;
        }
        for (std::size_t p = run_end; p > ns_start + 1; --p) {
            if (auto found = date_iteration_at(identifier, p - 1)) {
                ns = identifier.substr(ns_start, p - 1 - ns_start);
                tail = found;
                break;
            }
        }
    }
    if (!tail) {
        tail = date_iteration_at(identifier, pos);
    }

    // Запасной шаблон: -<namespace> из одного \w+ токена
    if (!tail && pos < identifier.size() && identifier[pos] == '-') {
        std::size_t ns_start = pos + 1;
        std::size_t ns_end = word_run_end(identifier, ns_start);
        if (ns_end > ns_start) {
            if (auto found = date_iteration_at(identifier, ns_end)) {
                ns = identifier.substr(ns_start, ns_end - ns_start);
                tail = found;
            }
        }
    }

    if (!tail) {
        return std::nullopt;
    }

    ParsedIdentifier out;
    out.scheme = Scheme::DatastreamStructured;
    out.type = std::string(type);
    out.dataset = std::string(dataset);
    out.date = normalize_date(tail->date);
    out.iteration = std::string(tail->iteration);

    if (ns) {
        std::string ns_value(*ns);
        out.environment = split_environment(ns_value);
        if (!out.environment && opts.structured_environment == StructuredEnvironment::Default) {
            out.environment = DEFAULT_ENVIRONMENT;
        }
        out.namespace_ = std::move(ns_value);
    } else {
        out.environment = DEFAULT_ENVIRONMENT;
    }

    drop_empty_namespace(out);
    set_application(out);
    out.environment_token = out.environment;
    return out;
}

// ----------------------------------------------------------------------------
// parse_identifier - цепочка выбора схемы
// ----------------------------------------------------------------------------

ParsedIdentifier parse_identifier(std::string_view identifier, const ParseOptions& opts) {
    if (identifier.empty()) {
        return unrecognized();
    }

    if (auto legacy = parse_legacy_dotted(identifier)) {
        return std::move(*legacy);
    }

    if (opts.order == DecisionOrder::Source) {
        if (auto fallback = parse_datastream_fallback(identifier, opts)) {
            return std::move(*fallback);
        }
        if (auto structured = parse_datastream_structured(identifier, opts)) {
            return std::move(*structured);
        }
        return unrecognized();
    }

    if (auto structured = parse_datastream_structured(identifier, opts)) {
        return std::move(*structured);
    }
    if (auto fallback = parse_datastream_fallback(identifier, opts)) {
        return std::move(*fallback);
    }
    return unrecognized();
}

// ----------------------------------------------------------------------------
// classify_environment
// ----------------------------------------------------------------------------

std::string classify_environment(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Порядок важен: "nonprod" содержит "prod"
    for (const char* keyword : {"nonprod", "prod", "dev", "default", "operations"}) {
        if (lower.find(keyword) != std::string::npos) {
            return keyword;
        }
    }
    return "other";
}

}  // namespace indexlens
