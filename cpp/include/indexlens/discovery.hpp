// ==============================================================================
// indexlens/discovery.hpp - Поиск входных файлов
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий для поиска файлов отчётов
// - Фильтрация по расширениям
// - Детерминированный порядок результатов (сортировка)
// - Режим skip_errors для обработки ошибок
//
// ==============================================================================

#ifndef INDEXLENS_DISCOVERY_HPP
#define INDEXLENS_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace indexlens::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Допустимые расширения БЕЗ точки ("csv", не ".csv"), case-sensitive.
    /// nullopt означает все файлы.
    /// Явно указанный файл принимается независимо от расширения.
    std::optional<std::unordered_set<std::string>> extensions;

    /// true = предупреждения в stderr вместо исключений
    bool skip_errors = false;
};

// ----------------------------------------------------------------------------
// discover_files - основная функция поиска
// ----------------------------------------------------------------------------

/// Найти файлы по путям
///
/// @param inputs Пути к файлам или директориям
/// @param opt Параметры поиска
/// @return Отсортированный список найденных файлов (пустой результат - не ошибка)
///
/// @throws std::runtime_error при ошибке (если skip_errors=false)
std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt);

}  // namespace indexlens::io

#endif  // INDEXLENS_DISCOVERY_HPP
