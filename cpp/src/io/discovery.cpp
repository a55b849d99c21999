// ==============================================================================
// discovery.cpp - Поиск входных файлов
// ==============================================================================

#include "indexlens/discovery.hpp"

#include "indexlens/platform.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace indexlens::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Расширения сравниваются без точки, case-sensitive
bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }

    if (!file_path.has_extension()) {
        return false;
    }

    // extension() возвращает расширение с точкой (".csv")
    std::string ext = platform::path_to_utf8(file_path.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }

    return extensions->count(ext) > 0;
}

/// Ошибка: предупреждение при skip_errors, иначе исключение
void report(bool skip_errors, const std::string& message) {
    if (skip_errors) {
        std::cerr << "[!] " << message << "\n";
        return;
    }
    throw std::runtime_error(message);
}

/// Рекурсивно обходит директорию и собирает файлы
void collect_files_recursive(const std::filesystem::path& path, bool top_level,
                             const DiscoveryOptions& opt,
                             std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);

    if (ec) {
        report(opt.skip_errors, "failed to check path existence - " + ec.message());
        return;
    }

    if (!exists) {
        report(opt.skip_errors, "Specified path does not exist - " + platform::path_to_utf8(path));
        return;
    }

    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        report(opt.skip_errors, "failed to get metadata for file - " + ec.message());
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator dir_iter(path, ec);
        if (ec) {
            report(opt.skip_errors, "failed to read directory - " + ec.message());
            return;
        }

        for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) {
                report(opt.skip_errors, "failed to enter directory - " + ec.message());
                return;
            }
            collect_files_recursive(it->path(), false, opt, result);
        }
        if (ec) {
            report(opt.skip_errors, "failed to enter directory - " + ec.message());
        }
    } else if (std::filesystem::is_regular_file(status)) {
        if (top_level || matches_extensions(path, opt.extensions)) {
            result.push_back(path);
        }
    }
    // Symlinks на не-файлы, special files и т.п. игнорируются
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> discover_files(const std::vector<std::filesystem::path>& inputs,
                                                  const DiscoveryOptions& opt) {
    std::vector<std::filesystem::path> result;

    for (const auto& input : inputs) {
        collect_files_recursive(input, true, opt, result);
    }

    // Сортировка для воспроизводимости между платформами
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());

    return result;
}

}  // namespace indexlens::io
