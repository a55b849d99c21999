// ==============================================================================
// indexlens/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Доступ к переменным окружения
//
// Вся платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef INDEXLENS_PLATFORM_HPP
#define INDEXLENS_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace indexlens::platform {

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// stdout подключён к терминалу
bool is_tty_stdout();

/// stderr подключён к терминалу
bool is_tty_stderr();

/// Значение переменной окружения; nullopt если не задана или пуста
std::optional<std::string> get_env(const char* name);

}  // namespace indexlens::platform

#endif  // INDEXLENS_PLATFORM_HPP
