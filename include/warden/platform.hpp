// ==============================================================================
// warden/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Случайные идентификаторы (суффиксы id записей и журналов)
// - Временные файлы
//
// ==============================================================================

#ifndef WARDEN_PLATFORM_HPP
#define WARDEN_PLATFORM_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace warden::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Случайные строки
// ----------------------------------------------------------------------------

/// Алфавит идентификаторов: [a-z0-9]
constexpr const char* ID_ALPHABET = "abcdefghijklmnopqrstuvwxyz0123456789";

/// Случайная строка из символов алфавита (потокобезопасно)
std::string random_string(std::size_t length, std::string_view alphabet = ID_ALPHABET);

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл и вернуть его путь
/// @throw std::runtime_error при ошибке создания
std::filesystem::path make_temp_file(std::string_view prefix);

}  // namespace warden::platform

#endif  // WARDEN_PLATFORM_HPP
