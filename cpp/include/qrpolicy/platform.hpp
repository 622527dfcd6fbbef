// ==============================================================================
// qrpolicy/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Чтение файла целиком
// - Атомарная замена файла (temp + fsync + rename)
//
// Платформенная специфика изолирована в platform.cpp.
//
// ==============================================================================

#ifndef QRPOLICY_PLATFORM_HPP
#define QRPOLICY_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace qrpolicy::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);

std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();

bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Прочитать файл целиком (байты без преобразований)
/// @throws std::system_error если файл не открывается или не читается
std::string read_file(const std::filesystem::path& path);

/// Атомарно заменить содержимое файла
///
/// Данные пишутся во временный файл в том же каталоге, сбрасываются на диск
/// (fsync) и переименовываются поверх цели. При любой ошибке временный файл
/// удаляется, а исходный файл остаётся нетронутым. Права существующего
/// файла сохраняются.
///
/// @throws std::system_error при ошибке ввода-вывода
void write_file_atomic(const std::filesystem::path& path, std::string_view content);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace qrpolicy::platform

#endif  // QRPOLICY_PLATFORM_HPP
