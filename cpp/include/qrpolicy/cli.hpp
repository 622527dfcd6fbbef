// ==============================================================================
// qrpolicy/cli.hpp - Разбор командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv в GlobalOptions + вариант команды
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Номера строк в командной строке 1-based (как в диагностиках).
//
// ==============================================================================

#ifndef QRPOLICY_CLI_HPP
#define QRPOLICY_CLI_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qrpolicy::cli {

/// Каталог политик по умолчанию
constexpr const char* DEFAULT_POLICY_DIR = "/etc/qubes/policy.d";

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;        // -v (repeatable)
    bool quiet = false;     // -q
    bool no_color = false;  // --no-color
    std::filesystem::path policy_dir = DEFAULT_POLICY_DIR;  // --policy-dir
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// lint - проверить файлы политики
struct LintCommand {
    std::vector<std::string> names;               // пусто = все файлы каталога
    bool json = false;                            // --json
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// check - вычислить решение для запроса
struct CheckCommand {
    std::string service;                          // --service
    std::string argument;                         // --argument (без '+')
    std::string source;                           // --source
    std::optional<std::string> target;            // --target (нет = @default)
    std::optional<std::filesystem::path> qubes;   // --qubes (YAML)
    bool json = false;                            // --json
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// list - перечислить файлы политики
struct ListCommand {};

/// show - показать файл с номерами строк и диагностиками
struct ShowCommand {
    std::string name;
};

/// add - вставить правило
struct AddCommand {
    std::string name;
    std::vector<std::string> tokens;
    std::optional<std::size_t> at;  // --at N (1-based; нет = в конец)
};

/// remove - удалить строку
struct RemoveCommand {
    std::string name;
    std::size_t line = 0;
};

/// move - переместить строку
struct MoveCommand {
    std::string name;
    std::size_t from = 0;
    std::size_t to = 0;
};

/// set - заменить поле правила
struct SetCommand {
    std::string name;
    std::size_t line = 0;
    std::string field;
    std::string value;
};

/// new - создать пустой файл политики
struct NewCommand {
    std::string name;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<LintCommand, CheckCommand, ListCommand, ShowCommand, AddCommand,
                             RemoveCommand, MoveCommand, SetCommand, NewCommand, HelpCommand,
                             VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Номер строки: положительное десятичное число
std::optional<std::size_t> parse_line_number(std::string_view s);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Lint, edit and evaluate qrexec RPC policy files";

}  // namespace qrpolicy::cli

#endif  // QRPOLICY_CLI_HPP
