// ==============================================================================
// qrpolicy/rule.hpp - Правило политики и разбор строки
// ==============================================================================
//
// Назначение:
// - Rule: разобранное правило (неизменяемо после разбора)
// - Line: вариант строки файла (Blank/Comment/Include/Parsed/Malformed)
// - IncludeLine: !include, !include-dir или !include-service
// - parse_rule: токены -> Rule или набор диагностик
// - parse_line: текст строки -> Line
// - format_rule: каноническое представление правила
//
// Парсер не останавливается на первой ошибке: диагностики собираются по
// всем полям строки.
//
// ==============================================================================

#ifndef QRPOLICY_RULE_HPP
#define QRPOLICY_RULE_HPP

#include "qrpolicy/diagnostic.hpp"
#include "qrpolicy/lexer.hpp"
#include "qrpolicy/specifier.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qrpolicy {

// ============================================================================
// Rule
// ============================================================================

struct Rule {
    ServiceSpecifier service;
    ArgumentSpecifier argument;
    QubeSpecifier source;
    QubeSpecifier destination;
    Action action;
    std::size_t line_number = 0;
};

/// Совпадение всех полей правила, кроме номера строки
bool equivalent(const Rule& a, const Rule& b);

/// "SERVICE\tARGUMENT\tSOURCE\tDESTINATION\tACTION [params]"
std::string format_rule(const Rule& rule);

// ============================================================================
// Line
// ============================================================================

struct BlankLine {
    std::string text;
};

struct CommentLine {
    std::string text;
};

/// Вид директивы включения
enum class IncludeKind {
    File,    // !include PATH
    Dir,     // !include-dir DIR
    Service  // !include-service SERVICE ARGUMENT PATH
};

std::string to_string(IncludeKind kind);

struct IncludeLine {
    std::string text;
    IncludeKind kind = IncludeKind::File;
    std::string path;  // файл или каталог

    // Только для IncludeKind::Service
    std::optional<ServiceSpecifier> service;
    std::optional<ArgumentSpecifier> argument;
};

struct RuleLine {
    std::string text;
    Rule rule;
};

struct MalformedLine {
    std::string text;
    std::vector<Diagnostic> diagnostics;
};

using Line = std::variant<BlankLine, CommentLine, IncludeLine, RuleLine, MalformedLine>;

/// Исходный текст строки (для любого варианта)
const std::string& line_text(const Line& line);

/// Правило строки или nullptr
const Rule* line_rule(const Line& line);

bool is_malformed(const Line& line);

// ============================================================================
// Разбор
// ============================================================================

/// Поля правила в порядке следования
enum class Field { Service, Argument, Source, Destination, Action };

std::string to_string(Field field);

/// @throw std::invalid_argument если строка не распознана
Field parse_field(std::string_view s);

/// Опции разбора строки
struct ParseOptions {
    /// Разрешены ли директивы !include в этом файле
    bool includes_allowed = true;
};

struct RuleParseResult {
    std::optional<Rule> rule;
    std::vector<Diagnostic> diagnostics;

    explicit operator bool() const { return rule.has_value(); }
};

/// Разобрать токены строки-правила
RuleParseResult parse_rule(const std::vector<Token>& tokens, std::size_t line_number);

/// Разобрать строку файла
Line parse_line(std::string_view text, std::size_t line_number, const ParseOptions& options = {});

}  // namespace qrpolicy

#endif  // QRPOLICY_RULE_HPP
