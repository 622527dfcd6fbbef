// ==============================================================================
// qrpolicy/specifier.hpp - Спецификаторы полей правила и их валидаторы
// ==============================================================================
//
// Назначение:
// - ServiceSpecifier / ArgumentSpecifier / QubeSpecifier / Action
// - Валидаторы отдельных токенов (сервис, аргумент, qube, действие)
// - Допустимость спецификатора в зависимости от позиции
// - Каноническое текстовое представление
//
// Грамматика строки правила:
//   SERVICE  ARGUMENT  SOURCE  DESTINATION  ACTION  [KEY=VALUE ...]
//
// ==============================================================================

#ifndef QRPOLICY_SPECIFIER_HPP
#define QRPOLICY_SPECIFIER_HPP

#include "qrpolicy/diagnostic.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qrpolicy {

// ============================================================================
// Ключевые слова грамматики
// ============================================================================

constexpr const char* WILDCARD = "*";
constexpr const char* KW_ADMINVM = "@adminvm";
constexpr const char* KW_ANYVM = "@anyvm";
constexpr const char* KW_DEFAULT = "@default";
constexpr const char* KW_DISPVM = "@dispvm";
constexpr const char* KW_TAG = "@tag:";
constexpr const char* KW_TYPE = "@type:";

constexpr const char* PARAM_TARGET = "target";
constexpr const char* PARAM_DEFAULT_TARGET = "default_target";
constexpr const char* PARAM_USER = "user";

// ============================================================================
// Ошибка валидатора
// ============================================================================

/// Ошибка одного токена; колонку проставляет парсер строки
struct SpecifierError {
    Code code = Code::UnexpectedToken;
    std::string message;
};

/// Результат валидатора (значение или ошибка)
template <typename T>
struct Parsed {
    std::optional<T> value;
    std::optional<SpecifierError> error;

    explicit operator bool() const { return value.has_value(); }
};

// ============================================================================
// ServiceSpecifier
// ============================================================================

struct ServiceSpecifier {
    bool wildcard = false;
    std::string name;  // пусто при wildcard
};

bool operator==(const ServiceSpecifier& a, const ServiceSpecifier& b);

/// "*" или "<component>.<Name>" из [A-Za-z0-9._-], сегменты непустые
Parsed<ServiceSpecifier> parse_service(std::string_view token);

std::string to_string(const ServiceSpecifier& s);

// ============================================================================
// ArgumentSpecifier
// ============================================================================

enum class ArgumentKind { Empty, Any, Specific };

/// Аргумент сервиса. text хранится без ведущего '+'
struct ArgumentSpecifier {
    ArgumentKind kind = ArgumentKind::Any;
    std::string text;
};

bool operator==(const ArgumentSpecifier& a, const ArgumentSpecifier& b);

/// "+" -> Empty, "*" -> Any, "+text" -> Specific(text)
Parsed<ArgumentSpecifier> parse_argument(std::string_view token);

std::string to_string(const ArgumentSpecifier& a);

// ============================================================================
// QubeSpecifier
// ============================================================================

enum class QubeKind {
    Literal,      // work
    AdminVM,      // @adminvm
    AnyVM,        // @anyvm
    Default,      // @default
    DispVM,       // @dispvm
    DispVMNamed,  // @dispvm:<name>
    DispVMByTag,  // @dispvm:@tag:<tag>
    Tag,          // @tag:<tag>
    Type          // @type:<type>
};

/// Позиция спецификатора в правиле
enum class Position { Source, Destination, Parameter };

struct QubeSpecifier {
    QubeKind kind = QubeKind::AnyVM;
    std::string value;  // имя / тег / тип; пусто для ключевых слов

    static QubeSpecifier literal(std::string name) { return {QubeKind::Literal, std::move(name)}; }
};

bool operator==(const QubeSpecifier& a, const QubeSpecifier& b);
bool operator!=(const QubeSpecifier& a, const QubeSpecifier& b);

/// Допустим ли вариант в данной позиции
bool is_legal(QubeKind kind, Position position);

/// Имя qube: [A-Za-z0-9_.-]+, начинается с буквы
bool is_valid_qube_name(std::string_view name);

/// Разобрать спецификатор и проверить допустимость для позиции
Parsed<QubeSpecifier> parse_qube(std::string_view token, Position position);

std::string to_string(const QubeSpecifier& q);

std::string to_string(QubeKind kind);

std::string to_string(Position position);

// ============================================================================
// Action
// ============================================================================

enum class ActionKind { Allow, Deny, Ask };

/// Непрозрачный параметр KEY=VALUE
struct Param {
    std::string key;
    std::string value;
};

bool operator==(const Param& a, const Param& b);

/// Действие правила
///
/// target: для allow - "target=", для ask - "default_target=", для deny
/// всегда пусто. params хранит прочие параметры в исходном порядке.
struct Action {
    ActionKind kind = ActionKind::Deny;
    std::optional<QubeSpecifier> target;
    std::vector<Param> params;

    /// Значение параметра по ключу (кроме target/default_target)
    std::optional<std::string> param(std::string_view key) const;
};

/// Сравнение с учётом множества параметров (порядок не важен)
bool operator==(const Action& a, const Action& b);
bool operator!=(const Action& a, const Action& b);

/// Имя параметра цели для действия: target / default_target / пусто
std::string_view target_key(ActionKind kind);

/// Разобрать ключевое слово действия (регистр важен)
std::optional<ActionKind> parse_action_kind(std::string_view token);

/// Ошибка в токене действия или параметра
struct TokenError {
    std::size_t index = 0;  // 0 = ключевое слово, 1.. = параметры
    SpecifierError error;
};

struct ActionParse {
    std::optional<Action> action;
    std::vector<TokenError> errors;

    explicit operator bool() const { return action.has_value() && errors.empty(); }
};

/// Разобрать действие и его параметры
/// tokens[0] - ключевое слово, tokens[1..] - KEY=VALUE
ActionParse parse_action(const std::vector<std::string_view>& tokens);

std::string to_string(ActionKind kind);

/// Каноническая форма: "allow target=vault user=root"
std::string to_string(const Action& action);

}  // namespace qrpolicy

#endif  // QRPOLICY_SPECIFIER_HPP
