// ==============================================================================
// specifier.cpp - Валидаторы спецификаторов правила
// ==============================================================================
//
// Каждый валидатор работает с одним токеном и не знает о колонках:
// позицию ошибки проставляет парсер строки (parser.cpp).
//
// ==============================================================================

#include "qrpolicy/specifier.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace qrpolicy {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_service_char(char c) {
    return is_alnum(c) || c == '.' || c == '_' || c == '-';
}

bool is_argument_char(char c) {
    return is_alnum(c) || c == '.' || c == '_' || c == '-' || c == '+' || c == '@' || c == ':';
}

bool is_tag_char(char c) {
    return is_alnum(c) || c == '.' || c == '_' || c == '-' || c == ':';
}

bool is_valid_tag(std::string_view tag) {
    return !tag.empty() && std::all_of(tag.begin(), tag.end(), is_tag_char);
}

template <typename T>
Parsed<T> fail(Code code, std::string message) {
    Parsed<T> result;
    result.error = SpecifierError{code, std::move(message)};
    return result;
}

template <typename T>
Parsed<T> ok(T value) {
    Parsed<T> result;
    result.value = std::move(value);
    return result;
}

/// Код ошибки для недопустимой позиции
Code illegal_code(QubeKind kind, Position position) {
    if (position == Position::Source) {
        return kind == QubeKind::Default ? Code::DefaultIllegalAsSource
                                         : Code::DispVMIllegalAsSource;
    }
    switch (kind) {
    case QubeKind::Tag:
        return Code::TagIllegalAsParameter;
    case QubeKind::Type:
        return Code::TypeIllegalAsParameter;
    case QubeKind::DispVMByTag:
        return Code::DispVMByTagIllegalAsParameter;
    case QubeKind::AnyVM:
        return Code::AnyVMIllegalAsParameter;
    case QubeKind::Literal:
    case QubeKind::AdminVM:
    case QubeKind::Default:
    case QubeKind::DispVM:
    case QubeKind::DispVMNamed:
        break;
    }
    return Code::UnknownSpecifier;
}

/// Разбор без проверки позиции
Parsed<QubeSpecifier> parse_qube_token(std::string_view token) {
    if (token.empty()) {
        return fail<QubeSpecifier>(Code::InvalidQubeName, "empty qube name");
    }

    if (token[0] != '@') {
        if (!is_valid_qube_name(token)) {
            return fail<QubeSpecifier>(Code::InvalidQubeName,
                                       "invalid qube name '" + std::string(token) + "'");
        }
        return ok(QubeSpecifier::literal(std::string(token)));
    }

    if (token == KW_ADMINVM) {
        return ok(QubeSpecifier{QubeKind::AdminVM, {}});
    }
    if (token == KW_ANYVM) {
        return ok(QubeSpecifier{QubeKind::AnyVM, {}});
    }
    if (token == KW_DEFAULT) {
        return ok(QubeSpecifier{QubeKind::Default, {}});
    }
    if (token == KW_DISPVM) {
        return ok(QubeSpecifier{QubeKind::DispVM, {}});
    }

    const std::string dispvm_prefix = std::string(KW_DISPVM) + ":";
    if (starts_with(token, dispvm_prefix)) {
        std::string_view rest = token.substr(dispvm_prefix.size());
        if (starts_with(rest, KW_TAG)) {
            std::string_view tag = rest.substr(std::string_view(KW_TAG).size());
            if (!is_valid_tag(tag)) {
                return fail<QubeSpecifier>(Code::InvalidQubeName,
                                           "invalid tag in '" + std::string(token) + "'");
            }
            return ok(QubeSpecifier{QubeKind::DispVMByTag, std::string(tag)});
        }
        if (!is_valid_qube_name(rest)) {
            return fail<QubeSpecifier>(Code::InvalidQubeName,
                                       "invalid disposable template name in '" +
                                           std::string(token) + "'");
        }
        return ok(QubeSpecifier{QubeKind::DispVMNamed, std::string(rest)});
    }

    if (starts_with(token, KW_TAG)) {
        std::string_view tag = token.substr(std::string_view(KW_TAG).size());
        if (!is_valid_tag(tag)) {
            return fail<QubeSpecifier>(Code::InvalidQubeName,
                                       "invalid tag in '" + std::string(token) + "'");
        }
        return ok(QubeSpecifier{QubeKind::Tag, std::string(tag)});
    }

    if (starts_with(token, KW_TYPE)) {
        std::string_view type = token.substr(std::string_view(KW_TYPE).size());
        if (type.empty() || !std::all_of(type.begin(), type.end(), is_alnum)) {
            return fail<QubeSpecifier>(Code::InvalidQubeName,
                                       "invalid qube type in '" + std::string(token) + "'");
        }
        return ok(QubeSpecifier{QubeKind::Type, std::string(type)});
    }

    return fail<QubeSpecifier>(Code::UnknownSpecifier,
                               "unknown specifier '" + std::string(token) + "'");
}

bool is_yes_no(std::string_view value) {
    return value == "yes" || value == "no";
}

bool has_control_char(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u < 0x20 || u == 0x7f;
    });
}

}  // namespace

// ============================================================================
// ServiceSpecifier
// ============================================================================

bool operator==(const ServiceSpecifier& a, const ServiceSpecifier& b) {
    return a.wildcard == b.wildcard && a.name == b.name;
}

Parsed<ServiceSpecifier> parse_service(std::string_view token) {
    if (token == WILDCARD) {
        return ok(ServiceSpecifier{true, {}});
    }

    auto invalid = [&]() {
        return fail<ServiceSpecifier>(Code::InvalidServiceName,
                                      "invalid service name '" + std::string(token) +
                                          "', expected '*' or <component>.<Name>");
    };

    if (token.empty() || !std::all_of(token.begin(), token.end(), is_service_char)) {
        return invalid();
    }

    // Минимум два непустых сегмента через '.'
    std::size_t segments = 0;
    std::size_t start = 0;
    while (start <= token.size()) {
        std::size_t dot = token.find('.', start);
        std::size_t end = (dot == std::string_view::npos) ? token.size() : dot;
        if (end == start) {
            return invalid();
        }
        ++segments;
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    if (segments < 2) {
        return invalid();
    }

    return ok(ServiceSpecifier{false, std::string(token)});
}

std::string to_string(const ServiceSpecifier& s) {
    return s.wildcard ? std::string(WILDCARD) : s.name;
}

// ============================================================================
// ArgumentSpecifier
// ============================================================================

bool operator==(const ArgumentSpecifier& a, const ArgumentSpecifier& b) {
    return a.kind == b.kind && a.text == b.text;
}

Parsed<ArgumentSpecifier> parse_argument(std::string_view token) {
    if (token == "+") {
        return ok(ArgumentSpecifier{ArgumentKind::Empty, {}});
    }
    if (token == WILDCARD) {
        return ok(ArgumentSpecifier{ArgumentKind::Any, {}});
    }
    if (token.size() > 1 && token[0] == '+') {
        std::string_view text = token.substr(1);
        if (std::all_of(text.begin(), text.end(), is_argument_char)) {
            return ok(ArgumentSpecifier{ArgumentKind::Specific, std::string(text)});
        }
    }
    return fail<ArgumentSpecifier>(Code::InvalidArgumentSyntax,
                                   "invalid argument '" + std::string(token) +
                                       "', expected '+', '*' or '+<argument>'");
}

std::string to_string(const ArgumentSpecifier& a) {
    switch (a.kind) {
    case ArgumentKind::Empty:
        return "+";
    case ArgumentKind::Any:
        return WILDCARD;
    case ArgumentKind::Specific:
        return "+" + a.text;
    }
    return WILDCARD;
}

// ============================================================================
// QubeSpecifier
// ============================================================================

bool operator==(const QubeSpecifier& a, const QubeSpecifier& b) {
    return a.kind == b.kind && a.value == b.value;
}

bool operator!=(const QubeSpecifier& a, const QubeSpecifier& b) {
    return !(a == b);
}

bool is_legal(QubeKind kind, Position position) {
    switch (position) {
    case Position::Source:
        return kind != QubeKind::Default && kind != QubeKind::DispVM;
    case Position::Destination:
        return true;
    case Position::Parameter:
        return kind != QubeKind::Tag && kind != QubeKind::Type &&
               kind != QubeKind::DispVMByTag && kind != QubeKind::AnyVM;
    }
    return false;
}

bool is_valid_qube_name(std::string_view name) {
    if (name.empty() || std::isalpha(static_cast<unsigned char>(name[0])) == 0) {
        return false;
    }
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return is_alnum(c) || c == '_' || c == '.' || c == '-'; });
}

Parsed<QubeSpecifier> parse_qube(std::string_view token, Position position) {
    auto parsed = parse_qube_token(token);
    if (!parsed) {
        return parsed;
    }
    if (!is_legal(parsed.value->kind, position)) {
        return fail<QubeSpecifier>(illegal_code(parsed.value->kind, position),
                                   "'" + std::string(token) + "' is not allowed as " +
                                       to_string(position));
    }
    return parsed;
}

std::string to_string(const QubeSpecifier& q) {
    switch (q.kind) {
    case QubeKind::Literal:
        return q.value;
    case QubeKind::AdminVM:
        return KW_ADMINVM;
    case QubeKind::AnyVM:
        return KW_ANYVM;
    case QubeKind::Default:
        return KW_DEFAULT;
    case QubeKind::DispVM:
        return KW_DISPVM;
    case QubeKind::DispVMNamed:
        return std::string(KW_DISPVM) + ":" + q.value;
    case QubeKind::DispVMByTag:
        return std::string(KW_DISPVM) + ":" + KW_TAG + q.value;
    case QubeKind::Tag:
        return KW_TAG + q.value;
    case QubeKind::Type:
        return KW_TYPE + q.value;
    }
    return q.value;
}

std::string to_string(QubeKind kind) {
    switch (kind) {
    case QubeKind::Literal:
        return "literal";
    case QubeKind::AdminVM:
        return "adminvm";
    case QubeKind::AnyVM:
        return "anyvm";
    case QubeKind::Default:
        return "default";
    case QubeKind::DispVM:
        return "dispvm";
    case QubeKind::DispVMNamed:
        return "dispvm-named";
    case QubeKind::DispVMByTag:
        return "dispvm-by-tag";
    case QubeKind::Tag:
        return "tag";
    case QubeKind::Type:
        return "type";
    }
    return "unknown";
}

std::string to_string(Position position) {
    switch (position) {
    case Position::Source:
        return "source";
    case Position::Destination:
        return "destination";
    case Position::Parameter:
        return "parameter value";
    }
    return "unknown";
}

// ============================================================================
// Action
// ============================================================================

bool operator==(const Param& a, const Param& b) {
    return a.key == b.key && a.value == b.value;
}

std::optional<std::string> Action::param(std::string_view key) const {
    for (const auto& p : params) {
        if (p.key == key) {
            return p.value;
        }
    }
    return std::nullopt;
}

bool operator==(const Action& a, const Action& b) {
    if (a.kind != b.kind || a.target != b.target || a.params.size() != b.params.size()) {
        return false;
    }
    // Ключи уникальны в пределах правила, поэтому сравниваем отсортированные копии
    auto by_key = [](const Param& x, const Param& y) { return x.key < y.key; };
    auto pa = a.params;
    auto pb = b.params;
    std::sort(pa.begin(), pa.end(), by_key);
    std::sort(pb.begin(), pb.end(), by_key);
    return pa == pb;
}

bool operator!=(const Action& a, const Action& b) {
    return !(a == b);
}

std::string_view target_key(ActionKind kind) {
    switch (kind) {
    case ActionKind::Allow:
        return PARAM_TARGET;
    case ActionKind::Ask:
        return PARAM_DEFAULT_TARGET;
    case ActionKind::Deny:
        return {};
    }
    return {};
}

std::optional<ActionKind> parse_action_kind(std::string_view token) {
    if (token == "allow")
        return ActionKind::Allow;
    if (token == "deny")
        return ActionKind::Deny;
    if (token == "ask")
        return ActionKind::Ask;
    return std::nullopt;
}

ActionParse parse_action(const std::vector<std::string_view>& tokens) {
    ActionParse result;
    if (tokens.empty()) {
        result.errors.push_back({0, {Code::MissingField, "missing action"}});
        return result;
    }

    auto kind = parse_action_kind(tokens[0]);
    if (!kind) {
        result.errors.push_back({0,
                                 {Code::UnknownAction, "unknown action '" + std::string(tokens[0]) +
                                                           "', expected allow, deny or ask"}});
        return result;
    }

    Action action;
    action.kind = *kind;

    if (*kind == ActionKind::Deny) {
        if (tokens.size() > 1) {
            result.errors.push_back(
                {1, {Code::UnexpectedParametersForDeny, "deny does not take any parameters"}});
        }
        result.action = std::move(action);
        return result;
    }

    std::set<std::string, std::less<>> seen;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        std::string_view token = tokens[i];
        std::size_t eq = token.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            result.errors.push_back(
                {i, {Code::MalformedParameter,
                     "invalid parameter '" + std::string(token) + "', expected KEY=VALUE"}});
            continue;
        }

        std::string key(token.substr(0, eq));
        std::string_view value = token.substr(eq + 1);

        // Управляющие символы, включая '\n', недопустимы
        if (has_control_char(token)) {
            result.errors.push_back(
                {i, {Code::MalformedParameter, "parameter contains a control character"}});
            continue;
        }

        if (!seen.insert(key).second) {
            result.errors.push_back(
                {i, {Code::DuplicateParameter, "duplicate parameter '" + key + "'"}});
            continue;
        }

        if (key == PARAM_TARGET || key == PARAM_DEFAULT_TARGET) {
            if (key != target_key(*kind)) {
                result.errors.push_back({i,
                                         {Code::ParameterNotApplicable,
                                          "parameter '" + key + "' is not applicable to " +
                                              to_string(*kind)}});
                continue;
            }
            auto target = parse_qube(value, Position::Parameter);
            if (!target) {
                result.errors.push_back({i, *target.error});
                continue;
            }
            action.target = std::move(*target.value);
            continue;
        }

        if (value.empty()) {
            result.errors.push_back(
                {i, {Code::MalformedParameter, "parameter '" + key + "' has an empty value"}});
            continue;
        }
        if ((key == "notify" || key == "autostart") && !is_yes_no(value)) {
            result.errors.push_back({i,
                                     {Code::InvalidParameterValue,
                                      "parameter '" + key + "' must be 'yes' or 'no'"}});
            continue;
        }

        action.params.push_back(Param{key, std::string(value)});
    }

    result.action = std::move(action);
    return result;
}

std::string to_string(ActionKind kind) {
    switch (kind) {
    case ActionKind::Allow:
        return "allow";
    case ActionKind::Deny:
        return "deny";
    case ActionKind::Ask:
        return "ask";
    }
    return "unknown";
}

std::string to_string(const Action& action) {
    std::string out = to_string(action.kind);
    if (action.target) {
        out += " ";
        out += target_key(action.kind);
        out += "=";
        out += to_string(*action.target);
    }
    for (const auto& p : action.params) {
        out += " " + p.key + "=" + p.value;
    }
    return out;
}

}  // namespace qrpolicy
