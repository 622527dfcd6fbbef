// ==============================================================================
// parser.cpp - Разбор строки политики в Rule
// ==============================================================================
//
// Порядок полей фиксирован: service, argument, source, destination, action,
// [params...]. Содержимое полей проверяют валидаторы из specifier.cpp,
// здесь им проставляются колонки.
//
// ==============================================================================

#include "qrpolicy/rule.hpp"

#include <algorithm>
#include <stdexcept>

namespace qrpolicy {

namespace {

constexpr std::size_t POSITIONAL_FIELDS = 4;
constexpr std::size_t ACTION_INDEX = 4;

const char* const FIELD_NAMES[] = {"service", "argument", "source", "destination", "action"};

Diagnostic make_diagnostic(std::size_t line_number, const Token& token, SpecifierError error) {
    Diagnostic d;
    d.line_number = line_number;
    d.column = token.column;
    d.length = token.text.size();
    d.code = error.code;
    d.message = std::move(error.message);
    return d;
}

/// Колонка сразу за последним токеном
std::size_t end_column(const std::vector<Token>& tokens) {
    if (tokens.empty()) {
        return 1;
    }
    const auto& last = tokens.back();
    return last.column + last.text.size();
}

/// Индекс токена действия: 4, либо первый ключевой токен после лишних полей
std::optional<std::size_t> find_action(const std::vector<Token>& tokens) {
    if (tokens.size() <= ACTION_INDEX) {
        return std::nullopt;
    }
    if (parse_action_kind(tokens[ACTION_INDEX].text)) {
        return ACTION_INDEX;
    }
    for (std::size_t i = ACTION_INDEX + 1; i < tokens.size(); ++i) {
        if (parse_action_kind(tokens[i].text)) {
            return i;
        }
    }
    // Ключевого слова нет: пятый токен будет отвергнут как UnknownAction
    return ACTION_INDEX;
}

std::optional<IncludeKind> parse_include_kind(std::string_view directive) {
    if (directive == KW_INCLUDE)
        return IncludeKind::File;
    if (directive == KW_INCLUDE_DIR)
        return IncludeKind::Dir;
    if (directive == KW_INCLUDE_SERVICE)
        return IncludeKind::Service;
    return std::nullopt;
}

/// Число аргументов директивы
std::size_t include_arity(IncludeKind kind) {
    switch (kind) {
    case IncludeKind::File:
    case IncludeKind::Dir:
        return 1;
    case IncludeKind::Service:
        return 3;
    }
    return 1;
}

std::string include_usage(IncludeKind kind) {
    switch (kind) {
    case IncludeKind::File:
        return "!include takes exactly one path";
    case IncludeKind::Dir:
        return "!include-dir takes exactly one directory";
    case IncludeKind::Service:
        return "!include-service takes a service, an argument and a path";
    }
    return "malformed include directive";
}

Line malformed(std::string_view text, Diagnostic d) {
    MalformedLine line;
    line.text = std::string(text);
    line.diagnostics.push_back(std::move(d));
    return line;
}

}  // namespace

// ============================================================================
// Rule
// ============================================================================

bool equivalent(const Rule& a, const Rule& b) {
    return a.service == b.service && a.argument == b.argument && a.source == b.source &&
           a.destination == b.destination && a.action == b.action;
}

std::string format_rule(const Rule& rule) {
    return to_string(rule.service) + "\t" + to_string(rule.argument) + "\t" +
           to_string(rule.source) + "\t" + to_string(rule.destination) + "\t" +
           to_string(rule.action);
}

// ============================================================================
// Line accessors
// ============================================================================

const std::string& line_text(const Line& line) {
    return std::visit([](const auto& l) -> const std::string& { return l.text; }, line);
}

const Rule* line_rule(const Line& line) {
    if (const auto* r = std::get_if<RuleLine>(&line)) {
        return &r->rule;
    }
    return nullptr;
}

bool is_malformed(const Line& line) {
    return std::holds_alternative<MalformedLine>(line);
}

// ============================================================================
// IncludeKind
// ============================================================================

std::string to_string(IncludeKind kind) {
    switch (kind) {
    case IncludeKind::File:
        return KW_INCLUDE;
    case IncludeKind::Dir:
        return KW_INCLUDE_DIR;
    case IncludeKind::Service:
        return KW_INCLUDE_SERVICE;
    }
    return KW_INCLUDE;
}

// ============================================================================
// Field
// ============================================================================

std::string to_string(Field field) {
    return FIELD_NAMES[static_cast<std::size_t>(field)];
}

Field parse_field(std::string_view s) {
    if (s == "service")
        return Field::Service;
    if (s == "argument")
        return Field::Argument;
    if (s == "source")
        return Field::Source;
    if (s == "destination")
        return Field::Destination;
    if (s == "action")
        return Field::Action;
    throw std::invalid_argument(
        "unknown field, must be: service, argument, source, destination or action");
}

// ============================================================================
// parse_rule
// ============================================================================

RuleParseResult parse_rule(const std::vector<Token>& tokens, std::size_t line_number) {
    RuleParseResult result;
    auto& diags = result.diagnostics;

    std::optional<ServiceSpecifier> service;
    std::optional<ArgumentSpecifier> argument;
    std::optional<QubeSpecifier> source;
    std::optional<QubeSpecifier> destination;

    auto check = [&](const auto& parsed, std::size_t index, auto& out) {
        if (parsed) {
            out = *parsed.value;
        } else {
            diags.push_back(make_diagnostic(line_number, tokens[index], *parsed.error));
        }
    };

    const std::size_t positional = std::min(tokens.size(), POSITIONAL_FIELDS);
    for (std::size_t i = 0; i < positional; ++i) {
        const auto text = tokens[i].text;
        switch (static_cast<Field>(i)) {
        case Field::Service:
            check(parse_service(text), i, service);
            break;
        case Field::Argument:
            check(parse_argument(text), i, argument);
            break;
        case Field::Source:
            check(parse_qube(text, Position::Source), i, source);
            break;
        case Field::Destination:
            check(parse_qube(text, Position::Destination), i, destination);
            break;
        case Field::Action:
            break;
        }
    }

    std::optional<Action> action;
    if (auto action_index = find_action(tokens)) {
        // Лишние токены между destination и действием
        for (std::size_t i = ACTION_INDEX; i < *action_index; ++i) {
            diags.push_back(make_diagnostic(
                line_number, tokens[i],
                {Code::UnexpectedToken, "unexpected token '" + std::string(tokens[i].text) +
                                            "' before action"}));
        }

        std::vector<std::string_view> action_tokens;
        for (std::size_t i = *action_index; i < tokens.size(); ++i) {
            action_tokens.push_back(tokens[i].text);
        }
        auto parsed = parse_action(action_tokens);
        for (auto& err : parsed.errors) {
            diags.push_back(
                make_diagnostic(line_number, tokens[*action_index + err.index], err.error));
        }
        action = std::move(parsed.action);
    }

    // Недостающие поля
    if (tokens.size() <= ACTION_INDEX) {
        const std::size_t column = end_column(tokens);
        for (std::size_t i = tokens.size(); i <= ACTION_INDEX; ++i) {
            Diagnostic d;
            d.line_number = line_number;
            d.column = column;
            d.code = Code::MissingField;
            d.message = std::string("missing ") + FIELD_NAMES[i];
            diags.push_back(std::move(d));
        }
    }

    if (diags.empty() && service && argument && source && destination && action) {
        result.rule = Rule{std::move(*service), std::move(*argument), std::move(*source),
                           std::move(*destination), std::move(*action), line_number};
    }
    return result;
}

// ============================================================================
// parse_line
// ============================================================================

Line parse_line(std::string_view text, std::size_t line_number, const ParseOptions& options) {
    switch (classify(text)) {
    case LineClass::Blank:
        return BlankLine{std::string(text)};

    case LineClass::Comment:
        return CommentLine{std::string(text)};

    case LineClass::Directive: {
        auto tokens = tokenize(text);
        const Token& directive = tokens.front();
        const auto kind = parse_include_kind(directive.text);
        if (!kind) {
            return malformed(text, make_diagnostic(line_number, directive,
                                                   {Code::UnknownDirective,
                                                    "unknown directive '" +
                                                        std::string(directive.text) + "'"}));
        }
        if (tokens.size() != include_arity(*kind) + 1) {
            return malformed(text, make_diagnostic(line_number, directive,
                                                   {Code::MalformedInclude, include_usage(*kind)}));
        }
        if (!options.includes_allowed) {
            return malformed(text, make_diagnostic(line_number, directive,
                                                   {Code::IncludeNotAllowed,
                                                    to_string(*kind) +
                                                        " is not allowed in this file"}));
        }

        IncludeLine include;
        include.text = std::string(text);
        include.kind = *kind;
        include.path = std::string(tokens.back().text);
        if (*kind == IncludeKind::Service) {
            std::vector<Diagnostic> diags;
            auto service = parse_service(tokens[1].text);
            if (!service) {
                diags.push_back(make_diagnostic(line_number, tokens[1], *service.error));
            }
            auto argument = parse_argument(tokens[2].text);
            if (!argument) {
                diags.push_back(make_diagnostic(line_number, tokens[2], *argument.error));
            }
            if (!diags.empty()) {
                return MalformedLine{std::string(text), std::move(diags)};
            }
            include.service = std::move(*service.value);
            include.argument = std::move(*argument.value);
        }
        return include;
    }

    case LineClass::Rule: {
        auto parsed = parse_rule(tokenize(text), line_number);
        if (parsed) {
            return RuleLine{std::string(text), std::move(*parsed.rule)};
        }
        return MalformedLine{std::string(text), std::move(parsed.diagnostics)};
    }
    }
    return BlankLine{std::string(text)};
}

}  // namespace qrpolicy
