// ==============================================================================
// evaluator.cpp - Вычисление политики (first-match)
// ==============================================================================
//
// Порядок: файлы в порядке вызывающей стороны, строки сверху вниз.
// Blank/Comment/Malformed пропускаются, !include и !include-dir
// разворачиваются на месте, !include-service - только для своего сервиса.
// Циклы включений обрываются (файл, уже находящийся в стеке, пропускается).
//
// ==============================================================================

#include "qrpolicy/evaluator.hpp"

#include "qrpolicy/lexer.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace qrpolicy {

namespace {

constexpr std::string_view ADMIN_ALIAS = "dom0";
constexpr std::string_view INCLUDE_DIR_PREFIX = "include/";

/// dom0 -> @adminvm, @default -> пусто
std::optional<std::string> normalize(const std::optional<std::string>& qube) {
    if (!qube || *qube == KW_DEFAULT) {
        return std::nullopt;
    }
    if (*qube == ADMIN_ALIAS) {
        return std::string(KW_ADMINVM);
    }
    return qube;
}

/// Конкретное имя qube, а не ключевое слово
bool is_concrete(std::string_view name) {
    return !name.empty() && name[0] != '@';
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

const NoQubeInfo& no_qube_info() {
    static const NoQubeInfo instance;
    return instance;
}

bool argument_matches(const ArgumentSpecifier& spec, std::string_view argument) {
    switch (spec.kind) {
    case ArgumentKind::Any:
        return true;
    case ArgumentKind::Empty:
        return argument.empty();
    case ArgumentKind::Specific:
        return spec.text == argument;
    }
    return false;
}

bool service_matches(const ServiceSpecifier& spec, std::string_view service) {
    return spec.wildcard || spec.name == service;
}

/// Запущен ли disposable qube из шаблона, удовлетворяющего предикату
template <typename Pred>
bool dispvm_from(std::string_view name, const QubeInfo& qubes, Pred pred) {
    const std::string dispvm_prefix = std::string(KW_DISPVM) + ":";
    if (starts_with(name, dispvm_prefix)) {
        std::string_view tmpl = name.substr(dispvm_prefix.size());
        return is_concrete(tmpl) && pred(tmpl);
    }
    if (is_concrete(name)) {
        auto tmpl = qubes.dispvm_template_of(name);
        return tmpl.has_value() && pred(*tmpl);
    }
    return false;
}

struct Scanner {
    const Request& request;
    const EvaluationContext& context;
    const QubeInfo& qubes;
    std::set<std::string, std::less<>> active;

    std::optional<Match> scan(const PolicyFile& file) {
        active.insert(file.name());
        std::optional<Match> found;
        for (const auto& line : file.lines()) {
            if (const auto* rule_line = std::get_if<RuleLine>(&line)) {
                const Rule& rule = rule_line->rule;
                if (rule_matches(rule, request, qubes)) {
                    found = Match{rule.action, file.name(), rule.line_number};
                    break;
                }
            } else if (const auto* include = std::get_if<IncludeLine>(&line)) {
                found = expand(*include);
                if (found) {
                    break;
                }
            }
        }
        active.erase(file.name());
        return found;
    }

    std::optional<Match> expand(const IncludeLine& include) {
        switch (include.kind) {
        case IncludeKind::File:
            return scan_included(resolve_include(context.includes, include.path));
        case IncludeKind::Dir:
            for (const PolicyFile* included : resolve_include_dir(context.includes, include.path)) {
                if (auto found = scan_included(included)) {
                    return found;
                }
            }
            return std::nullopt;
        case IncludeKind::Service: {
            if (!service_matches(*include.service, request.service) ||
                !argument_matches(*include.argument, request.argument)) {
                return std::nullopt;
            }
            const PolicyFile* included = resolve_include(context.includes, include.path);
            if (included == nullptr || active.count(included->name()) > 0) {
                return std::nullopt;
            }
            return scan_service_file(*included, include);
        }
        }
        return std::nullopt;
    }

    std::optional<Match> scan_included(const PolicyFile* included) {
        if (included == nullptr || active.count(included->name()) > 0) {
            return std::nullopt;
        }
        return scan(*included);
    }

    /// Файл старого формата "SOURCE DESTINATION ACTION [PARAMS]": сервис и
    /// аргумент берутся из директивы !include-service
    std::optional<Match> scan_service_file(const PolicyFile& file, const IncludeLine& include) {
        const std::string service = to_string(*include.service);
        const std::string argument = to_string(*include.argument);
        for (std::size_t i = 0; i < file.size(); ++i) {
            const std::string& text = line_text(file.line(i));
            if (classify(text) != LineClass::Rule) {
                continue;
            }
            std::vector<Token> tokens{Token{service, 0}, Token{argument, 0}};
            auto rest = tokenize(text);
            tokens.insert(tokens.end(), rest.begin(), rest.end());
            auto parsed = parse_rule(tokens, i + 1);
            if (parsed && rule_matches(*parsed.rule, request, qubes)) {
                return Match{parsed.rule->action, file.name(), i + 1};
            }
        }
        return std::nullopt;
    }
};

}  // namespace

// ============================================================================
// Includes
// ============================================================================

const PolicyFile* resolve_include(const IncludeTable& includes, std::string_view path) {
    auto it = includes.find(path);
    if (it != includes.end()) {
        return it->second;
    }

    // Абсолютный или относительный путь к каталогу include/
    const std::string filename = std::filesystem::path(std::string(path)).filename().string();
    if (filename.empty()) {
        return nullptr;
    }
    it = includes.find(std::string(INCLUDE_DIR_PREFIX) + filename);
    if (it != includes.end()) {
        return it->second;
    }
    it = includes.find(filename);
    return it != includes.end() ? it->second : nullptr;
}

std::vector<const PolicyFile*> resolve_include_dir(const IncludeTable& includes,
                                                   std::string_view path) {
    std::string dir(path);
    while (dir.size() > 1 && dir.back() == '/') {
        dir.pop_back();
    }
    const std::string name = std::filesystem::path(dir).filename().string();
    std::vector<const PolicyFile*> files;
    if (name.empty()) {
        return files;
    }

    // Таблица упорядочена по имени: файлы каталога идут подряд
    const std::string prefix = name + "/";
    for (auto it = includes.lower_bound(prefix); it != includes.end(); ++it) {
        if (!starts_with(it->first, prefix)) {
            break;
        }
        if (it->first.find('/', prefix.size()) == std::string::npos) {
            files.push_back(it->second);
        }
    }
    return files;
}

// ============================================================================
// Matching
// ============================================================================

bool qube_matches(const QubeSpecifier& spec, const std::optional<std::string>& qube,
                  Position position, const QubeInfo& qubes) {
    const auto name = normalize(qube);
    if (!name) {
        // Цель не указана: совпадает только @default
        return position == Position::Destination && spec.kind == QubeKind::Default;
    }

    switch (spec.kind) {
    case QubeKind::Literal: {
        auto literal = normalize(spec.value);
        return literal == name;
    }
    case QubeKind::AdminVM:
        return *name == KW_ADMINVM;
    case QubeKind::AnyVM:
        return is_concrete(*name);
    case QubeKind::Default:
        return false;
    case QubeKind::DispVM:
        return *name == KW_DISPVM;
    case QubeKind::DispVMNamed:
        return dispvm_from(*name, qubes,
                           [&](std::string_view tmpl) { return tmpl == spec.value; });
    case QubeKind::DispVMByTag:
        if (*name == to_string(spec)) {
            return true;
        }
        return dispvm_from(*name, qubes,
                           [&](std::string_view tmpl) { return qubes.has_tag(tmpl, spec.value); });
    case QubeKind::Tag:
        return is_concrete(*name) && qubes.has_tag(*name, spec.value);
    case QubeKind::Type: {
        if (!is_concrete(*name)) {
            return false;
        }
        auto type = qubes.type_of(*name);
        return type.has_value() && *type == spec.value;
    }
    }
    return false;
}

bool rule_matches(const Rule& rule, const Request& request, const QubeInfo& qubes) {
    return service_matches(rule.service, request.service) &&
           argument_matches(rule.argument, request.argument) &&
           qube_matches(rule.source, request.source, Position::Source, qubes) &&
           qube_matches(rule.destination, request.destination, Position::Destination, qubes);
}

// ============================================================================
// Evaluate
// ============================================================================

std::optional<Match> evaluate_match(const std::vector<PolicyFile>& files, const Request& request,
                                    const EvaluationContext& context) {
    const QubeInfo& qubes = context.qubes != nullptr ? *context.qubes : no_qube_info();
    Scanner scanner{request, context, qubes, {}};
    for (const auto& file : files) {
        if (auto found = scanner.scan(file)) {
            return found;
        }
    }
    return std::nullopt;
}

std::optional<Action> evaluate(const std::vector<PolicyFile>& files, const Request& request,
                               const EvaluationContext& context) {
    auto match = evaluate_match(files, request, context);
    if (!match) {
        return std::nullopt;
    }
    return std::move(match->action);
}

void sort_by_name(std::vector<PolicyFile>& files) {
    std::sort(files.begin(), files.end(), [](const PolicyFile& a, const PolicyFile& b) {
        return a.name() < b.name();
    });
}

}  // namespace qrpolicy
