// ==============================================================================
// session.cpp - Сессия редактирования политик
// ==============================================================================

#include "qrpolicy/session.hpp"

#include "qrpolicy/lexer.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace qrpolicy {

namespace {

constexpr std::size_t ACTION_INDEX = 4;

/// Поля правила в каноническом виде
std::vector<std::string> rule_fields(const Rule& rule) {
    return {to_string(rule.service), to_string(rule.argument), to_string(rule.source),
            to_string(rule.destination), to_string(rule.action)};
}

/// Текст строки из токенов: позиционные поля через табуляцию, параметры через пробел
std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            out += i <= ACTION_INDEX ? '\t' : ' ';
        }
        out += tokens[i];
    }
    return out;
}

std::size_t field_index(Field field) {
    switch (field) {
    case Field::Service:
        return 0;
    case Field::Argument:
        return 1;
    case Field::Source:
        return 2;
    case Field::Destination:
        return 3;
    case Field::Action:
        return 4;
    }
    throw std::invalid_argument("unknown rule field");
}

// ----------------------------------------------------------------------------
// Проверка токенов структурной правки
// ----------------------------------------------------------------------------

bool has_space_or_control(std::string_view token) {
    return std::any_of(token.begin(), token.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return is_token_space(c) || u < 0x20 || u == 0x7f;
    });
}

/// Имя позиции токена: поле правила или параметр действия
std::string token_role(std::size_t position) {
    return position <= ACTION_INDEX ? to_string(static_cast<Field>(position)) : "parameter";
}

Code invalid_token_code(std::size_t position) {
    if (position > ACTION_INDEX) {
        return Code::MalformedParameter;
    }
    switch (static_cast<Field>(position)) {
    case Field::Service:
        return Code::InvalidServiceName;
    case Field::Argument:
        return Code::InvalidArgumentSyntax;
    case Field::Source:
    case Field::Destination:
        return Code::InvalidQubeName;
    case Field::Action:
        return Code::UnknownAction;
    }
    return Code::MalformedParameter;
}

/// Токен, который нельзя записать одним полем строки
std::optional<Diagnostic> check_token(std::string_view token, std::size_t position,
                                      std::size_t line_number, std::size_t column) {
    Diagnostic d;
    d.line_number = line_number;
    d.column = column;
    d.length = token.size();
    if (token.empty()) {
        d.code = position <= ACTION_INDEX ? Code::MissingField : Code::MalformedParameter;
        d.message = "empty " + token_role(position);
        return d;
    }
    if (has_space_or_control(token)) {
        d.code = invalid_token_code(position);
        d.message = token_role(position) + " contains whitespace or a control character";
        return d;
    }
    return std::nullopt;
}

/// Диагностики для пустого списка токенов: все поля отсутствуют
std::vector<Diagnostic> missing_fields(std::size_t line_number) {
    std::vector<Diagnostic> diags;
    for (std::size_t i = 0; i <= ACTION_INDEX; ++i) {
        Diagnostic d;
        d.line_number = line_number;
        d.column = 1;
        d.code = Code::MissingField;
        d.message = "missing " + token_role(i);
        diags.push_back(std::move(d));
    }
    return diags;
}

void check_index(const PolicyFile& file, std::size_t index, std::size_t limit) {
    if (index >= limit) {
        throw std::out_of_range("line " + std::to_string(index) + " is out of range for " +
                                file.name() + " (" + std::to_string(file.size()) + " lines)");
    }
}

}  // namespace

EditorSession::EditorSession(PolicyStore& store) : store_(store) {}

// ============================================================================
// Файлы сессии
// ============================================================================

OpenResult EditorSession::open(std::string_view name) {
    OpenResult result;
    if (auto it = files_.find(name); it != files_.end()) {
        result.ok = true;
        result.diagnostics = it->second.model.validate();
        return result;
    }

    auto fetched = store_.get(name);
    if (!fetched) {
        result.error = fetched.error;
        return result;
    }

    OpenFile f{PolicyFile::from_text(std::string(name), fetched.content, !is_include_name(name)),
               std::move(fetched.token), false};
    result.diagnostics = f.model.validate();
    files_.emplace(std::string(name), std::move(f));
    result.ok = true;
    return result;
}

OpenResult EditorSession::create(std::string_view name) {
    OpenResult result;
    if (!is_valid_policy_name(name)) {
        result.error = StoreError{StoreErrorKind::InvalidName, std::string(name),
                                  "policy file names may only contain alphanumeric characters, "
                                  "underscore and hyphen"};
        return result;
    }
    if (is_open(name) || store_.exists(name)) {
        result.error =
            StoreError{StoreErrorKind::Exists, std::string(name), "policy file already exists"};
        return result;
    }

    OpenFile f{PolicyFile(std::string(name), !is_include_name(name)), NEW_TOKEN, true};
    files_.emplace(std::string(name), std::move(f));
    result.ok = true;
    return result;
}

OpenResult EditorSession::reset(std::string_view name) {
    OpenFile& f = entry(name);
    OpenResult result;

    if (f.token == NEW_TOKEN) {
        f.model.assign({}, true);
        f.modified = false;
        result.ok = true;
        return result;
    }

    auto fetched = store_.get(name);
    if (!fetched) {
        result.error = fetched.error;
        return result;
    }
    f.model = PolicyFile::from_text(std::string(name), fetched.content, f.model.includes_allowed());
    f.token = std::move(fetched.token);
    f.modified = false;
    result.diagnostics = f.model.validate();
    result.ok = true;
    return result;
}

void EditorSession::close(std::string_view name) {
    auto it = files_.find(name);
    if (it == files_.end()) {
        throw std::out_of_range("policy file is not open: " + std::string(name));
    }
    files_.erase(it);
}

bool EditorSession::is_open(std::string_view name) const {
    return files_.find(name) != files_.end();
}

std::vector<std::string> EditorSession::open_files() const {
    std::vector<std::string> names;
    names.reserve(files_.size());
    for (const auto& [name, f] : files_) {
        names.push_back(name);
    }
    return names;
}

const PolicyFile& EditorSession::file(std::string_view name) const {
    return entry(name).model;
}

bool EditorSession::modified(std::string_view name) const {
    return entry(name).modified;
}

// ============================================================================
// Правки
// ============================================================================

std::vector<Diagnostic> EditorSession::insert_rule(std::string_view name, std::size_t index,
                                                   const std::vector<std::string>& tokens) {
    OpenFile& f = entry(name);
    check_index(f.model, index, f.model.size() + 1);

    const std::size_t line_number = index + 1;
    if (tokens.empty()) {
        return missing_fields(line_number);
    }
    std::vector<Diagnostic> rejected;
    std::size_t column = 1;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (auto d = check_token(tokens[i], i, line_number, column)) {
            rejected.push_back(std::move(*d));
        }
        column += tokens[i].size() + 1;
    }
    if (!rejected.empty()) {
        return rejected;
    }

    auto texts = f.model.line_texts();
    texts.insert(texts.begin() + static_cast<std::ptrdiff_t>(index), join_tokens(tokens));
    return commit(f, std::move(texts));
}

std::vector<Diagnostic> EditorSession::move_rule(std::string_view name, std::size_t from,
                                                 std::size_t to) {
    OpenFile& f = entry(name);
    check_index(f.model, from, f.model.size());
    check_index(f.model, to, f.model.size());

    auto texts = f.model.line_texts();
    std::string moved = std::move(texts[from]);
    texts.erase(texts.begin() + static_cast<std::ptrdiff_t>(from));
    texts.insert(texts.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    return commit(f, std::move(texts));
}

std::vector<Diagnostic> EditorSession::delete_line(std::string_view name, std::size_t index) {
    OpenFile& f = entry(name);
    check_index(f.model, index, f.model.size());

    auto texts = f.model.line_texts();
    texts.erase(texts.begin() + static_cast<std::ptrdiff_t>(index));
    return commit(f, std::move(texts));
}

std::vector<Diagnostic> EditorSession::edit_field(std::string_view name, std::size_t index,
                                                  Field field, std::string_view value) {
    OpenFile& f = entry(name);
    check_index(f.model, index, f.model.size());

    const Rule* rule = line_rule(f.model.line(index));
    if (rule == nullptr) {
        throw std::invalid_argument("line " + std::to_string(index) + " of " + f.model.name() +
                                    " is not a rule");
    }

    auto fields = rule_fields(*rule);
    const std::size_t position = field_index(field);
    fields[position] = std::string(value);

    std::size_t column = 1;
    for (std::size_t i = 0; i < position; ++i) {
        column += fields[i].size() + 1;
    }
    const std::size_t line_number = index + 1;
    std::vector<Diagnostic> rejected;
    if (field == Field::Action) {
        // Действие с параметрами: ключевое слово и KEY=VALUE через пробелы
        auto parts = tokenize(value);
        if (parts.empty()) {
            return {missing_fields(line_number)[ACTION_INDEX]};
        }
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (auto d = check_token(parts[i].text, ACTION_INDEX + i, line_number,
                                     column + parts[i].column - 1)) {
                rejected.push_back(std::move(*d));
            }
        }
    } else if (auto d = check_token(value, position, line_number, column)) {
        rejected.push_back(std::move(*d));
    }
    if (!rejected.empty()) {
        return rejected;
    }

    std::string text;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            text += '\t';
        }
        text += fields[i];
    }

    auto texts = f.model.line_texts();
    texts[index] = std::move(text);
    return commit(f, std::move(texts));
}

std::vector<Diagnostic> EditorSession::set_text(std::string_view name, std::string_view text) {
    OpenFile& f = entry(name);
    auto split = split_lines(text);
    PolicyFile next(f.model.name(), f.model.includes_allowed());
    next.assign(std::move(split.lines), split.trailing_newline);
    f.model = std::move(next);
    f.modified = true;
    return f.model.validate();
}

std::vector<Diagnostic> EditorSession::diagnostics(std::string_view name) const {
    return entry(name).model.validate();
}

// ============================================================================
// Сохранение
// ============================================================================

SaveResult EditorSession::save(std::string_view name) {
    OpenFile& f = entry(name);
    SaveResult result;

    if (!f.model.can_save()) {
        result.kind = SaveErrorKind::Validation;
        result.diagnostics = f.model.validate();
        result.message = "policy file " + f.model.name() + " contains errors, not saved";
        return result;
    }

    const std::string content = f.model.serialize();
    auto stored = store_.replace(name, content, f.token);
    if (!stored) {
        result.kind = SaveErrorKind::Io;
        result.store_error = stored.error;
        result.message = stored.error.format();
        return result;
    }

    f.token = content_token(content);
    f.modified = false;
    result.ok = true;
    result.diagnostics = f.model.validate();
    return result;
}

// ============================================================================
// Внутреннее
// ============================================================================

EditorSession::OpenFile& EditorSession::entry(std::string_view name) {
    auto it = files_.find(name);
    if (it == files_.end()) {
        throw std::out_of_range("policy file is not open: " + std::string(name));
    }
    return it->second;
}

const EditorSession::OpenFile& EditorSession::entry(std::string_view name) const {
    auto it = files_.find(name);
    if (it == files_.end()) {
        throw std::out_of_range("policy file is not open: " + std::string(name));
    }
    return it->second;
}

std::vector<Diagnostic> EditorSession::commit(OpenFile& f, std::vector<std::string> texts) {
    f.model.assign(std::move(texts), f.model.trailing_newline());
    f.modified = true;
    return f.model.validate();
}

}  // namespace qrpolicy
