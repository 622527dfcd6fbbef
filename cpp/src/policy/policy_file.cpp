// ==============================================================================
// policy_file.cpp - Модель файла политики
// ==============================================================================

#include "qrpolicy/policy_file.hpp"

#include "qrpolicy/lexer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace qrpolicy {

std::vector<Line> parse_lines(const std::vector<std::string>& texts, const ParseOptions& options) {
    std::vector<Line> lines;
    lines.reserve(texts.size());
    for (std::size_t i = 0; i < texts.size(); ++i) {
        lines.push_back(parse_line(texts[i], i + 1, options));
    }
    return lines;
}

std::vector<Diagnostic> find_redundant_rules(const std::vector<Line>& lines) {
    std::vector<Diagnostic> warnings;
    std::vector<const Rule*> seen;

    for (const auto& line : lines) {
        const Rule* rule = line_rule(line);
        if (rule == nullptr) {
            continue;
        }
        auto earlier = std::find_if(seen.begin(), seen.end(),
                                    [&](const Rule* r) { return equivalent(*r, *rule); });
        if (earlier != seen.end()) {
            Diagnostic d;
            d.line_number = rule->line_number;
            d.code = Code::RedundantRule;
            d.message = "rule duplicates line " + std::to_string((*earlier)->line_number) +
                        " and is never reached";
            warnings.push_back(std::move(d));
            continue;
        }
        seen.push_back(rule);
    }
    return warnings;
}

// ============================================================================
// PolicyFile
// ============================================================================

PolicyFile::PolicyFile(std::string name, bool includes_allowed)
    : name_(std::move(name)), includes_allowed_(includes_allowed) {}

PolicyFile PolicyFile::from_text(std::string name, std::string_view text, bool includes_allowed) {
    PolicyFile file(std::move(name), includes_allowed);
    auto split = split_lines(text);
    file.assign(std::move(split.lines), split.trailing_newline);
    return file;
}

std::vector<std::string> PolicyFile::line_texts() const {
    std::vector<std::string> texts;
    texts.reserve(lines_.size());
    for (const auto& line : lines_) {
        texts.push_back(line_text(line));
    }
    return texts;
}

std::vector<const Rule*> PolicyFile::rules() const {
    std::vector<const Rule*> out;
    for (const auto& line : lines_) {
        if (const Rule* r = line_rule(line)) {
            out.push_back(r);
        }
    }
    return out;
}

std::vector<Diagnostic> PolicyFile::validate() const {
    ParseOptions options;
    options.includes_allowed = includes_allowed_;

    // Пересчёт из текста, сохранённые Line не используются
    const auto lines = parse_lines(line_texts(), options);

    std::vector<Diagnostic> diagnostics;
    for (const auto& line : lines) {
        if (const auto* bad = std::get_if<MalformedLine>(&line)) {
            diagnostics.insert(diagnostics.end(), bad->diagnostics.begin(), bad->diagnostics.end());
        }
    }

    auto warnings = find_redundant_rules(lines);
    diagnostics.insert(diagnostics.end(), warnings.begin(), warnings.end());

    std::stable_sort(diagnostics.begin(), diagnostics.end(),
                     [](const Diagnostic& a, const Diagnostic& b) {
                         return a.line_number < b.line_number;
                     });
    return diagnostics;
}

bool PolicyFile::can_save() const {
    return std::none_of(lines_.begin(), lines_.end(), is_malformed);
}

std::string PolicyFile::serialize() const {
    return join_lines(line_texts(), trailing_newline_);
}

void PolicyFile::assign(std::vector<std::string> texts, bool trailing_newline) {
    for (std::size_t i = 0; i < texts.size(); ++i) {
        if (texts[i].find('\n') != std::string::npos) {
            throw std::invalid_argument("line " + std::to_string(i + 1) + " of " + name_ +
                                        " contains a line break");
        }
    }
    ParseOptions options;
    options.includes_allowed = includes_allowed_;
    auto lines = parse_lines(texts, options);
    lines_.swap(lines);
    trailing_newline_ = trailing_newline;
}

}  // namespace qrpolicy
