// ==============================================================================
// lexer.cpp - Разбиение текста политики на строки и токены
// ==============================================================================

#include "qrpolicy/lexer.hpp"

namespace qrpolicy {

SplitText split_lines(std::string_view text) {
    SplitText result;
    if (text.empty()) {
        return result;
    }

    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            result.lines.emplace_back(text.substr(start));
            return result;
        }
        result.lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }

    // Текст оканчивается на '\n'
    result.trailing_newline = true;
    return result;
}

std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    if (trailing_newline && !lines.empty()) {
        out += '\n';
    }
    return out;
}

bool is_token_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

std::vector<Token> tokenize(std::string_view line) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_token_space(line[i])) {
            ++i;
        }
        if (i >= line.size()) {
            break;
        }
        std::size_t start = i;
        while (i < line.size() && !is_token_space(line[i])) {
            ++i;
        }
        tokens.push_back(Token{line.substr(start, i - start), start + 1});
    }
    return tokens;
}

LineClass classify(std::string_view line) {
    std::size_t i = 0;
    while (i < line.size() && is_token_space(line[i])) {
        ++i;
    }
    if (i == line.size()) {
        return LineClass::Blank;
    }
    if (line[i] == '#') {
        return LineClass::Comment;
    }
    if (line[i] == '!') {
        return LineClass::Directive;
    }
    return LineClass::Rule;
}

}  // namespace qrpolicy
