// ==============================================================================
// qrpolicy/lexer.hpp - Разбиение текста политики на строки и токены
// ==============================================================================
//
// Назначение:
// - Разбиение текста на логические строки ('\n') с сохранением
//   признака завершающего перевода строки (byte-stable round-trip)
// - Классификация строки: пустая / комментарий / директива / правило
// - Токенизация по пробельным символам с колонками (1-based)
//
// Токенизация никогда не завершается ошибкой.
//
// ==============================================================================

#ifndef QRPOLICY_LEXER_HPP
#define QRPOLICY_LEXER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qrpolicy {

/// Директивы включения: файл, каталог, файл старого формата для одного сервиса
constexpr const char* KW_INCLUDE = "!include";
constexpr const char* KW_INCLUDE_DIR = "!include-dir";
constexpr const char* KW_INCLUDE_SERVICE = "!include-service";

/// Токен строки
struct Token {
    std::string_view text;
    std::size_t column = 0;  // 1-based
};

/// Класс строки
enum class LineClass { Blank, Comment, Directive, Rule };

/// Текст, разбитый на строки
struct SplitText {
    std::vector<std::string> lines;
    bool trailing_newline = false;
};

/// Разбить текст на строки по '\n'
/// "a\nb\n" -> {"a", "b"}, trailing_newline = true
SplitText split_lines(std::string_view text);

/// Обратная операция к split_lines
std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline);

/// Пробельный символ-разделитель токенов
bool is_token_space(char c);

/// Разбить строку на токены (ссылаются на исходную строку)
std::vector<Token> tokenize(std::string_view line);

/// Классифицировать строку
LineClass classify(std::string_view line);

}  // namespace qrpolicy

#endif  // QRPOLICY_LEXER_HPP
