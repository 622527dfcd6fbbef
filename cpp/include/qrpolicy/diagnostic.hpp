// ==============================================================================
// qrpolicy/diagnostic.hpp - Диагностики разбора и валидации политик
// ==============================================================================
//
// Назначение:
// - Коды диагностик (закрытое множество)
// - Классификация: SyntaxError / SemanticError / StructuralWarning
// - Уровень: error (блокирует сохранение) / warning
//
// Диагностики всегда возвращаются как данные, исключения для них не
// используются.
//
// ==============================================================================

#ifndef QRPOLICY_DIAGNOSTIC_HPP
#define QRPOLICY_DIAGNOSTIC_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace qrpolicy {

// ----------------------------------------------------------------------------
// Классификация
// ----------------------------------------------------------------------------

enum class DiagnosticKind { SyntaxError, SemanticError, StructuralWarning };

enum class Severity { Error, Warning };

/// Код диагностики
enum class Code {
    // Синтаксис строки
    MissingField,
    UnexpectedToken,
    UnknownAction,
    UnknownDirective,
    MalformedInclude,
    MalformedParameter,
    InvalidServiceName,
    InvalidArgumentSyntax,
    InvalidQubeName,
    UnknownSpecifier,

    // Семантика
    DefaultIllegalAsSource,
    DispVMIllegalAsSource,
    TagIllegalAsParameter,
    TypeIllegalAsParameter,
    DispVMByTagIllegalAsParameter,
    AnyVMIllegalAsParameter,
    UnexpectedParametersForDeny,
    ParameterNotApplicable,
    DuplicateParameter,
    InvalidParameterValue,
    IncludeNotAllowed,

    // Структура файла
    RedundantRule
};

/// Имя кода ("DispVMIllegalAsSource")
std::string to_string(Code code);

std::string to_string(DiagnosticKind kind);

/// "error" / "warning"
std::string to_string(Severity severity);

DiagnosticKind kind_of(Code code);

Severity severity_of(Code code);

// ----------------------------------------------------------------------------
// Diagnostic
// ----------------------------------------------------------------------------

struct Diagnostic {
    std::size_t line_number = 0;  // 1-based
    std::size_t column = 0;       // 1-based, 0 = вся строка
    std::size_t length = 0;       // длина подсвечиваемого фрагмента
    Code code = Code::UnexpectedToken;
    std::string message;

    DiagnosticKind kind() const { return kind_of(code); }
    Severity severity() const { return severity_of(code); }
    bool is_error() const { return severity() == Severity::Error; }

    /// "line 3, column 12: error: <message> [DispVMIllegalAsSource]"
    std::string format() const;
};

bool operator==(const Diagnostic& a, const Diagnostic& b);
bool operator!=(const Diagnostic& a, const Diagnostic& b);

}  // namespace qrpolicy

#endif  // QRPOLICY_DIAGNOSTIC_HPP
