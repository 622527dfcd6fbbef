// ==============================================================================
// diagnostic.cpp - Диагностики разбора и валидации политик
// ==============================================================================

#include "qrpolicy/diagnostic.hpp"

#include <sstream>

namespace qrpolicy {

std::string to_string(Code code) {
    switch (code) {
    case Code::MissingField:
        return "MissingField";
    case Code::UnexpectedToken:
        return "UnexpectedToken";
    case Code::UnknownAction:
        return "UnknownAction";
    case Code::UnknownDirective:
        return "UnknownDirective";
    case Code::MalformedInclude:
        return "MalformedInclude";
    case Code::MalformedParameter:
        return "MalformedParameter";
    case Code::InvalidServiceName:
        return "InvalidServiceName";
    case Code::InvalidArgumentSyntax:
        return "InvalidArgumentSyntax";
    case Code::InvalidQubeName:
        return "InvalidQubeName";
    case Code::UnknownSpecifier:
        return "UnknownSpecifier";
    case Code::DefaultIllegalAsSource:
        return "DefaultIllegalAsSource";
    case Code::DispVMIllegalAsSource:
        return "DispVMIllegalAsSource";
    case Code::TagIllegalAsParameter:
        return "TagIllegalAsParameter";
    case Code::TypeIllegalAsParameter:
        return "TypeIllegalAsParameter";
    case Code::DispVMByTagIllegalAsParameter:
        return "DispVMByTagIllegalAsParameter";
    case Code::AnyVMIllegalAsParameter:
        return "AnyVMIllegalAsParameter";
    case Code::UnexpectedParametersForDeny:
        return "UnexpectedParametersForDeny";
    case Code::ParameterNotApplicable:
        return "ParameterNotApplicable";
    case Code::DuplicateParameter:
        return "DuplicateParameter";
    case Code::InvalidParameterValue:
        return "InvalidParameterValue";
    case Code::IncludeNotAllowed:
        return "IncludeNotAllowed";
    case Code::RedundantRule:
        return "RedundantRule";
    }
    return "unknown";
}

std::string to_string(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::SyntaxError:
        return "syntax error";
    case DiagnosticKind::SemanticError:
        return "semantic error";
    case DiagnosticKind::StructuralWarning:
        return "structural warning";
    }
    return "unknown";
}

std::string to_string(Severity severity) {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    }
    return "unknown";
}

DiagnosticKind kind_of(Code code) {
    switch (code) {
    case Code::MissingField:
    case Code::UnexpectedToken:
    case Code::UnknownAction:
    case Code::UnknownDirective:
    case Code::MalformedInclude:
    case Code::MalformedParameter:
    case Code::InvalidServiceName:
    case Code::InvalidArgumentSyntax:
    case Code::InvalidQubeName:
    case Code::UnknownSpecifier:
        return DiagnosticKind::SyntaxError;
    case Code::DefaultIllegalAsSource:
    case Code::DispVMIllegalAsSource:
    case Code::TagIllegalAsParameter:
    case Code::TypeIllegalAsParameter:
    case Code::DispVMByTagIllegalAsParameter:
    case Code::AnyVMIllegalAsParameter:
    case Code::UnexpectedParametersForDeny:
    case Code::ParameterNotApplicable:
    case Code::DuplicateParameter:
    case Code::InvalidParameterValue:
    case Code::IncludeNotAllowed:
        return DiagnosticKind::SemanticError;
    case Code::RedundantRule:
        return DiagnosticKind::StructuralWarning;
    }
    return DiagnosticKind::SyntaxError;
}

Severity severity_of(Code code) {
    switch (kind_of(code)) {
    case DiagnosticKind::SyntaxError:
    case DiagnosticKind::SemanticError:
        return Severity::Error;
    case DiagnosticKind::StructuralWarning:
        return Severity::Warning;
    }
    return Severity::Error;
}

std::string Diagnostic::format() const {
    std::ostringstream oss;
    oss << "line " << line_number;
    if (column > 0) {
        oss << ", column " << column;
    }
    oss << ": " << to_string(severity()) << ": " << message << " [" << to_string(code) << "]";
    return oss.str();
}

bool operator==(const Diagnostic& a, const Diagnostic& b) {
    return a.line_number == b.line_number && a.column == b.column && a.length == b.length &&
           a.code == b.code && a.message == b.message;
}

bool operator!=(const Diagnostic& a, const Diagnostic& b) {
    return !(a == b);
}

}  // namespace qrpolicy
