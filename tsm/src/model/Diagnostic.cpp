#include "model/Diagnostic.h"
#include <sstream>

namespace TSM {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SyntaxError:
        return "SyntaxError";
    case ErrorKind::InitialStateError:
        return "InitialStateError";
    case ErrorKind::DuplicateTransitionError:
        return "DuplicateTransitionError";
    case ErrorKind::AmbiguousWildcardError:
        return "AmbiguousWildcardError";
    case ErrorKind::InvalidInternalTransitionError:
        return "InvalidInternalTransitionError";
    case ErrorKind::ConfigurationError:
        return "ConfigurationError";
    case ErrorKind::ReservedIdentifierError:
        return "ReservedIdentifierError";
    }
    return "UnknownError";
}

std::string Diagnostic::format(const std::string &sourceName) const {
    std::ostringstream ss;
    ss << (sourceName.empty() ? "<input>" : sourceName);
    if (position.isKnown()) {
        ss << ":" << position.line << ":" << position.column;
    }
    ss << ": error[" << errorKindName(kind) << "]: " << message;

    if (!clauseText.empty()) {
        ss << "\n    | " << clauseText;
    }
    if (!hint.empty()) {
        ss << "\n    = help: " << hint;
    }
    return ss.str();
}

}  // namespace TSM
