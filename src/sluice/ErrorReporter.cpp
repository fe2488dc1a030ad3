#include "sluice/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

namespace sluice {

ErrorReporter::ErrorReporter(): m_suppress(false) {}

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(Kind kind, int32_t lineNumber, const std::string& message) {
    addError(kind, lineNumber, std::string(), std::string(), message);
}

void ErrorReporter::addError(Kind kind, int32_t lineNumber, const std::string& interfaceName,
                             const std::string& memberName, const std::string& message,
                             const std::string& referencedName) {
    if (!m_suppress) {
        if (lineNumber > 0) {
            spdlog::error("{}:{}: {}: {}", m_fileName.empty() ? "<input>" : m_fileName, lineNumber, kindName(kind),
                          message);
        } else {
            spdlog::error("{}: {}: {}", m_fileName.empty() ? "<input>" : m_fileName, kindName(kind), message);
        }
    }
    m_errors.emplace_back(Error{kind, lineNumber, interfaceName, memberName, message, referencedName});
}

const char* ErrorReporter::kindName(Kind kind) {
    switch (kind) {
    case kSyntax:
        return "SyntaxError";
    case kUnexpectedClose:
        return "UnexpectedCloseError";
    case kUnexpectedToken:
        return "UnexpectedTokenError";
    case kDuplicateName:
        return "DuplicateNameError";
    case kUnresolvedTypeReference:
        return "UnresolvedTypeReferenceError";
    case kSymbolCollision:
        return "SymbolCollisionError";
    }
    return "Error";
}

} // namespace sluice
