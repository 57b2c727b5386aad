// ZPROOF - Service Error Taxonomy
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#ifndef ZPROOF_SERVICE_ERRORS_H
#define ZPROOF_SERVICE_ERRORS_H

#include <string>

namespace zproof {
namespace service {

enum class ErrorCategory {
    /// Parameter files missing or unreadable; fixed by the operator
    ConfigurationFault,
    /// Malformed, missing or invalid request fields
    ClientFault,
    /// Well-formed request needing a capability this service does not own
    StructuralLimitation,
    /// Unexpected internal failure
    ServerFault,
    /// Deliberate terminal state of an unfinished pipeline
    NotImplemented
};

const char* ErrorCategoryToString(ErrorCategory category);

/// HTTP status a category is reported with
int HttpStatusFor(ErrorCategory category);

struct ServiceError {
    ErrorCategory category;
    std::string message;
    
    int HttpStatus() const { return HttpStatusFor(category); }
    
    static ServiceError Client(std::string msg) {
        return {ErrorCategory::ClientFault, std::move(msg)};
    }
    static ServiceError Configuration(std::string msg) {
        return {ErrorCategory::ConfigurationFault, std::move(msg)};
    }
    static ServiceError Structural(std::string msg) {
        return {ErrorCategory::StructuralLimitation, std::move(msg)};
    }
    static ServiceError Unimplemented(std::string msg) {
        return {ErrorCategory::NotImplemented, std::move(msg)};
    }
};

} // namespace service
} // namespace zproof

#endif // ZPROOF_SERVICE_ERRORS_H
