// ZPROOF - Service Error Taxonomy
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/service/errors.h>

namespace zproof {
namespace service {

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConfigurationFault: return "configuration fault";
        case ErrorCategory::ClientFault: return "client fault";
        case ErrorCategory::StructuralLimitation: return "structural limitation";
        case ErrorCategory::ServerFault: return "server fault";
        case ErrorCategory::NotImplemented: return "not implemented";
        default: return "unknown";
    }
}

int HttpStatusFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ClientFault: return 400;
        case ErrorCategory::NotImplemented: return 501;
        case ErrorCategory::ConfigurationFault:
        case ErrorCategory::StructuralLimitation:
        case ErrorCategory::ServerFault:
        default:
            return 500;
    }
}

} // namespace service
} // namespace zproof
