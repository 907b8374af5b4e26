#include <ledger_service/core/result.hpp>

#include <sstream>

namespace ledger_service {

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string message) {
    Error error;
    error.operation = std::move(operation);
    error.message = std::move(message);
    error.category = category;
    return error;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::UnknownTool:       return "unknown_tool";
        case ErrorCategory::UnknownPrompt:     return "unknown_prompt";
        case ErrorCategory::InvalidArguments:  return "invalid_arguments";
        case ErrorCategory::UnsupportedScheme: return "unsupported_scheme";
        case ErrorCategory::NotFound:          return "not_found";
        case ErrorCategory::Adapter:           return "adapter";
        case ErrorCategory::Config:            return "config";
        case ErrorCategory::Internal:          return "internal";
    }
    return "internal";
}

int Error::RpcCode() const {
    switch (category) {
        case ErrorCategory::UnknownTool:       return kRpcInvalidParams;
        case ErrorCategory::UnknownPrompt:     return kRpcInvalidParams;
        case ErrorCategory::InvalidArguments:  return kRpcInvalidParams;
        case ErrorCategory::UnsupportedScheme: return kRpcInvalidParams;
        case ErrorCategory::NotFound:          return kRpcResourceNotFound;
        case ErrorCategory::Adapter:           return kRpcInternalError;
        case ErrorCategory::Config:            return kRpcInternalError;
        case ErrorCategory::Internal:          return kRpcInternalError;
    }
    return kRpcInternalError;
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config: return 1;
        case ErrorCategory::Internal: return 99;
        default: return 2;
    }
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << " [" << CategoryName() << "]: " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

} // namespace ledger_service
