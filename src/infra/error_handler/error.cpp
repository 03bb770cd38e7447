#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace mlprogress::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::MultipleFillItems:
        case ErrorCode::InvalidFormatSpec:
        case ErrorCode::TotalIsOutOfRange:
        case ErrorCode::TemplateSyntax:
        case ErrorCode::ConfigInvalid:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::MultipleFillItems:
        case ErrorCode::InvalidFormatSpec:
        case ErrorCode::TemplateSyntax:
            return 2;
        case ErrorCode::TotalIsOutOfRange:
        case ErrorCode::ConfigInvalid:
            return 3;
        default:
            return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MultipleFillItems: return "MultipleFillItems";
        case ErrorCode::InvalidFormatSpec: return "InvalidFormatSpec";
        case ErrorCode::TotalIsOutOfRange: return "TotalIsOutOfRange";
        case ErrorCode::TemplateSyntax:    return "TemplateSyntax";
        case ErrorCode::ConfigInvalid:     return "ConfigInvalid";
        case ErrorCode::RenderFault:       return "RenderFault";
        case ErrorCode::Unknown:           return "Unknown";
    }
    return "Unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace mlprogress::infra
