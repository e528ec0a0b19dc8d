#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace cverify::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::IoError:
            return false;
        default:
            return true;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::SourceNotFound:   return 2;
        case ErrorCode::PathError:        return 3;
        case ErrorCode::IoError:          return 20;
        case ErrorCode::IncompleteWrite:  return 21;
        case ErrorCode::VerificationRead: return 22;
        case ErrorCode::HashMismatch:     return 23;
        case ErrorCode::InvalidArgument:  return 64; // EX_USAGE
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceNotFound:   return "SourceNotFound";
        case ErrorCode::PathError:        return "PathError";
        case ErrorCode::IncompleteWrite:  return "IncompleteWrite";
        case ErrorCode::VerificationRead: return "VerificationRead";
        case ErrorCode::HashMismatch:     return "HashMismatch";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::IoError:          return "IoError";
        case ErrorCode::Unknown:          break;
    }
    return "Unknown";
}

std::string_view stage_name(Stage stage) {
    switch (stage) {
        case Stage::Validate: return "validate";
        case Stage::Copy:     return "copy";
        case Stage::Verify:   return "verify";
        case Stage::Finalize: return "finalize";
    }
    return "unknown";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_os_error(ErrorCode code, std::string_view what,
                    const std::filesystem::path& path, int err,
                    const std::source_location& loc) {
    Error e{code,
            fmt::format("{} {}: {}", what, path.string(), std::system_category().message(err)),
            loc};
    e.path = path;
    e.os_error = err;
    return e;
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    if (err.code == ErrorCode::HashMismatch && err.source_digest && err.destination_digest) {
        spdlog::log(level,
            "[{}:{} in {}] {} ({}): {} (src: {}, dst: {})",
            err.file, err.line, err.function,
            code_name(err.code), stage_name(err.stage), err.message,
            err.source_digest->hex(), err.destination_digest->hex()
        );
    } else {
        spdlog::log(level,
            "[{}:{} in {}] {} ({}): {}",
            err.file, err.line, err.function,
            code_name(err.code), stage_name(err.stage), err.message
        );
    }
    return std::move(err);
}

} // namespace cverify::infra
