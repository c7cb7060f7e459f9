#include "errors.hpp"

namespace envkeeper {
namespace common {

const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "ok";
        case ErrorCode::SQL:
            return "sql error";
        case ErrorCode::IO:
            return "io error";
        case ErrorCode::SERIALIZATION:
            return "serialization error";
        case ErrorCode::TIMEOUT:
            return "timeout";
        case ErrorCode::CONFIGURATION:
            return "configuration error";
        case ErrorCode::EXECUTION:
            return "execution error";
        default:
            return "error";
    }
}

std::string Error::to_string() const {
    if (ok()) {
        return "ok";
    }
    std::string out = error_code_to_string(code);
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

bool fail(Error &error, ErrorCode code, const std::string &message) {
    error.code = code;
    error.message = message;
    return false;
}

void clear(Error &error) { error = Error{}; }

}  // namespace common
}  // namespace envkeeper
