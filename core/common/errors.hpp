#pragma once

#include <string>

namespace envkeeper {
namespace common {

/**
 * @brief Error categories shared by the cache store and the process supervisor
 *
 * - SQL: malformed query, constraint violation, failed precondition on a reference
 * - IO: filesystem, sockets, process spawn
 * - SERIALIZATION: malformed cached JSON payloads
 * - TIMEOUT: idle-read timeout exceeded while supervising a command
 * - CONFIGURATION: operation disallowed or misconfigured
 * - EXECUTION: command exited with a non-zero status
 */
enum class ErrorCode {
    OK,
    SQL,
    IO,
    SERIALIZATION,
    TIMEOUT,
    CONFIGURATION,
    EXECUTION
};

struct Error {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string command;   // TIMEOUT / EXECUTION: the command that was attempted
    std::string log_path;  // EXECUTION: captured combined output, when kept
    int exit_code = 0;     // EXECUTION only

    bool ok() const { return code == ErrorCode::OK; }

    // "<code>: <message>"
    std::string to_string() const;
};

const char *error_code_to_string(ErrorCode code);

// Fills error and returns false so call sites can `return fail(error, ...)`
bool fail(Error &error, ErrorCode code, const std::string &message);

void clear(Error &error);

}  // namespace common
}  // namespace envkeeper
