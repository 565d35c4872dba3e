#ifndef CLINK_ERROR_HPP
#define CLINK_ERROR_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clink {

enum class ErrorKind {
    UnknownCommand,
    Validation,
    Config,
    Rendering,
    Handler,
};

std::string_view errorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::Handler};
    std::string message;
    // Extra lines shown under the message, e.g. spelling suggestions or offending keys.
    std::vector<std::string> details;

    static Error unknownCommand(std::string message, std::vector<std::string> suggestions = {}) {
        return Error{ErrorKind::UnknownCommand, std::move(message), std::move(suggestions)};
    }
    static Error validation(std::string message, std::vector<std::string> suggestions = {}) {
        return Error{ErrorKind::Validation, std::move(message), std::move(suggestions)};
    }
    static Error config(std::string message, std::vector<std::string> keys = {}) {
        return Error{ErrorKind::Config, std::move(message), std::move(keys)};
    }
    static Error rendering(std::string message) { return Error{ErrorKind::Rendering, std::move(message), {}}; }
    static Error handler(std::string message) { return Error{ErrorKind::Handler, std::move(message), {}}; }
};

} // namespace clink

#endif // CLINK_ERROR_HPP
