#include "clink/error.hpp"

namespace clink {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownCommand: return "unknown_command";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Config: return "config";
        case ErrorKind::Rendering: return "rendering";
        case ErrorKind::Handler: return "handler";
    }
    return "handler";
}

} // namespace clink
