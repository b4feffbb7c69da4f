#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::Expired:         return "expired";
        case ErrorKind::Disabled:        return "disabled";
        case ErrorKind::InvalidKey:      return "invalid_key";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Io:              return "io";
        case ErrorKind::Parse:           return "parse";
    }
    return "unknown";
}
