#include "../../include/errors.hpp"

namespace squisher {

std::string_view error_kind_to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Io:             return "IoError";
        case ErrorKind::Decode:         return "DecodeError";
        case ErrorKind::Encode:         return "EncodeError";
        case ErrorKind::Path:           return "PathError";
        case ErrorKind::Classification: return "ClassificationError";
        case ErrorKind::Config:         return "ConfigError";
    }
    return "Error";
}

} // namespace squisher
