#include "nanpure/error.hpp"

namespace nanpure {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Shape:
            return "ShapeError";
        case ErrorKind::Range:
            return "RangeError";
        case ErrorKind::Conflict:
            return "ConflictError";
        case ErrorKind::Unsolvable:
            return "UnsolvableError";
    }
    return "UnknownError";
}

} // namespace nanpure
