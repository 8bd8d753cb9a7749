#include "engram/core/error.h"

namespace engram {
namespace core {

const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::FORBIDDEN: return "FORBIDDEN";
        case Error::Code::MAINTENANCE_TIMEOUT: return "MAINTENANCE_TIMEOUT";
        case Error::Code::STORAGE_UNAVAILABLE: return "STORAGE_UNAVAILABLE";
        case Error::Code::CANCELLED: return "CANCELLED";
        case Error::Code::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace engram
