#include "haul/types.hpp"

namespace haul {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION: return "validation";
        case ErrorCode::NETWORK: return "network";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::EXTRACTION: return "extraction";
        case ErrorCode::PORT_CONFLICT: return "port_conflict";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
    }
    return "unknown";
}

} // namespace haul
