#include "util/Expected.hpp"

namespace relnotes {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::RateLimited: return "rate-limited";
        case ErrorCode::ServerError: return "server-error";
        case ErrorCode::NetworkError: return "network-error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

bool isTransient(const Error& err) {
    switch (err.code) {
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

}
