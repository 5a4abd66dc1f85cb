/**
 * @file error.cpp
 * @brief ErrorCode names and context wrapping.
 */
#include "vpnlist/error.hpp"

namespace vpnlist {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Fetch:               return "fetch";
        case ErrorCode::Archive:             return "archive";
        case ErrorCode::Parse:               return "parse";
        case ErrorCode::ResolutionExhausted: return "resolution_exhausted";
        case ErrorCode::Cancelled:           return "cancelled";
        case ErrorCode::Config:              return "config";
        case ErrorCode::Io:                  return "io";
    }
    return "unknown";
}

Error Error::wrap(std::string_view context) const {
    Error e{code, std::string(context)};
    e.message += ": ";
    e.message += message;
    return e;
}

} // namespace vpnlist
