#include "tracectx/core/errors.hpp"

namespace tracectx::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Malformed: return "Malformed";
            case StatusCode::NoSpace: return "NoSpace";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Text: return "Text";
            case StatusDomain::Propagation: return "Propagation";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace tracectx::core
