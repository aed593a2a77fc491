#include "errors.hpp"

namespace pypack {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SourceUnreadable:
        return "SourceUnreadable";
    case ErrorKind::EntryUnresolvable:
        return "EntryUnresolvable";
    case ErrorKind::UnsupportedFormat:
        return "UnsupportedFormat";
    case ErrorKind::BackendUnavailable:
        return "BackendUnavailable";
    case ErrorKind::BackendInvocationFailed:
        return "BackendInvocationFailed";
    case ErrorKind::BannerInjectionFailed:
        return "BannerInjectionFailed";
    case ErrorKind::ConfigInvalid:
        return "ConfigInvalid";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool is_fatal(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::EntryUnresolvable:
    case ErrorKind::UnsupportedFormat:
    case ErrorKind::BackendUnavailable:
    case ErrorKind::ConfigInvalid:
    case ErrorKind::Cancelled:
        return true;
    case ErrorKind::SourceUnreadable:
    case ErrorKind::BackendInvocationFailed:
    case ErrorKind::BannerInjectionFailed:
        return false;
    }
    return true;
}

std::string PackError::to_string() const {
    std::string out = error_kind_name(kind);
    out += ": ";
    if (!path.empty()) {
        out += path.string();
        out += ": ";
    }
    out += message;
    return out;
}

} // namespace pypack
