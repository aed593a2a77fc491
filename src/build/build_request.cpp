#include "build/build_request.hpp"

#include "log/log.hpp"

namespace pypack::build {

const char* target_format_name(TargetFormat format) {
    switch (format) {
    case TargetFormat::DynamicLibrary:
        return "dynamic library";
    case TargetFormat::Executable:
        return "executable";
    case TargetFormat::Archive:
        return "archive";
    }
    return "unknown";
}

Result<TargetFormat, PackError> parse_target_format(std::string_view spelling) {
    if (spelling == "pyd" || spelling == "so") {
        return TargetFormat::DynamicLibrary;
    }
    if (spelling == "exe") {
        return TargetFormat::Executable;
    }
    if (spelling == "zip") {
        return TargetFormat::Archive;
    }
    return make_error(ErrorKind::UnsupportedFormat, {},
                      "unsupported format '" + std::string(spelling) +
                          "' (expected pyd, so, exe or zip)");
}

const char* native_library_extension() {
#ifdef _WIN32
    return ".pyd";
#else
    return ".so";
#endif
}

const char* default_format_spelling() {
#ifdef _WIN32
    return "pyd";
#else
    return "so";
#endif
}

const char* executable_extension() {
#ifdef _WIN32
    return ".exe";
#else
    return "";
#endif
}

Result<BuildRequest, PackError> make_build_request(const fs::path& entry, const fs::path& output_dir,
                                                   std::string_view format_spelling) {
    auto format = parse_target_format(format_spelling);
    if (is_err(format)) {
        return unwrap_err(format);
    }

    BuildRequest request;
    request.entry = entry;
    request.output_dir = output_dir;
    request.format = unwrap(format);

    if (request.format == TargetFormat::DynamicLibrary) {
        request.requested_extension = std::string(format_spelling);
        if (format_spelling != default_format_spelling()) {
            PYPACK_LOG_WARN("build", "Format '" << format_spelling << "' requested, producing "
                                                << native_library_extension()
                                                << " files for this platform");
        }
    }
    return request;
}

} // namespace pypack::build
