#include "cli/options.hpp"

#include "log/log.hpp"

#include <charconv>
#include <string_view>

namespace pypack::cli {

namespace {

PackError usage_error(const std::string& message) {
    return make_error(ErrorKind::ConfigInvalid, {}, message);
}

std::optional<int> parse_count(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Result<CliOptions, PackError> parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    bool have_entry = false;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Options taking a value accept "--opt value" and "--opt=value"
        std::string value;
        bool has_inline_value = false;
        if (!options_done && arg.starts_with("--")) {
            auto eq = arg.find('=');
            if (eq != std::string::npos && !log::is_log_option(arg)) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline_value = true;
            }
        }
        auto take_value = [&](std::string& out) -> bool {
            if (has_inline_value) {
                out = value;
                return true;
            }
            if (i + 1 >= argc) {
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto missing = [&]() { return usage_error("option '" + arg + "' requires a value"); };

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            if (have_entry) {
                return usage_error("unexpected argument '" + arg + "' (only one source file)");
            }
            options.entry = arg;
            have_entry = true;
            continue;
        }

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-V" || arg == "--version") {
            options.version = true;
        } else if (arg == "-o" || arg == "--output") {
            std::string dir;
            if (!take_value(dir) || dir.empty()) {
                return missing();
            }
            options.output = fs::path(dir);
        } else if (arg == "-f" || arg == "--format") {
            std::string format;
            if (!take_value(format) || format.empty()) {
                return missing();
            }
            options.format = format;
        } else if (arg == "-b" || arg == "--banner") {
            std::string banner;
            if (!take_value(banner) || banner.empty()) {
                return missing();
            }
            options.banner = fs::path(banner);
        } else if (arg == "-j" || arg == "--jobs") {
            std::string text;
            if (!take_value(text)) {
                return missing();
            }
            auto jobs = parse_count(text);
            if (!jobs) {
                return usage_error("invalid job count '" + text + "'");
            }
            options.jobs = *jobs;
        } else if (arg == "--python") {
            std::string python;
            if (!take_value(python) || python.empty()) {
                return missing();
            }
            options.python = python;
        } else if (arg == "--timeout") {
            std::string text;
            if (!take_value(text)) {
                return missing();
            }
            auto timeout = parse_count(text);
            if (!timeout) {
                return usage_error("invalid timeout '" + text + "'");
            }
            options.timeout = *timeout;
        } else if (arg == "--config") {
            std::string path;
            if (!take_value(path) || path.empty()) {
                return missing();
            }
            options.config = fs::path(path);
        } else if (arg == "--no-deps") {
            options.include_deps = false;
        } else if (arg == "--no-optimize") {
            options.optimize = false;
        } else if (arg == "--no-cache") {
            options.no_cache = true;
        } else if (arg == "--keep-temp") {
            options.keep_temp = true;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (log::is_log_option(arg)) {
            // Consumed by parse_log_options()
        } else {
            return usage_error("unknown option '" + arg + "'");
        }
    }

    if (!have_entry && !options.help && !options.version) {
        return usage_error("no source file given");
    }
    return options;
}

Result<Invocation, PackError> resolve_invocation(const CliOptions& cli,
                                                 const std::optional<PackConfig>& config) {
    std::string format = build::default_format_spelling();
    fs::path output = ".";
    Invocation invocation;

    if (config) {
        const auto& b = config->build;
        if (b.format)
            format = *b.format;
        if (b.output)
            output = *b.output;
        if (b.include_deps)
            invocation.request.include_deps = *b.include_deps;
        if (b.optimize)
            invocation.request.optimize = *b.optimize;
        if (b.banner)
            invocation.request.banner = *b.banner;
        if (b.jobs)
            invocation.request.jobs = *b.jobs;
        if (b.cache)
            invocation.request.use_cache = *b.cache;
        if (config->backend.python)
            invocation.backend.python = *config->backend.python;
        if (config->backend.timeout)
            invocation.backend.timeout_seconds = *config->backend.timeout;
    }

    if (cli.format)
        format = *cli.format;
    if (cli.output)
        output = *cli.output;

    auto request = build::make_build_request(cli.entry, output, format);
    if (is_err(request)) {
        return unwrap_err(request);
    }
    auto& r = unwrap(request);
    r.include_deps = cli.include_deps.value_or(invocation.request.include_deps);
    r.optimize = cli.optimize.value_or(invocation.request.optimize);
    r.banner = cli.banner ? cli.banner : invocation.request.banner;
    r.jobs = cli.jobs.value_or(invocation.request.jobs);
    r.use_cache = invocation.request.use_cache && !cli.no_cache;
    r.keep_intermediates = cli.keep_temp;
    r.dry_run = cli.dry_run;
    invocation.request = std::move(r);

    if (cli.python)
        invocation.backend.python = *cli.python;
    if (cli.timeout)
        invocation.backend.timeout_seconds = *cli.timeout;

    PYPACK_LOG_DEBUG("cli", "format=" << build::target_format_name(invocation.request.format)
                                      << " output=" << invocation.request.output_dir.string()
                                      << " deps=" << invocation.request.include_deps
                                      << " optimize=" << invocation.request.optimize
                                      << " jobs=" << invocation.request.jobs);
    return invocation;
}

} // namespace pypack::cli
