#include "build/assembler.hpp"

#include "log/log.hpp"

#include <system_error>

namespace pypack::build {

ArtifactAssembler::ArtifactAssembler(fs::path output_dir, TargetFormat format,
                                     std::optional<fs::path> banner)
    : output_dir_(std::move(output_dir)), banner_(std::move(banner)),
      injector_(make_banner_injector(format)) {}

std::optional<PackError> ArtifactAssembler::prepare_output() const {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        return make_error(ErrorKind::ConfigInvalid, output_dir_,
                          "cannot create output directory: " + ec.message());
    }
    if (!fs::is_directory(output_dir_, ec)) {
        return make_error(ErrorKind::ConfigInvalid, output_dir_, "not a directory");
    }
    return std::nullopt;
}

std::optional<PackError> ArtifactAssembler::move_into_place(const fs::path& from,
                                                            const fs::path& to) const {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return std::nullopt;
    }

    // Scratch and output may be on different filesystems.
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(to, ignored);
        return make_error(ErrorKind::BackendInvocationFailed, to,
                          "cannot install artifact: " + ec.message());
    }
    return std::nullopt;
}

std::optional<PackError> ArtifactAssembler::install(BuildUnitResult& result,
                                                    const BuildStep& step) const {
    if (result.status != UnitStatus::Succeeded) {
        return std::nullopt;
    }

    auto final_path = output_dir_ / step.relative_output;
    auto tmp_path = final_path;
    tmp_path += TEMP_SUFFIX;

    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if (ec) {
        result.status = UnitStatus::Failed;
        result.error = make_error(ErrorKind::BackendInvocationFailed, final_path.parent_path(),
                                  "cannot create directory: " + ec.message());
        return std::nullopt;
    }

    if (auto err = move_into_place(result.artifact, tmp_path)) {
        result.status = UnitStatus::Failed;
        result.error = err;
        return std::nullopt;
    }

    std::optional<PackError> warning;
    if (banner_) {
        warning = inject_banner(tmp_path, *banner_, *injector_);
        if (warning) {
            warning->path = final_path;
            PYPACK_LOG_WARN("assembler", warning->to_string());
        } else {
            result.banner_applied = true;
        }
    }

    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        result.status = UnitStatus::Failed;
        result.banner_applied = false;
        result.error = make_error(ErrorKind::BackendInvocationFailed, final_path,
                                  "cannot install artifact: " + ec.message());
        return std::nullopt;
    }

    result.artifact = final_path;
    PYPACK_LOG_INFO("assembler", "Installed " << final_path.string());
    return warning;
}

void ArtifactAssembler::cleanup_scratch(const fs::path& scratch_root,
                                        std::vector<BuildUnitResult>& results,
                                        bool keep_all) const {
    std::error_code ec;
    if (keep_all) {
        PYPACK_LOG_INFO("assembler", "Keeping intermediates in " << scratch_root.string());
        return;
    }

    bool kept_any = false;
    for (auto& result : results) {
        if (result.scratch_dir.empty()) {
            continue;
        }
        if (result.status == UnitStatus::Failed) {
            kept_any = true;
            continue;
        }
        fs::remove_all(result.scratch_dir, ec);
        if (ec) {
            PYPACK_LOG_WARN("assembler", "Cannot remove " << result.scratch_dir.string() << ": "
                                                          << ec.message());
            ec.clear();
        }
        result.scratch_dir.clear();
    }

    if (!kept_any) {
        fs::remove_all(scratch_root, ec);
        if (ec) {
            PYPACK_LOG_WARN("assembler",
                            "Cannot remove " << scratch_root.string() << ": " << ec.message());
        }
    }
}

} // namespace pypack::build
