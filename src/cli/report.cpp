#include "cli/report.hpp"

#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace pypack::cli {

namespace {

std::string display_path(const fs::path& path, const fs::path& base) {
    if (base.empty()) {
        return path.generic_string();
    }
    auto rel = path.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") {
        return path.generic_string();
    }
    return rel.generic_string();
}

std::string format_duration(int64_t ms) {
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << "ms";
    } else {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << "s";
    }
    return oss.str();
}

void write_indented(std::ostringstream& out, const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        out << "    " << line << "\n";
    }
}

} // namespace

std::string format_report(const build::BuildReport& report, const fs::path& base) {
    std::ostringstream out;

    if (!report.dry_run_listing.empty()) {
        out << report.dry_run_listing;
        if (report.dry_run_listing.back() != '\n') {
            out << "\n";
        }
    }

    for (const auto& unit : report.units) {
        std::string tag = std::string("[") + build::unit_status_name(unit.status) + "]";
        out << std::left << std::setw(10) << tag << display_path(unit.unit, base);

        switch (unit.status) {
        case build::UnitStatus::Succeeded:
            out << " -> " << unit.artifact.generic_string() << " ("
                << format_duration(unit.duration_ms) << ")";
            break;
        case build::UnitStatus::Skipped:
            if (unit.cached) {
                out << " -> " << unit.artifact.generic_string() << " (cached)";
            } else if (unit.error) {
                out << ": " << unit.error->to_string();
            }
            break;
        case build::UnitStatus::Failed:
            if (unit.error) {
                out << ": " << unit.error->to_string();
            }
            break;
        }
        out << "\n";

        if (unit.status == build::UnitStatus::Failed && !unit.diagnostics.empty()) {
            write_indented(out, unit.diagnostics);
        }
    }

    for (const auto& warning : report.warnings) {
        out << "warning: " << warning.to_string() << "\n";
    }

    if (report.fatal) {
        out << "error: " << report.fatal->to_string() << "\n";
    }

    if (!report.scratch_dir.empty()) {
        out << "intermediates kept in " << report.scratch_dir.generic_string() << "\n";
    }

    if (report.dry_run_listing.empty() && !report.fatal) {
        out << "\n"
            << report.count(build::UnitStatus::Succeeded) << " succeeded, "
            << report.count(build::UnitStatus::Failed) << " failed, "
            << report.count(build::UnitStatus::Skipped) << " skipped\n";
        if (report.cancelled) {
            out << "interrupted\n";
        }
    }

    out << "exit status " << report.exit_code() << "\n";
    return out.str();
}

void print_report(const build::BuildReport& report, std::ostream& out, const fs::path& base) {
    out << format_report(report, base);
    out.flush();
}

} // namespace pypack::cli
