#include "liftoff/startup/home_locator.h"

#include <exception>
#include <system_error>

namespace liftoff {

namespace {

std::filesystem::path absolute_normal(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path result = std::filesystem::absolute(path, ec);
    if (ec) {
        result = path;
    }
    result = result.lexically_normal();

    // "/srv/app/." normalizes to "/srv/app/"
    if (!result.has_filename() && result.has_relative_path()) {
        result = result.parent_path();
    }
    return result;
}

} // anonymous namespace

std::filesystem::path strip_archive_entry(const std::filesystem::path& location) {
    const std::string name = location.string();
    auto separator = name.find(HomeLocator::kArchiveSeparator);
    if (separator != std::string::npos && separator > 0) {
        return std::filesystem::path(name.substr(0, separator));
    }
    return location;
}

HomeLocator::HomeLocator(ISystemProbe& probe)
    : HomeLocator(nullptr, probe, false) {
}

HomeLocator::HomeLocator(const EntryPoint* entry, ISystemProbe& probe, bool running_under_test_harness)
    : source_(find_source(entry, probe, running_under_test_harness))
    , dir_(find_home_dir(source_, probe)) {
}

std::optional<std::filesystem::path> HomeLocator::find_source(const EntryPoint* entry, ISystemProbe& probe,
                                                              bool running_under_test_harness) {
    if (entry == nullptr || entry->anchor == nullptr || running_under_test_harness) {
        return std::nullopt;
    }

    try {
        auto location = probe.module_path(entry->anchor);
        if (!location || location->empty()) {
            return std::nullopt;
        }

        std::filesystem::path source = strip_archive_entry(*location);

        std::error_code ec;
        if (!std::filesystem::exists(source, ec) || ec) {
            return std::nullopt;
        }
        return absolute_normal(source);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path HomeLocator::find_home_dir(const std::optional<std::filesystem::path>& source,
                                                 ISystemProbe& probe) {
    std::filesystem::path home_dir = source ? *source : find_default_home_dir(probe);

    std::error_code ec;
    if (std::filesystem::is_regular_file(home_dir, ec)) {
        home_dir = home_dir.parent_path();
    }

    if (home_dir.empty() || !std::filesystem::exists(home_dir, ec)) {
        home_dir = ".";
    }
    return absolute_normal(home_dir);
}

std::filesystem::path HomeLocator::find_default_home_dir(ISystemProbe& probe) {
    try {
        if (auto cwd = probe.working_directory(); cwd && !cwd->empty()) {
            return *cwd;
        }
    } catch (const std::exception&) {
        // fall through to the literal current directory
    }
    return ".";
}

} // namespace liftoff
