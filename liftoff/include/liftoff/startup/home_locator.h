#pragma once

#include "liftoff/startup/entry_point.h"
#include "liftoff/startup/system_probe.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace liftoff {

/**
 * @brief Application home directory
 *
 * Picks a sensible home both for applications packaged as an archive and for
 * binaries run straight from a build tree:
 * - `source` is the executable, shared object or archive the entry point was
 *   loaded from, when it can be determined;
 * - `dir` is the directory containing `source`, or `source` itself when it is
 *   a directory, or else the working directory. It is never empty.
 *
 * Both paths are absolute and normalized. Construction never throws; every
 * failed lookup falls through to the next candidate.
 */
class HomeLocator {
public:
    /**
     * @brief Marker separating an archive from the entry inside it
     */
    static constexpr std::string_view kArchiveSeparator = "!/";

    /**
     * @brief Home derived from the working directory only
     */
    explicit HomeLocator(ISystemProbe& probe);

    /**
     * @param entry Application entry point, or nullptr when unknown
     * @param probe Source of module paths and the working directory
     * @param running_under_test_harness Report no source, so a test runner's
     *        binary is never mistaken for the application
     */
    HomeLocator(const EntryPoint* entry, ISystemProbe& probe,
                bool running_under_test_harness = false);

    /**
     * @brief Underlying source, usually an executable, library or directory
     */
    [[nodiscard]] const std::optional<std::filesystem::path>& source() const noexcept { return source_; }

    /**
     * @brief Application home directory (never empty)
     */
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

    [[nodiscard]] std::string to_string() const { return dir_.string(); }

private:
    std::optional<std::filesystem::path> source_;
    std::filesystem::path dir_;

    static std::optional<std::filesystem::path> find_source(const EntryPoint* entry, ISystemProbe& probe,
                                                            bool running_under_test_harness);
    static std::filesystem::path find_home_dir(const std::optional<std::filesystem::path>& source,
                                               ISystemProbe& probe);
    static std::filesystem::path find_default_home_dir(ISystemProbe& probe);
};

/**
 * @brief Remove the in-archive suffix from a path such as `app.bundle!/lib/core.so`
 */
[[nodiscard]] std::filesystem::path strip_archive_entry(const std::filesystem::path& location);

} // namespace liftoff
