#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace liftoff {

/**
 * @brief Read-only access to process and host metadata
 *
 * Every lookup is independent and reports "unavailable" as std::nullopt
 * instead of throwing, so callers can fall back per value. Tests substitute
 * a scripted implementation.
 */
class ISystemProbe {
public:
    virtual ~ISystemProbe() = default;

    [[nodiscard]] virtual std::optional<std::string> host_name() = 0;
    [[nodiscard]] virtual std::optional<std::string> process_id() = 0;
    [[nodiscard]] virtual std::optional<std::string> user_name() = 0;
    [[nodiscard]] virtual std::optional<std::filesystem::path> working_directory() = 0;

    /**
     * @brief Language standard and toolchain the program was built with
     */
    [[nodiscard]] virtual std::optional<std::string> runtime_version() = 0;
    [[nodiscard]] virtual std::optional<std::string> os_name() = 0;

    /**
     * @brief Time since the process was started by the operating system
     * @return std::nullopt when the probe cannot tell
     */
    [[nodiscard]] virtual std::optional<std::chrono::milliseconds> uptime() = 0;

    /**
     * @brief Path of the executable or shared object that contains `address`
     */
    [[nodiscard]] virtual std::optional<std::filesystem::path> module_path(const void* address) = 0;

    /**
     * @brief Wall-clock milliseconds since the epoch
     */
    [[nodiscard]] virtual std::int64_t current_time_millis() = 0;
};

/**
 * @brief ISystemProbe backed by POSIX calls and /proc
 */
class PosixSystemProbe final : public ISystemProbe {
public:
    std::optional<std::string> host_name() override;
    std::optional<std::string> process_id() override;
    std::optional<std::string> user_name() override;
    std::optional<std::filesystem::path> working_directory() override;
    std::optional<std::string> runtime_version() override;
    std::optional<std::string> os_name() override;
    std::optional<std::chrono::milliseconds> uptime() override;
    std::optional<std::filesystem::path> module_path(const void* address) override;
    std::int64_t current_time_millis() override;
};

/**
 * @brief Wall-clock milliseconds since the epoch
 */
[[nodiscard]] std::int64_t system_time_millis();

} // namespace liftoff
