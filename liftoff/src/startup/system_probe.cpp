#include "liftoff/startup/system_probe.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <dlfcn.h>
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace liftoff {

namespace {

// Taken during static initialisation, before main() and any stopwatch start
const std::int64_t loaded_at_millis = system_time_millis();

std::string compiler_description() {
#if defined(__clang__)
    return "Clang " + std::to_string(__clang_major__) + "." +
           std::to_string(__clang_minor__) + "." + std::to_string(__clang_patchlevel__);
#elif defined(__GNUC__)
    return "GCC " + std::to_string(__GNUC__) + "." +
           std::to_string(__GNUC_MINOR__) + "." + std::to_string(__GNUC_PATCHLEVEL__);
#else
    return "";
#endif
}

std::string language_standard() {
#if __cplusplus > 202002L
    return "23";
#elif __cplusplus >= 202002L
    return "20";
#elif __cplusplus >= 201703L
    return "17";
#else
    return "14";
#endif
}

#ifdef __linux__
/**
 * @brief Process start time in clock ticks after boot (field 22 of /proc/self/stat)
 */
std::optional<long long> process_start_ticks() {
    std::ifstream stat("/proc/self/stat");
    if (!stat) return std::nullopt;

    std::string content;
    std::getline(stat, content);

    // The command name (field 2) may contain spaces; fields resume after ')'
    auto close = content.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream fields(content.substr(close + 1));
    std::vector<std::string> values;
    std::string value;
    while (fields >> value) {
        values.push_back(value);
    }

    // values[0] is field 3 (state), so field 22 is values[19]
    if (values.size() < 20) return std::nullopt;

    try {
        return std::stoll(values[19]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> system_uptime_seconds() {
    std::ifstream uptime("/proc/uptime");
    double seconds = 0.0;
    if (!(uptime >> seconds)) return std::nullopt;
    return seconds;
}
#endif

} // anonymous namespace

std::int64_t system_time_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<std::string> PosixSystemProbe::host_name() {
    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
        return std::nullopt;
    }
    return std::string(hostname);
}

std::optional<std::string> PosixSystemProbe::process_id() {
    return std::to_string(::getpid());
}

std::optional<std::string> PosixSystemProbe::user_name() {
    if (const passwd* pw = ::getpwuid(::geteuid()); pw != nullptr && pw->pw_name != nullptr) {
        return std::string(pw->pw_name);
    }
    if (const char* user = std::getenv("USER"); user != nullptr && *user != '\0') {
        return std::string(user);
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> PosixSystemProbe::working_directory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec || cwd.empty()) {
        return std::nullopt;
    }
    return cwd;
}

std::optional<std::string> PosixSystemProbe::runtime_version() {
    std::string compiler = compiler_description();
    if (compiler.empty()) {
        return language_standard();
    }
    return language_standard() + " (" + compiler + ")";
}

std::optional<std::string> PosixSystemProbe::os_name() {
#ifdef __APPLE__
    return std::string("macOS");
#else
    utsname info{};
    if (::uname(&info) != 0) {
        return std::nullopt;
    }
    return std::string(info.sysname);
#endif
}

std::optional<std::chrono::milliseconds> PosixSystemProbe::uptime() {
    // /proc only has clock tick resolution, so it can lag the load stamp
    std::chrono::milliseconds since_load(std::max<std::int64_t>(0, system_time_millis() - loaded_at_millis));

#ifdef __linux__
    auto start_ticks = process_start_ticks();
    auto system_uptime = system_uptime_seconds();
    long ticks_per_second = ::sysconf(_SC_CLK_TCK);
    if (!start_ticks || !system_uptime || ticks_per_second <= 0) {
        return since_load;
    }

    double started_after_boot = static_cast<double>(*start_ticks) / static_cast<double>(ticks_per_second);
    double running_for = *system_uptime - started_after_boot;
    if (running_for < 0.0) {
        return since_load;
    }
    return std::max(since_load, std::chrono::milliseconds(static_cast<long long>(running_for * 1000.0)));
#else
    return since_load;
#endif
}

std::optional<std::filesystem::path> PosixSystemProbe::module_path(const void* address) {
    if (address == nullptr) {
        return std::nullopt;
    }

    Dl_info info{};
    if (::dladdr(address, &info) == 0 || info.dli_fname == nullptr || *info.dli_fname == '\0') {
        return std::nullopt;
    }

    std::filesystem::path path(info.dli_fname);

#ifdef __linux__
    // The main executable is sometimes reported by its invocation name
    if (!path.has_parent_path()) {
        char exe_path[4096];
        ssize_t n = ::readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
        if (n <= 0) {
            return std::nullopt;
        }
        exe_path[n] = '\0';
        path = exe_path;
    }
#endif

    return path;
}

std::int64_t PosixSystemProbe::current_time_millis() {
    return system_time_millis();
}

} // namespace liftoff
