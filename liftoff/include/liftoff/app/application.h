#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace liftoff {

/**
 * @brief Base class of a launchable application
 *
 * run() performs the program's work and may block for as long as the
 * application lives. Exceptions thrown from it abort the launch.
 */
class Application {
public:
    virtual ~Application() = default;

    virtual void run() = 0;

    /**
     * @brief Text printed to standard output after a successful start
     * @return Banner, or std::nullopt / empty for none
     */
    [[nodiscard]] virtual std::optional<std::string> banner() { return std::nullopt; }
};

/**
 * @brief Creates the application instance once startup logging is in place
 */
using ApplicationFactory = std::function<std::unique_ptr<Application>()>;

} // namespace liftoff
