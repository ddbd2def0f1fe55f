#include "liftoff/app/app_runner.h"

#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

namespace {

/**
 * @brief Minimal application: warms a cache, then reports in
 */
class HelloApplication : public liftoff::Application {
public:
    static constexpr const char* version = "0.1.0";

    void run() override {
        auto& logger = liftoff::LoggerFactory::get_logger("hello");
        logger.with_field("entries", "128").info("Warming cache");
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        logger.clear_fields().debug("Cache ready");
    }

    std::optional<std::string> banner() override {
        return std::string(
            "  _ _  __ _        __  __\n"
            " | (_)/ _| |_ ___ / _|/ _|\n"
            " | | |  _|  _/ _ \\  _|  _|\n"
            " |_|_|_|  \\__\\___/_| |_|   hello v0.1.0");
    }
};

} // namespace

int main() {
    try {
        liftoff::run_app<HelloApplication>();
    } catch (const std::exception& e) {
        std::cerr << "hello failed to start: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
