#pragma once

#include <cstdint>
#include <functional>

namespace liftoff {

/**
 * @brief Wall-clock stopwatch with millisecond resolution
 *
 * Call start() before stop(); the order is not checked. Not thread-safe.
 */
class Stopwatch {
public:
    using Clock = std::function<std::int64_t()>;

    Stopwatch();
    explicit Stopwatch(Clock clock);

    void start();
    void stop();

    [[nodiscard]] std::int64_t start_millis() const noexcept { return start_; }
    [[nodiscard]] std::int64_t end_millis() const noexcept { return end_; }
    [[nodiscard]] std::int64_t total_time_millis() const noexcept { return end_ - start_; }
    [[nodiscard]] double elapsed_seconds() const noexcept { return static_cast<double>(total_time_millis()) / 1000.0; }

private:
    Clock clock_;
    std::int64_t start_ = 0;
    std::int64_t end_ = 0;
};

} // namespace liftoff
