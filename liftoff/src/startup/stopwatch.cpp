#include "liftoff/startup/stopwatch.h"
#include "liftoff/startup/system_probe.h"

#include <utility>

namespace liftoff {

Stopwatch::Stopwatch()
    : clock_(&system_time_millis) {
}

Stopwatch::Stopwatch(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(&system_time_millis)) {
}

void Stopwatch::start() {
    start_ = clock_();
}

void Stopwatch::stop() {
    end_ = clock_();
}

} // namespace liftoff
