#include "cryguard/clock.hpp"

#include <chrono>
#include <cmath>
#include <ctime>

#include <opencv2/core.hpp>

namespace cryguard {

double monotonic_seconds() {
    return static_cast<double>(cv::getTickCount()) / cv::getTickFrequency();
}

double wall_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

std::string iso_utc(double wall_sec) {
    std::time_t t = static_cast<std::time_t>(std::floor(wall_sec));
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

}  // namespace cryguard
