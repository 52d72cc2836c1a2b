#include "ddd/helpers.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace ddd {
namespace helpers {

google::protobuf::Timestamp now() {
    return to_timestamp(std::chrono::system_clock::now());
}

google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point time_point) {
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::chrono::system_clock::time_point to_time_point(const google::protobuf::Timestamp& timestamp) {
    auto duration = std::chrono::seconds(timestamp.seconds()) +
                    std::chrono::nanoseconds(timestamp.nanos());
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(duration));
}

std::string to_iso8601(std::chrono::system_clock::time_point time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

std::string generate_uuid() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[nibble(engine)];
    }
    // Version 4, variant 10xx
    uuid[14] = '4';
    uuid[19] = hex[(nibble(engine) & 0x3) + 8];
    return uuid;
}

} // namespace helpers
} // namespace ddd
