#pragma once

#include <chrono>
#include <string>
#include <type_traits>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>

namespace ddd {

/**
 * Helper functions shared by the building blocks.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Extract the fully qualified type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Extract the short message name (the event tag) from a type URL.
 * "type.googleapis.com/examples.Renamed" yields "Renamed".
 */
inline std::string tag_from_url(const std::string& type_url) {
    auto name = type_name_from_url(type_url);
    auto pos = name.rfind('.');
    return pos != std::string::npos ? name.substr(pos + 1) : name;
}

/**
 * Tag handlers are registered under for events of message type T.
 */
template<typename T>
std::string event_tag() {
    return T::descriptor()->name();
}

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Convert between protobuf timestamps and system clock time points.
 */
google::protobuf::Timestamp to_timestamp(std::chrono::system_clock::time_point time_point);
std::chrono::system_clock::time_point to_time_point(const google::protobuf::Timestamp& timestamp);

/**
 * Format a time point as ISO-8601 UTC, e.g. "2024-05-01T12:00:00Z".
 */
std::string to_iso8601(std::chrono::system_clock::time_point time_point);

/**
 * Random UUID v4 in canonical textual form.
 */
std::string generate_uuid();

/**
 * Render an aggregate id for keys and log lines.
 */
inline std::string id_to_string(const std::string& id) { return id; }

inline std::string id_to_string(const char* id) { return id; }

template<typename Id>
std::string id_to_string(const Id& id) {
    if constexpr (std::is_arithmetic_v<Id>) {
        return std::to_string(id);
    } else {
        return id.to_string();
    }
}

} // namespace helpers
} // namespace ddd
