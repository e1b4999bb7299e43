#include "adapters/json/JsonFields.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace adapters::json {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

}  // namespace

std::int64_t to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

double to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

double number_or(const boost::json::object& object, const char* key, double fallback) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return fallback;
    }
    const double parsed = to_double(*value);
    return std::isfinite(parsed) ? parsed : fallback;
}

std::int64_t integer_or(const boost::json::object& object, const char* key, std::int64_t fallback) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return fallback;
    }
    return to_int64(*value);
}

std::string string_or(const boost::json::object& object, const char* key, std::string fallback) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return fallback;
    }
    return std::string{value->as_string().c_str()};
}

const boost::json::value& required(const boost::json::object& object, const char* key) {
    const auto* value = object.if_contains(key);
    if (value == nullptr || value->is_null()) {
        throw std::runtime_error("Missing required field '" + std::string{key} + "'");
    }
    return *value;
}

std::int64_t iso8601_to_ms(const std::string& text, std::int64_t fallback) {
    if (text.size() < 19) {
        return fallback;
    }

    std::tm tm{};
    std::istringstream input(text.substr(0, 19));
    input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (input.fail()) {
        return fallback;
    }
    tm.tm_isdst = 0;
    const auto seconds = timegm_compat(&tm);
    if (seconds < 0) {
        return fallback;
    }

    std::int64_t millis = 0;
    if (text.size() > 20 && text[19] == '.') {
        int digits = 0;
        for (std::size_t i = 20; i < text.size() && digits < 3; ++i, ++digits) {
            if (text[i] < '0' || text[i] > '9') {
                break;
            }
            millis = millis * 10 + (text[i] - '0');
        }
        for (; digits > 0 && digits < 3; ++digits) {
            millis *= 10;
        }
    }
    return static_cast<std::int64_t>(seconds) * 1000 + millis;
}

}  // namespace adapters::json
