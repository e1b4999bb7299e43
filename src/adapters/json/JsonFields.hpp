#pragma once

#include <cstdint>
#include <string>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace adapters::json {

// Strict conversions: numbers or numeric strings, anything else throws
// std::runtime_error.
std::int64_t to_int64(const boost::json::value& value);
double to_double(const boost::json::value& value);

// Lenient field readers for optional provider fields: a missing key or a
// null value yields the fallback.
double number_or(const boost::json::object& object, const char* key, double fallback = 0.0);
std::int64_t integer_or(const boost::json::object& object, const char* key, std::int64_t fallback = 0);
std::string string_or(const boost::json::object& object, const char* key, std::string fallback = {});

// Required field: throws std::runtime_error when missing or null.
const boost::json::value& required(const boost::json::object& object, const char* key);

// Parses "2025-07-21T10:15:30.123Z"-style timestamps into epoch
// milliseconds; returns fallback when the text is not ISO-8601 UTC.
std::int64_t iso8601_to_ms(const std::string& text, std::int64_t fallback);

}  // namespace adapters::json
