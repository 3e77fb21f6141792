#pragma once
/// @file JSON handling. Records, spool files and build metadata all go
/// through nlohmann::json; these helpers turn malformed documents into
/// inkforge errors instead of nlohmann's own exceptions.

#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/types.hh"

#include <nlohmann/json.hpp> // IWYU pragma: export

namespace inkforge {

using JSON = nlohmann::json;

MakeError(JSONError, Error);

/**
 * Parse `s` as a JSON document, failing with a `JSONError` that names
 * `source` if it is malformed.
 */
JSON parseJSON(std::string_view s, std::string_view source);

/**
 * Ensure the type of a json object is what you expect, failing
 * with a JSONError if it isn't.
 *
 * Use before type conversions and element access to avoid ugly exceptions.
 */
const JSON & ensureType(const JSON & value, JSON::value_t expectedType);

/**
 * Look up `key` in the object `map`, failing with a JSONError if it is absent.
 */
const JSON & valueAt(const JSON & map, const std::string & key);

std::optional<JSON> optionalValueAt(const JSON & map, const std::string & key);

const std::string & getString(const JSON & value);

uint64_t getUnsigned(const JSON & value);

}
