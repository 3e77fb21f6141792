#include "inkforge/libutil/json.hh"

namespace inkforge {

JSON parseJSON(std::string_view s, std::string_view source)
{
    try {
        return JSON::parse(s);
    } catch (JSON::parse_error & e) {
        throw JSONError("malformed JSON in %s: %s", Uncolored(std::string(source)), e.what());
    }
}

const JSON & ensureType(const JSON & value, JSON::value_t expectedType)
{
    if (value.type() != expectedType) {
        throw JSONError(
            "Expected JSON value to be of type '%s' but it is of type '%s'",
            JSON(expectedType).type_name(),
            value.type_name()
        );
    }
    return value;
}

const JSON & valueAt(const JSON & map, const std::string & key)
{
    ensureType(map, JSON::value_t::object);
    if (!map.contains(key)) {
        throw JSONError("Expected JSON object to contain key '%s' but it doesn't", key);
    }
    return map[key];
}

std::optional<JSON> optionalValueAt(const JSON & map, const std::string & key)
{
    ensureType(map, JSON::value_t::object);
    if (!map.contains(key) || map[key].is_null()) {
        return std::nullopt;
    }
    return map[key];
}

const std::string & getString(const JSON & value)
{
    return ensureType(value, JSON::value_t::string).get_ref<const std::string &>();
}

uint64_t getUnsigned(const JSON & value)
{
    if (!value.is_number_unsigned()) {
        throw JSONError("Expected JSON value to be an unsigned integer but it is of type '%s'", value.type_name());
    }
    return value.get<uint64_t>();
}

}
