#pragma once
/**
 * @file
 *
 * Template implementations (as opposed to mere declarations) of settings.
 *
 * This file is an example of the "impl.hh" pattern. Only translation units
 * that explicitly instantiate `BaseSetting<T>` for a type of their own need
 * to include it.
 */

#include "inkforge/libutil/config.hh"
#include "inkforge/libutil/strings.hh"

#include <type_traits>

namespace inkforge {

template<typename T>
T BaseSetting<T>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    if (auto n = string2Int<T>(str))
        return *n;
    else
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    return std::to_string(value);
}

template<typename T>
void BaseSetting<T>::appendOrSet(T newValue, bool append, const ApplyConfigOptions & options)
{
    static_assert(
        !trait::appendable,
        "using default `appendOrSet` implementation with an appendable type");
    assert(!append);

    value = std::move(newValue);
}

template<typename T>
void BaseSetting<T>::set(const std::string & str, bool append, const ApplyConfigOptions & options)
{
    appendOrSet(parse(str, options), append, options);
    overridden = true;
}

template<typename T>
bool BaseSetting<T>::isAppendable()
{
    return trait::appendable;
}

}
