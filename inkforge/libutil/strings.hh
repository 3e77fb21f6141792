#pragma once
///@file
/// String helpers for argv building, config values and /proc parsing.

#include "inkforge/libutil/error.hh"
#include "inkforge/libutil/types.hh"

#include <cctype>
#include <limits>
#include <vector>

namespace inkforge {

/**
 * An `argv`/`envp` style array pointing into `ss`, terminated by a null
 * pointer. Valid only as long as `ss` is.
 */
std::vector<char *> stringsToCharPtrs(const Strings & ss);

/**
 * Split `s` at any of `separators`. Empty fields are dropped.
 */
template<class C> C tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

/**
 * Join `ss` with `sep` between elements.
 */
template<class C>
std::string concatStringsSep(const std::string_view sep, const C & ss)
{
    size_t size = 0;
    for (const auto & s : ss) size += sep.size() + std::string_view(s).size();
    std::string s;
    s.reserve(size);
    for (auto & i : ss) {
        if (s.size() != 0) s += sep;
        s += i;
    }
    return s;
}

/**
 * Join the results of `fn` over `iterable`.
 */
template<class C, class F>
std::string concatMapStringsSep(std::string_view separator, const C & iterable, F fn)
{
    std::vector<std::string> strings;
    strings.reserve(iterable.size());
    for (const auto & elem : iterable) {
        strings.push_back(fn(elem));
    }
    return concatStringsSep(separator, strings);
}

/**
 * Strip `whitespace` from both ends of `s`.
 */
std::string trim(std::string_view s, std::string_view whitespace = " \n\r\t");

/**
 * The whole of `s` as an `N`, or nullopt if it is not one (trailing
 * garbage, overflow, a sign on an unsigned type).
 */
template<class N>
std::optional<N> string2Int(const std::string_view s);

/**
 * Like string2Int(), but support an optional suffix 'K', 'M', 'G' or
 * 'T' denoting a binary unit prefix. Volume sizes and memory limits in
 * the builder configuration are written this way ("8G", "512M").
 */
template<class N>
N string2IntWithUnitPrefix(std::string_view s)
{
    N multiplier = 1;
    if (!s.empty()) {
        char u = std::toupper(*s.rbegin());
        if (std::isalpha(u)) {
            if (u == 'K') multiplier = 1ULL << 10;
            else if (u == 'M') multiplier = 1ULL << 20;
            else if (u == 'G') multiplier = 1ULL << 30;
            else if (u == 'T') multiplier = 1ULL << 40;
            else throw UsageError("invalid unit specifier '%1%'", u);
            s.remove_suffix(1);
        }
    }
    if (auto n = string2Int<N>(s)) {
        if (*n > std::numeric_limits<N>::max() / multiplier)
            throw UsageError("'%s' is too large", s);
        return *n * multiplier;
    }
    throw UsageError("'%s' is not an integer", s);
}

/**
 * Render a byte count with the largest binary unit suffix that
 * represents it exactly, the inverse of `string2IntWithUnitPrefix`.
 */
std::string showByteSize(uint64_t bytes);

/**
 * Single-quote `s` for a POSIX shell. Only used to make logged command
 * lines copy-pasteable.
 */
std::string shellEscape(const std::string_view s);

}
