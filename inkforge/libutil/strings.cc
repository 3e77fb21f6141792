#include "inkforge/libutil/strings.hh"

#include <charconv>
#include <limits>

namespace inkforge {

std::vector<char *> stringsToCharPtrs(const Strings & ss)
{
    std::vector<char *> res;
    for (auto & s : ss) res.push_back(const_cast<char *>(s.c_str()));
    res.push_back(0);
    return res;
}

template<class C> C tokenizeString(std::string_view s, std::string_view separators)
{
    C result;
    auto pos = s.find_first_not_of(separators, 0);
    while (pos != std::string_view::npos) {
        auto end = s.find_first_of(separators, pos + 1);
        if (end == std::string_view::npos) end = s.size();
        result.insert(result.end(), std::string(s, pos, end - pos));
        pos = s.find_first_not_of(separators, end);
    }
    return result;
}

template Strings tokenizeString(std::string_view s, std::string_view separators);
template StringSet tokenizeString(std::string_view s, std::string_view separators);
template std::vector<std::string> tokenizeString(std::string_view s, std::string_view separators);

std::string trim(std::string_view s, std::string_view whitespace)
{
    auto i = s.find_first_not_of(whitespace);
    if (i == s.npos) return "";
    auto j = s.find_last_not_of(whitespace);
    return std::string(s, i, j == s.npos ? j : j - i + 1);
}

template<class N>
std::optional<N> string2Int(const std::string_view s)
{
    if (s.empty()) return std::nullopt;
    if (s[0] == '-' && !std::numeric_limits<N>::is_signed)
        return std::nullopt;
    N n;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || end != s.data() + s.size())
        return std::nullopt;
    return n;
}

template std::optional<int> string2Int<int>(std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(std::string_view s);
template std::optional<long> string2Int<long>(std::string_view s);
template std::optional<unsigned long> string2Int<unsigned long>(std::string_view s);
template std::optional<long long> string2Int<long long>(std::string_view s);
template std::optional<unsigned long long> string2Int<unsigned long long>(std::string_view s);

std::string showByteSize(uint64_t bytes)
{
    static constexpr std::pair<char, int> units[] = {{'T', 40}, {'G', 30}, {'M', 20}, {'K', 10}};
    if (bytes != 0) {
        for (auto [suffix, shift] : units) {
            if (bytes % (1ULL << shift) == 0) {
                return std::to_string(bytes >> shift) + suffix;
            }
        }
    }
    return std::to_string(bytes);
}

std::string shellEscape(const std::string_view s)
{
    std::string r;
    r.reserve(s.size() + 2);
    r += "'";
    for (auto & i : s) {
        if (i == '\'') {
            // `I didn't know` becomes `'I didn'\''t know'`.
            r += "'\\''";
        } else {
            r += i;
        }
    }

    r += '\'';
    return r;
}

}
