#pragma once
///@file

#include <string>
#include <string_view>

namespace inkforge {

enum class StandardOutputStream {
    Stdout = 1,
    Stderr = 2,
};

/**
 * Determine whether the output is a real terminal (i.e. not dumb, not a pipe).
 */
bool isOutputARealTerminal(StandardOutputStream fileno);

/**
 * Determine whether ANSI escape sequences are appropriate for the
 * given output, honouring `NO_COLOR` and `CLICOLOR_FORCE`.
 */
bool shouldANSI(StandardOutputStream fileno = StandardOutputStream::Stderr);

/**
 * Remove ANSI escape sequences from `s`. Color sequences (`\e[...m`) are
 * kept unless `filterAll` is set; tabs are expanded to spaces.
 */
std::string filterANSIEscapes(std::string_view s, bool filterAll = false);

}
