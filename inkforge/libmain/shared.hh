#pragma once
///@file

#include "inkforge/libutil/types.hh"

#include <functional>

namespace inkforge {

/**
 * Process-wide setup every inkforge program runs first: signal handling,
 * the KJ reserved signal and the umask.
 */
void initInkforge();

/**
 * Fetch the argument of option `opt`, failing with a `UsageError` if the
 * command line ends before it.
 */
std::string getArg(const std::string & opt,
    Strings::iterator & i, const Strings::iterator & end);

void printVersion(const std::string & programName);

/**
 * Run `fun`, turning errors into messages and an exit status.
 */
int handleExceptions(const std::string & programName, std::function<int()> fun);

}
