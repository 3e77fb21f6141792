#pragma once
///@file

#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <stdint.h> // IWYU pragma: keep

namespace inkforge {

/**
 * Command lines and other ordered word lists.
 */
typedef std::list<std::string> Strings;
typedef std::set<std::string> StringSet;
/**
 * Environments and stage variables; ordered so records and logs are stable.
 */
typedef std::map<std::string, std::string> StringMap;

/**
 * Paths are plain strings, always absolute once they leave the config layer.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;

}
