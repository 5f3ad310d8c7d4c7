#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <map>
#include <vector>

namespace charx {

typedef std::list<std::string> Strings;

/**
 * Ordered string -> string map with a transparent comparator, so
 * lookups by `std::string_view` or `const char *` don't allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Ordered string set with a transparent comparator.
 *
 * @see StringMap
 */
using StringSet = std::set<std::string, std::less<>>;

typedef std::vector<std::pair<std::string, std::string>> Headers;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;

} // namespace charx
