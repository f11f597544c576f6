#pragma once

#include <cstddef>
#include <string>

namespace meshdeploy::util {

// Random lowercase hex identifier, used for deployment ids and tracked resources.
std::string RandomHexId(std::size_t length = 8);

// Wraps `value` in single quotes for a POSIX shell, escaping embedded quotes.
std::string ShellQuote(const std::string& value);

} // namespace meshdeploy::util
