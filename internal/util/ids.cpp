#include "ids.hpp"

#include <random>

namespace meshdeploy::util {

std::string RandomHexId(std::size_t length) {
  static constexpr char                kHex[] = "0123456789abcdef";
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(kHex[rng() & 0x0F]);
  }
  return out;
}

std::string ShellQuote(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

} // namespace meshdeploy::util
