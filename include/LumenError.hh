#pragma once

#include <stdexcept>
#include <string>

namespace Lumen {
  // malformed construction input, reported before any rendering starts
  class ConfigError : public std::invalid_argument {
  public:
    explicit ConfigError(const std::string &what)
        : std::invalid_argument(what) {}
  };

  // should never happen with sane geometry and a sane random source
  class InternalFault : public std::logic_error {
  public:
    explicit InternalFault(const std::string &what)
        : std::logic_error(what) {}
  };
} // namespace Lumen
