#pragma once
#include <stdexcept>
#include <string>

namespace af {
namespace acsf {

// Malformed construction arguments: wrong shape, non-positive radius or capacity,
// bad lambda/zeta.
class InvalidConfig : public std::invalid_argument {
  public:
    explicit InvalidConfig(const std::string &what) : std::invalid_argument(what) {}
};

// Attempted mutation of a descriptor configuration after it was built.
class ConfigLocked : public std::logic_error {
  public:
    explicit ConfigLocked(const std::string &what) : std::logic_error(what) {}
};

// Structure holds an undeclared atomic number, or a coincident atom pair
// that makes an angle undefined.
class UnknownType : public std::invalid_argument {
  public:
    explicit UnknownType(const std::string &what) : std::invalid_argument(what) {}
};

// Structure has more atoms than the configured capacity.
class TooManyAtoms : public std::length_error {
  public:
    explicit TooManyAtoms(const std::string &what) : std::length_error(what) {}
};

}  // namespace acsf
}  // namespace af
