#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// A pool was asked for more experiences than it holds.
class UnderflowError : public std::runtime_error {
public:
  explicit UnderflowError(const std::string &what)
      : std::runtime_error(what) {}
};

// Construction parameters that can never work.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Internal bookkeeping went wrong; continuing would corrupt training data.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(const std::string &what)
      : std::logic_error(what) {}
};

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string &what) : std::runtime_error(what) {}
};

#endif // ERRORS_HPP
