#pragma once
#include <stdexcept>
#include <string>

#include "core/record/Identifier.hpp"

namespace premis {

// Neither or both of {record lists, document path} were given.
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class DuplicateIdentifierError : public std::invalid_argument {
public:
  explicit DuplicateIdentifierError(Identifier id)
    : std::invalid_argument("duplicate identifier: " + id.toString()),
      identifier_(std::move(id)) {}

  const Identifier& identifier() const noexcept { return identifier_; }

private:
  Identifier identifier_;
};

class NodeNotFoundError : public std::out_of_range {
public:
  explicit NodeNotFoundError(const Identifier& id)
    : std::out_of_range("no node with identifier " + id.toString()) {}
};

class XmlError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace premis
