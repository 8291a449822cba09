#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace premis {

// (identifierType, identifierValue) pair. Compared exactly, no normalization.
struct Identifier {
  std::string type;
  std::string value;

  Identifier() = default;
  Identifier(std::string t, std::string v) : type(std::move(t)), value(std::move(v)) {}

  std::string toString() const { return type + ":" + value; }
};

inline bool operator==(const Identifier& a, const Identifier& b) {
  return a.type == b.type && a.value == b.value;
}
inline bool operator!=(const Identifier& a, const Identifier& b) { return !(a == b); }

struct IdentifierHash {
  std::size_t operator()(const Identifier& id) const {
    std::size_t h = std::hash<std::string>{}(id.type);
    // boost::hash_combine constant
    h ^= std::hash<std::string>{}(id.value) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

using IdentifierList = std::vector<Identifier>;

} // namespace premis
