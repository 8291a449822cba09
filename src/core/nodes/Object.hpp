#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "core/record/Identifier.hpp"

namespace premis {

struct Fixity {
  std::string algorithm;
  std::string digest;
  std::optional<std::string> originator;
};

struct Format {
  std::string name;
  std::optional<std::string> version;
};

struct ObjectCharacteristics {
  int compositionLevel = 0;
  std::vector<Fixity> fixity;
  std::optional<std::int64_t> size;
  std::vector<Format> formats;
};

struct Storage {
  std::string contentLocationType;
  std::string contentLocationValue;
  std::optional<std::string> storageMedium;
};

struct Object {
  IdentifierList identifiers;
  std::string category; // file, representation, bitstream, intellectual entity
  std::vector<ObjectCharacteristics> characteristics;
  std::optional<std::string> originalName;
  std::vector<Storage> storage;
  IdentifierList linkingEventIdentifiers;
  IdentifierList linkingRightsStatementIdentifiers;
};

inline bool operator==(const Fixity& a, const Fixity& b) {
  return std::tie(a.algorithm, a.digest, a.originator) ==
         std::tie(b.algorithm, b.digest, b.originator);
}
inline bool operator==(const Format& a, const Format& b) {
  return std::tie(a.name, a.version) == std::tie(b.name, b.version);
}
inline bool operator==(const ObjectCharacteristics& a, const ObjectCharacteristics& b) {
  return std::tie(a.compositionLevel, a.fixity, a.size, a.formats) ==
         std::tie(b.compositionLevel, b.fixity, b.size, b.formats);
}
inline bool operator==(const Storage& a, const Storage& b) {
  return std::tie(a.contentLocationType, a.contentLocationValue, a.storageMedium) ==
         std::tie(b.contentLocationType, b.contentLocationValue, b.storageMedium);
}
inline bool operator==(const Object& a, const Object& b) {
  return std::tie(a.identifiers, a.category, a.characteristics, a.originalName,
                  a.storage, a.linkingEventIdentifiers, a.linkingRightsStatementIdentifiers) ==
         std::tie(b.identifiers, b.category, b.characteristics, b.originalName,
                  b.storage, b.linkingEventIdentifiers, b.linkingRightsStatementIdentifiers);
}
inline bool operator!=(const Object& a, const Object& b) { return !(a == b); }

inline const IdentifierList& identifiersOf(const Object& o) { return o.identifiers; }

} // namespace premis
