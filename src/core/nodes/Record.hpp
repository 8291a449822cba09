#pragma once
#include <cstddef>
#include <type_traits>
#include <variant>

#include "core/nodes/Agent.hpp"
#include "core/nodes/Event.hpp"
#include "core/nodes/Object.hpp"
#include "core/nodes/Rights.hpp"

namespace premis {

enum class RecordKind { Object, Event, Agent, Rights };

using Record = std::variant<Object, Event, Agent, Rights>;

// kindOf() maps the variant index straight onto RecordKind.
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(RecordKind::Object), Record>, Object>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(RecordKind::Event), Record>, Event>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(RecordKind::Agent), Record>, Agent>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(RecordKind::Rights), Record>, Rights>);
static_assert(std::variant_size_v<Record> == 4);

inline IdentifierList identifiersOf(const Record& r) {
  return std::visit([](const auto& node) { return IdentifierList(identifiersOf(node)); }, r);
}

inline RecordKind kindOf(const Record& r) { return static_cast<RecordKind>(r.index()); }

const char* kindName(RecordKind kind);

} // namespace premis
