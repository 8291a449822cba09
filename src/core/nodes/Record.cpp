#include "core/nodes/Record.hpp"

namespace premis {

const char* kindName(RecordKind kind) {
  switch (kind) {
    case RecordKind::Object: return "object";
    case RecordKind::Event:  return "event";
    case RecordKind::Agent:  return "agent";
    case RecordKind::Rights: return "rights";
  }
  return "unknown";
}

} // namespace premis
