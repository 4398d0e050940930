#include "record.hpp"

namespace eventship::record {

const char* EventTypeName(EventType type) {
  switch (type) {
    case EventType::kSuccess:
      return "Success";
    case EventType::kError:
      return "Error";
    case EventType::kWarning:
      return "Warning";
    case EventType::kInformation:
      return "Information";
    case EventType::kAuditSuccess:
      return "Audit Success";
    case EventType::kAuditFailure:
      return "Audit Failure";
  }
  return "Unknown";
}

} // namespace eventship::record
