#include "event.hpp"

#include <sstream>

namespace eventship::model {

std::string ToString(const Event& event) {
  std::ostringstream out;
  out << "EventID=" << event.event_id << " Type=" << record::EventTypeName(event.event_type) << " Source=" << event.source_name
      << " Message=" << event.message;
  return out.str();
}

} // namespace eventship::model
