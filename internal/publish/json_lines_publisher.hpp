#pragma once

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

#include <google/protobuf/message.h>

#include "internal/publish/publisher.hpp"

namespace eventship::v1 {
class Event;
class Discontinuity;
} // namespace eventship::v1

namespace eventship::publish {

/*
  Writes one JSON object per line: {"event": {...}} or {"discontinuity": {...}}.

  A batch is flushed before Publish returns true.
*/
class JsonLinesPublisher final : public Publisher {
 public:
  // Appends to `path`; empty or "-" writes to stdout. Throws util::IoError.
  explicit JsonLinesPublisher(const std::string& path, bool verbose = false);

  // Writes to a caller-owned stream that must outlive the publisher.
  JsonLinesPublisher(std::ostream& out, bool verbose);

  bool Publish(const std::vector<model::Event>& events) override;
  bool PublishDiscontinuity(const model::Discontinuity& marker) override;

 private:
  bool WriteLine(const google::protobuf::Message& message);

  std::ofstream file_;
  std::ostream* out_     = nullptr;
  bool          verbose_ = false;
  std::mutex    mutex_;
};

void ToProto(const model::Event& event, eventship::v1::Event* out);
void ToProto(const model::Discontinuity& marker, eventship::v1::Discontinuity* out);

} // namespace eventship::publish
