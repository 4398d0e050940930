#include "json_lines_publisher.hpp"

#include <google/protobuf/util/json_util.h>

#include <iostream>

#include "eventship/v1/event.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eventship::publish {

using observability::IntField;
using observability::StringField;

void ToProto(const model::Event& event, eventship::v1::Event* out) {
  out->set_provider(event.provider);
  out->set_record_number(event.record_number);
  out->set_event_id(event.event_id);
  out->set_event_type(static_cast<eventship::v1::EventType>(event.event_type));
  out->set_category(event.category);
  out->set_category_text(event.category_text);
  out->set_source_name(event.source_name);
  out->set_computer_name(event.computer_name);
  *out->mutable_time_generated() = util::ToProto(event.time_generated);
  *out->mutable_time_written()   = util::ToProto(event.time_written);
  out->set_message(event.message);
  out->set_resolution(event.resolution == message::ResolutionStatus::kResolved ? eventship::v1::RESOLUTION_RESOLVED
                                                                                : eventship::v1::RESOLUTION_FALLBACK);
  for (const auto& parameter : event.parameters) {
    out->add_parameters(parameter);
  }
  out->set_raw_data(std::string(event.raw_data.begin(), event.raw_data.end()));
}

void ToProto(const model::Discontinuity& marker, eventship::v1::Discontinuity* out) {
  out->set_provider(marker.provider);
  out->set_last_record_number(marker.last_record_number);
  out->set_previous_log_creation_us(marker.previous_log_creation_us);
  out->set_log_creation_us(marker.log_creation_us);
  out->set_reason(marker.reason);
  *out->mutable_detected_at() = util::ToProto(marker.detected_at);
}

JsonLinesPublisher::JsonLinesPublisher(const std::string& path, bool verbose) : verbose_(verbose) {
  if (path.empty() || path == "-") {
    out_ = &std::cout;
    return;
  }

  file_.open(path, std::ios::out | std::ios::app);
  if (!file_) {
    throw util::IoError("cannot open output " + path);
  }
  out_ = &file_;
}

JsonLinesPublisher::JsonLinesPublisher(std::ostream& out, bool verbose) : out_(&out), verbose_(verbose) {}

bool JsonLinesPublisher::WriteLine(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    EVENTSHIP_LOG_ERROR("event serialization failed", {StringField("error", std::string(status.message()))});
    return false;
  }

  *out_ << json << '\n';
  return static_cast<bool>(*out_);
}

bool JsonLinesPublisher::Publish(const std::vector<model::Event>& events) {
  std::lock_guard lock(mutex_);

  eventship::v1::StreamItem item;
  for (const auto& event : events) {
    ToProto(event, item.mutable_event());
    if (!WriteLine(item)) {
      out_->clear();
      return false;
    }
    if (verbose_) {
      EVENTSHIP_LOG_INFO(model::ToString(event), {StringField("provider", event.provider), IntField("record", event.record_number)});
    }
  }

  out_->flush();
  if (!*out_) {
    out_->clear();
    return false;
  }
  return true;
}

bool JsonLinesPublisher::PublishDiscontinuity(const model::Discontinuity& marker) {
  std::lock_guard lock(mutex_);

  eventship::v1::StreamItem item;
  ToProto(marker, item.mutable_discontinuity());
  if (!WriteLine(item)) {
    out_->clear();
    return false;
  }
  out_->flush();
  if (!*out_) {
    out_->clear();
    return false;
  }
  return true;
}

} // namespace eventship::publish
