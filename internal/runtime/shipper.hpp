#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/tailing/tailing_engine.hpp"

namespace eventship::runtime {

/*
  Owns one tailing engine per configured provider and runs each on its own
  thread. Engines share no mutable state apart from the thread-safe
  publisher and checkpoint store.
*/
class Shipper {
 public:
  explicit Shipper(std::vector<std::unique_ptr<tailing::TailingEngine>> engines);
  ~Shipper();

  Shipper(const Shipper&)            = delete;
  Shipper& operator=(const Shipper&) = delete;

  void Start();

  // Requests every engine to stop, then joins them. Checkpoints are flushed.
  void Stop();

  // False once every engine has failed.
  bool Running() const;

  // Providers whose engine gave up, with the reason.
  std::vector<std::pair<std::string, std::string>> Failures() const;

  const std::vector<std::unique_ptr<tailing::TailingEngine>>& engines() const {
    return engines_;
  }

 private:
  std::vector<std::unique_ptr<tailing::TailingEngine>> engines_;
  bool                                                 started_ = false;
};

} // namespace eventship::runtime
