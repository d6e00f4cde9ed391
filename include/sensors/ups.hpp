#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "model/ups_sample.hpp"

namespace ups_sentinel::sensors {

class UpsSource {
 public:
  // Never fabricates a sample: any read problem comes back as a poll_failure.
  virtual model::poll_result poll() = 0;
  virtual ~UpsSource() = default;
};

struct UpscOptions {
  std::string binary{"upsc"};
  std::string ups_name{"ups@localhost"};
  std::chrono::milliseconds timeout{2000};
};

// Reads NUT variables through `upsc <ups>`.
class UpscSource : public UpsSource {
 public:
  explicit UpscSource(UpscOptions options);

  model::poll_result poll() override;

 private:
  UpscOptions options_;
};

// Maps a NUT ups.status token list ("OL CHRG", "OB DISCHRG LB", ...) to a status.
model::ups_status parse_ups_status(const std::string& tokens);

// Parses `key: value` lines into a sample stamped with timestamp_ms.
model::poll_result parse_upsc_output(const std::string& output, std::int64_t timestamp_ms);

std::unique_ptr<UpsSource> make_upsc_source(UpscOptions options);

}  // namespace ups_sentinel::sensors
