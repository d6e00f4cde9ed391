#include "sensors/ups.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/process.hpp"
#include "core/timestamp.hpp"

namespace ups_sentinel::sensors {

namespace {

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r");
  return value.substr(begin, end - begin + 1);
}

bool parse_float(const std::string& value, float& out) noexcept {
  if (value.empty()) {
    return false;
  }
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  const float parsed = std::strtof(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
    return false;
  }
  out = parsed;
  return true;
}

bool parse_int64(const std::string& value, std::int64_t& out) noexcept {
  const auto result = std::from_chars(value.data(), value.data() + value.size(), out);
  if (result.ec == std::errc{} && result.ptr == value.data() + value.size()) {
    return true;
  }
  // Some drivers report runtime with a fractional part.
  float parsed = 0.0F;
  if (!parse_float(value, parsed)) {
    return false;
  }
  out = static_cast<std::int64_t>(parsed);
  return true;
}

model::poll_failure malformed(std::string detail) {
  return model::poll_failure{model::poll_failure::kind::MALFORMED, std::move(detail)};
}

std::string first_line(const std::string& text) {
  const auto newline = text.find('\n');
  return trim(newline == std::string::npos ? text : text.substr(0, newline));
}

}  // namespace

model::ups_status parse_ups_status(const std::string& tokens) {
  bool online = false;
  bool overloaded = false;

  std::istringstream stream(tokens);
  std::string token;
  while (stream >> token) {
    if (token == "OB") {
      return model::ups_status::ON_BATTERY;
    }
    if (token == "OVER") {
      overloaded = true;
    } else if (token == "OL") {
      online = true;
    }
  }

  if (overloaded) {
    return model::ups_status::OVERLOADED;
  }
  return online ? model::ups_status::ON_LINE : model::ups_status::UNKNOWN;
}

model::poll_result parse_upsc_output(const std::string& output, const std::int64_t timestamp_ms) {
  std::unordered_map<std::string, std::string> values;

  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    values[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
  }

  const auto status_it = values.find("ups.status");
  if (status_it == values.end()) {
    return malformed("missing ups.status");
  }

  const auto charge_it = values.find("battery.charge");
  if (charge_it == values.end()) {
    return malformed("missing battery.charge");
  }

  const auto load_it = values.find("ups.load");
  if (load_it == values.end()) {
    return malformed("missing ups.load");
  }

  model::ups_sample sample{};
  sample.timestamp_ms = timestamp_ms;
  sample.status = parse_ups_status(status_it->second);

  if (!parse_float(charge_it->second, sample.charge_pct) || sample.charge_pct < 0.0F || sample.charge_pct > 100.0F) {
    return malformed("battery.charge out of range: " + charge_it->second);
  }

  if (!parse_float(load_it->second, sample.load_pct) || sample.load_pct < 0.0F) {
    return malformed("ups.load invalid: " + load_it->second);
  }

  if (sample.status == model::ups_status::ON_BATTERY) {
    const auto runtime_it = values.find("battery.runtime");
    std::int64_t runtime_s = 0;
    if (runtime_it != values.end() && parse_int64(runtime_it->second, runtime_s) && runtime_s >= 0) {
      sample.runtime_estimate_s = runtime_s;
    }
  }

  return sample;
}

UpscSource::UpscSource(UpscOptions options) : options_(std::move(options)) {}

model::poll_result UpscSource::poll() {
  const std::vector<std::string> argv = {options_.binary, options_.ups_name};
  const core::ProcessResult result = core::run_process(argv, options_.timeout);
  const std::int64_t timestamp_ms = core::unix_timestamp_now_ms();

  if (!result.spawned) {
    return model::poll_failure{model::poll_failure::kind::UNREACHABLE, "failed to start " + options_.binary};
  }

  if (result.timed_out) {
    return model::poll_failure{model::poll_failure::kind::TIMEOUT,
                               options_.binary + " exceeded " + std::to_string(options_.timeout.count()) + "ms"};
  }

  if (result.exit_code != 0) {
    return model::poll_failure{model::poll_failure::kind::UNREACHABLE,
                               "exit " + std::to_string(result.exit_code) + ": " + first_line(result.output)};
  }

  return parse_upsc_output(result.output, timestamp_ms);
}

std::unique_ptr<UpsSource> make_upsc_source(UpscOptions options) {
  return std::make_unique<UpscSource>(std::move(options));
}

}  // namespace ups_sentinel::sensors
