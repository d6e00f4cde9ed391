#include "model/aggregate.hpp"
#include "model/shutdown_event.hpp"
#include "model/ups_sample.hpp"

namespace ups_sentinel::model {

std::string_view to_string(const ups_status status) noexcept {
  switch (status) {
    case ups_status::ON_LINE:
      return "ON_LINE";
    case ups_status::ON_BATTERY:
      return "ON_BATTERY";
    case ups_status::OVERLOADED:
      return "OVERLOADED";
    case ups_status::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::string_view to_string(const poll_failure::kind reason) noexcept {
  switch (reason) {
    case poll_failure::kind::UNREACHABLE:
      return "unreachable";
    case poll_failure::kind::TIMEOUT:
      return "timeout";
    case poll_failure::kind::MALFORMED:
      return "malformed";
  }
  return "unreachable";
}

std::string_view to_string(const window w) noexcept {
  switch (w) {
    case window::ONE_MINUTE:
      return "1m";
    case window::ONE_HOUR:
      return "1h";
    case window::ONE_DAY:
      return "24h";
    case window::SEVEN_DAYS:
      return "7d";
    case window::THIRTY_DAYS:
      return "30d";
  }
  return "1m";
}

std::string_view to_string(const shutdown_outcome outcome) noexcept {
  switch (outcome) {
    case shutdown_outcome::PENDING:
      return "pending";
    case shutdown_outcome::SUCCESS:
      return "success";
    case shutdown_outcome::FAILURE:
      return "failure";
    case shutdown_outcome::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

}  // namespace ups_sentinel::model
