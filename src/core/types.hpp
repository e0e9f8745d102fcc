#pragma once

#include <optional>
#include <string>
#include <utility>

namespace swarm {

// Value-or-error carrier for boundary validation
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string message) {
    Result r;
    r.error = std::move(message);
    return r;
  }
};

enum class Urgency { Low, Medium, High, Critical };

enum class Tone { Friendly, Formal, Direct };

enum class RouteTarget { None, HumanSupportLead, SecuritySpecialist, BillingSpecialist };

std::string to_string(Urgency urgency);
std::string to_string(Tone tone);
std::string to_string(RouteTarget route);

std::optional<Urgency> parse_urgency(const std::string &value);
std::optional<Tone> parse_tone(const std::string &value);
std::optional<RouteTarget> parse_route_target(const std::string &value);

// SLA target in minutes for an urgency level.
// critical=15, high=60, medium=240, low=1440
int sla_minutes(Urgency urgency);

}  // namespace swarm
