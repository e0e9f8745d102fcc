#include "core/types.hpp"

namespace swarm {

std::string to_string(Urgency urgency) {
  switch (urgency) {
    case Urgency::Low:
      return "low";
    case Urgency::Medium:
      return "medium";
    case Urgency::High:
      return "high";
    case Urgency::Critical:
      return "critical";
  }
  return "unknown";
}

std::string to_string(Tone tone) {
  switch (tone) {
    case Tone::Friendly:
      return "friendly";
    case Tone::Formal:
      return "formal";
    case Tone::Direct:
      return "direct";
  }
  return "unknown";
}

std::string to_string(RouteTarget route) {
  switch (route) {
    case RouteTarget::None:
      return "none";
    case RouteTarget::HumanSupportLead:
      return "human_support_lead";
    case RouteTarget::SecuritySpecialist:
      return "security_specialist";
    case RouteTarget::BillingSpecialist:
      return "billing_specialist";
  }
  return "unknown";
}

std::optional<Urgency> parse_urgency(const std::string &value) {
  if (value == "low") return Urgency::Low;
  if (value == "medium") return Urgency::Medium;
  if (value == "high") return Urgency::High;
  if (value == "critical") return Urgency::Critical;
  return std::nullopt;
}

std::optional<Tone> parse_tone(const std::string &value) {
  if (value == "friendly") return Tone::Friendly;
  if (value == "formal") return Tone::Formal;
  if (value == "direct") return Tone::Direct;
  return std::nullopt;
}

std::optional<RouteTarget> parse_route_target(const std::string &value) {
  if (value == "none") return RouteTarget::None;
  if (value == "human_support_lead") return RouteTarget::HumanSupportLead;
  if (value == "security_specialist") return RouteTarget::SecuritySpecialist;
  if (value == "billing_specialist") return RouteTarget::BillingSpecialist;
  return std::nullopt;
}

int sla_minutes(Urgency urgency) {
  switch (urgency) {
    case Urgency::Critical:
      return 15;
    case Urgency::High:
      return 60;
    case Urgency::Medium:
      return 240;
    case Urgency::Low:
      return 1440;
  }
  return 1440;
}

}  // namespace swarm
