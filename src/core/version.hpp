#pragma once

namespace swarm {

constexpr const char *kVersion = "0.1.0";
constexpr const char *kUserAgent = "support-swarm/0.1.0";

}  // namespace swarm
