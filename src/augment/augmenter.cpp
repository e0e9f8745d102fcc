#include "augment/augmenter.hpp"

#include <spdlog/spdlog.h>

namespace swarm::augment {

std::optional<std::string> FunctionAugmenter::augment(const std::string &role, const std::string &instructions,
                                                      const std::string &prompt) const {
  if (!fn_) return std::nullopt;
  return fn_(role, instructions, prompt);
}

std::optional<std::string> try_augment(const Augmenter &augmenter, const std::string &role, const std::string &instructions,
                                       const std::string &prompt) {
  try {
    auto text = augmenter.augment(role, instructions, prompt);
    if (text && !text->empty()) {
      return text;
    }
  } catch (const std::exception &e) {
    spdlog::warn("[Swarm] Augmentation for '{}' failed: {}", role, e.what());
  }
  return std::nullopt;
}

}  // namespace swarm::augment
