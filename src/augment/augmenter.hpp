#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace swarm::augment {

// Optional generative capability. Returning nullopt means "nothing to add"
// and is always a valid answer.
class Augmenter {
 public:
  virtual ~Augmenter() = default;

  virtual std::optional<std::string> augment(const std::string &role, const std::string &instructions, const std::string &prompt) const = 0;
};

// No generative backend available
class NullAugmenter : public Augmenter {
 public:
  std::optional<std::string> augment(const std::string &, const std::string &, const std::string &) const override {
    return std::nullopt;
  }
};

// Adapts a callable; used to plug in backends and fakes
class FunctionAugmenter : public Augmenter {
 public:
  using Fn = std::function<std::optional<std::string>(const std::string &role, const std::string &instructions, const std::string &prompt)>;

  explicit FunctionAugmenter(Fn fn) : fn_(std::move(fn)) {}

  std::optional<std::string> augment(const std::string &role, const std::string &instructions, const std::string &prompt) const override;

 private:
  Fn fn_;
};

// Call `augmenter`, converting exceptions and empty text into nullopt
std::optional<std::string> try_augment(const Augmenter &augmenter, const std::string &role, const std::string &instructions,
                                       const std::string &prompt);

}  // namespace swarm::augment
