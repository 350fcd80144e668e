#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "probescan/sequence/validator.hpp"

namespace probescan {

/**
 * @brief A named probe sequence. The sequence is stored in uppercase and the
 * probe is not modified after construction.
 * @note Probe doesn't validate the alphabet, this is done by the loader which
 * reports the invalid ones.
 */
class Probe {
 public:
  Probe(std::string name, std::string_view seq)
      : name_(std::move(name)), seq_(normalize(seq)) {}

  auto name() const noexcept -> const std::string& { return name_; }

  auto seq() const noexcept -> const std::string& { return seq_; }

  auto empty() const noexcept { return seq_.empty(); }

  bool operator==(const Probe&) const = default;

 private:
  /* caller defined identifier, not required to be unique */
  std::string name_;

  /* sequence over {A, T, G, C} */
  std::string seq_;
};

}  // namespace probescan
