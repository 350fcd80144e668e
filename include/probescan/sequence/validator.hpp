#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

#include <biovoltron/utility/istring.hpp>
#include <fmt/format.h>

namespace probescan {

namespace bio = biovoltron;

/* the sequence contains a character outside {A, T, G, C} */
class InvalidAlphabetError : public std::invalid_argument {
 public:
  InvalidAlphabetError(const std::size_t pos, const char base)
      : std::invalid_argument(fmt::format(
            "invalid base '{}' at position {}, only A, T, G, C are allowed",
            base, pos + 1)),
        pos(pos),
        base(base) {}

  /* 0-based position of the offending character */
  std::size_t pos;
  char base;
};

/* the sequence is empty after whitespace stripping */
class EmptyInputError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

inline auto is_valid_base(const char c) noexcept {
  const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return bio::Codec::is_valid(upper);
}

/**
 * @brief check that every base of `seq` is one of A, T, G, C (case
 * insensitive)
 * @note the empty sequence is valid, reject it separately if needed
 */
inline auto is_valid(std::string_view seq) noexcept {
  return std::ranges::all_of(seq, [](auto c) { return is_valid_base(c); });
}

/**
 * @brief find the first base which is not one of A, T, G, C
 * @return the 0-based position, or `std::nullopt` if `seq` is valid
 */
inline auto first_invalid_base(std::string_view seq)
    -> std::optional<std::size_t> {
  auto it = std::ranges::find_if_not(seq,
                                     [](auto c) { return is_valid_base(c); });
  if (it == seq.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::ranges::distance(seq.begin(), it));
}

inline auto normalize(std::string_view seq) {
  auto upper = std::string(seq);
  std::ranges::for_each(upper, [](auto& c) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return upper;
}

inline auto strip_whitespace(std::string_view text) {
  auto stripped = std::string{};
  stripped.reserve(text.size());
  std::ranges::copy_if(text, std::back_inserter(stripped), [](auto c) {
    return !std::isspace(static_cast<unsigned char>(c));
  });
  return stripped;
}

/**
 * @brief turn raw user text into a target sequence: whitespace is removed and
 * bases are uppercased
 *
 * @param raw text pasted by user or read from a file
 * @return the normalized target
 * @throw EmptyInputError if nothing is left after stripping
 * @throw InvalidAlphabetError if a base is not one of A, T, G, C
 */
inline auto make_target(std::string_view raw) {
  auto target = normalize(strip_whitespace(raw));
  if (target.empty()) {
    throw EmptyInputError("target sequence is empty");
  }
  if (auto pos = first_invalid_base(target); pos.has_value()) {
    throw InvalidAlphabetError(*pos, target[*pos]);
  }
  return target;
}

}  // namespace probescan
