#pragma once

#include <iostream>
#include <string>
#include <string_view>

#include <boost/describe.hpp>

namespace probescan {

/* which strand of the probe hit the target */
enum class Orientation { Forward, ReverseComplement };

BOOST_DESCRIBE_ENUM(Orientation, Forward, ReverseComplement);

/**
 * @brief the label used in tables, 5'->3' for the probe itself and 3'->5' for
 * its reverse complement
 */
constexpr auto to_label(const Orientation o) noexcept -> std::string_view {
  return o == Orientation::Forward ? "5′→3′" : "3′→5′";
}

inline auto to_string(const Orientation o) -> std::string {
  return boost::describe::enum_to_string(o, "Unknown");
}

/**
 * @brief One occurrence of a probe (or its reverse complement) in the target.
 * Positions are 1-based and inclusive.
 */
struct MatchRecord {
  std::string probe_name;
  Orientation orientation;
  std::size_t start;
  std::size_t end;
  /* equals target[start - 1, end) */
  std::string matched_text;

  auto len() const noexcept { return end - start + 1; }

  bool operator==(const MatchRecord&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const MatchRecord& r) {
  os << r.probe_name << '\t' << to_label(r.orientation) << '\t' << r.start
     << '\t' << r.end << '\t' << r.matched_text;
  return os;
}

}  // namespace probescan
