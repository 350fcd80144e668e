#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "probescan/format/match_record.hpp"
#include "probescan/format/probe.hpp"
#include "probescan/sequence/reverse_complement.hpp"
#include "probescan/sequence/validator.hpp"

namespace probescan {

/**
 * @brief find every occurrence of `needle` in `target`, occurrences may
 * overlap each other
 *
 * @param target the sequence to search in
 * @param needle the sequence to search for
 * @return 0-based start positions in ascending order, empty if `needle` is
 * empty
 */
inline auto find_occurrences(std::string_view target, std::string_view needle) {
  auto positions = std::vector<std::size_t>{};
  if (needle.empty()) {
    return positions;
  }
  /* move one base forward after a hit, not the whole needle */
  for (auto pos = target.find(needle); pos != std::string_view::npos;
       pos = target.find(needle, pos + 1)) {
    positions.emplace_back(pos);
  }
  return positions;
}

namespace detail {

inline auto is_upper(std::string_view seq) noexcept {
  return std::ranges::none_of(
      seq, [](auto c) { return std::islower(static_cast<unsigned char>(c)); });
}

inline auto append_matches(std::vector<MatchRecord>& records,
                           const std::string& probe_name,
                           const Orientation orientation,
                           std::string_view target, std::string_view needle) {
  for (const auto pos : find_occurrences(target, needle)) {
    records.emplace_back(MatchRecord{
        .probe_name = probe_name,
        .orientation = orientation,
        .start = pos + 1,
        .end = pos + needle.size(),
        .matched_text = std::string(target.substr(pos, needle.size())),
    });
  }
}

}  // namespace detail

/**
 * @brief Search one probe against the target on both strands.
 * @details Forward matches come first, then reverse complement matches, each
 * in ascending position. A palindromic probe reports the same positions under
 * both orientations. If the reverse complement cannot be computed, only
 * forward matches are reported.
 *
 * @param probe the probe
 * @param target the target sequence, expected to be validated already
 * @return match records of this probe
 */
inline auto find_matches(const Probe& probe, std::string_view target) {
  auto records = std::vector<MatchRecord>{};
  if (probe.empty()) {
    return records;
  }

  /* callers normally pass an uppercase target, avoid the copy in that case */
  auto upper_target = std::optional<std::string>{};
  if (!detail::is_upper(target)) {
    upper_target = normalize(target);
    target = *upper_target;
  }

  detail::append_matches(records, probe.name(), Orientation::Forward, target,
                         probe.seq());

  auto rc = reverse_complement(probe.seq());
  if (!rc.has_value()) {
    spdlog::debug("Probe {} has invalid bases, skip reverse complement search",
                  probe.name());
    return records;
  }
  detail::append_matches(records, probe.name(), Orientation::ReverseComplement,
                         target, *rc);
  return records;
}

}  // namespace probescan
