#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <rapidcsv.h>
#include <boost/describe.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "probescan/format/probe.hpp"
#include "probescan/sequence/validator.hpp"

namespace probescan {

namespace fs = std::filesystem;

/* why a row of the probe table is not used */
enum class ProbeIssue { InvalidAlphabet, EmptySequence, EmptyName, MissingColumn };

BOOST_DESCRIBE_ENUM(ProbeIssue, InvalidAlphabet, EmptySequence, EmptyName,
                    MissingColumn);

inline auto to_string(const ProbeIssue issue) -> std::string {
  return boost::describe::enum_to_string(issue, "Unknown");
}

struct RejectedProbe {
  /* 1-based row in the table, the header row counts */
  std::size_t row;
  std::string name;
  /* the sequence as given */
  std::string seq;
  ProbeIssue issue;

  bool operator==(const RejectedProbe&) const = default;
};

struct ProbeTable {
  /* valid probes in upload order */
  std::vector<Probe> probes;
  std::vector<RejectedProbe> rejected;
};

namespace detail {

inline auto trim(std::string_view s) {
  auto is_space = [](auto c) { return std::isspace(static_cast<unsigned char>(c)); };
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return std::string(s);
}

inline auto to_lower(std::string s) {
  std::ranges::for_each(s, [](auto& c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return s;
}

/**
 * @brief the first row is a header if the first or second cell contains one
 * of the header keywords
 */
inline auto is_header(const std::vector<std::string>& row) {
  constexpr auto keywords =
      std::array<std::string_view, 5>{"probe", "name", "sequence", "id", "label"};
  auto has_keyword = [&](const std::string& cell) {
    auto lower = to_lower(cell);
    return std::ranges::any_of(keywords, [&](auto k) {
      return lower.find(k) != std::string::npos;
    });
  };
  if (row.empty()) {
    return false;
  }
  return has_keyword(row[0]) || (row.size() > 1 && has_keyword(row[1]));
}

inline auto add_row(ProbeTable& table, const std::size_t row_id,
                    std::vector<std::string> row) {
  std::ranges::for_each(row, [](auto& cell) { cell = trim(cell); });
  if (std::ranges::all_of(row, [](auto& cell) { return cell.empty(); })) {
    return;
  }
  auto reject = [&](ProbeIssue issue) {
    table.rejected.emplace_back(RejectedProbe{
        .row = row_id,
        .name = row[0],
        .seq = row.size() > 1 ? row[1] : std::string{},
        .issue = issue,
    });
  };
  if (row.size() < 2) {
    reject(ProbeIssue::MissingColumn);
  } else if (row[0].empty()) {
    reject(ProbeIssue::EmptyName);
  } else if (row[1].empty()) {
    reject(ProbeIssue::EmptySequence);
  } else if (!is_valid(row[1])) {
    reject(ProbeIssue::InvalidAlphabet);
  } else {
    table.probes.emplace_back(std::move(row[0]), row[1]);
  }
}

}  // namespace detail

/**
 * @brief Read probes from a CSV table. The first column is the probe name and
 * the second one is the sequence, other columns are ignored. An optional
 * header row is detected by its content.
 *
 * @param fin the CSV stream
 * @return valid probes and the rejected rows
 * @throw std::runtime_error if the table has no row
 */
inline auto read_probes(std::istream& fin) {
  auto doc = rapidcsv::Document(fin, rapidcsv::LabelParams(-1, -1),
                                rapidcsv::SeparatorParams(',', true),
                                rapidcsv::ConverterParams(),
                                rapidcsv::LineReaderParams(false, '#', true));
  const auto rows = doc.GetRowCount();
  if (rows == 0) {
    throw std::runtime_error("probe table is empty");
  }
  auto table = ProbeTable{};
  for (auto i = 0u; i < rows; i++) {
    auto row = doc.GetRow<std::string>(i);
    if (i == 0 && detail::is_header(row)) {
      continue;
    }
    detail::add_row(table, i + 1, std::move(row));
  }
  return table;
}

inline auto read_probes(const fs::path& path) {
  auto fin = std::ifstream(path);
  if (!fin.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open file: {}", path.string()));
  }
  spdlog::info("Read probes from \"{}\" ...", path.string());
  auto table = read_probes(fin);
  spdlog::info("Loaded {} valid probe(s), rejected {}", table.probes.size(),
               table.rejected.size());
  return table;
}

/**
 * @brief log the rejected rows, at most `max_shown` of them are listed
 */
inline auto report_rejected(const ProbeTable& table,
                            const std::size_t max_shown = 5) {
  if (table.rejected.empty()) {
    return;
  }
  spdlog::warn("Rejected {} probe row(s):", table.rejected.size());
  for (auto i = 0u; i < std::min(max_shown, table.rejected.size()); i++) {
    const auto& r = table.rejected[i];
    spdlog::warn("  row {}: {}: {} ({})", r.row, r.name, r.seq,
                 to_string(r.issue));
  }
  if (table.rejected.size() > max_shown) {
    spdlog::warn("  ... and {} more", table.rejected.size() - max_shown);
  }
}

}  // namespace probescan
