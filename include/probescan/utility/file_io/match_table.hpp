#pragma once

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <rapidcsv.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "probescan/format/match_record.hpp"

namespace probescan {

namespace fs = std::filesystem;

namespace detail {

inline auto make_match_document(const std::vector<MatchRecord>& records) {
  auto doc = rapidcsv::Document(std::string{}, rapidcsv::LabelParams(0, -1),
                                rapidcsv::SeparatorParams(',', true));
  const auto column_name = std::vector<std::string>{
      "Probe Name", "Match Type", "Start Position", "End Position",
      "Matched Sequence"};
  for (auto i = 0u; i < column_name.size(); i++) {
    doc.SetColumnName(i, column_name[i]);
  }
  for (auto row = 0u; row < records.size(); row++) {
    const auto& r = records[row];
    doc.SetCell<std::string>(0, row, r.probe_name);
    doc.SetCell<std::string>(1, row, std::string(to_label(r.orientation)));
    doc.SetCell<std::string>(2, row, std::to_string(r.start));
    doc.SetCell<std::string>(3, row, std::to_string(r.end));
    doc.SetCell<std::string>(4, row, r.matched_text);
  }
  return doc;
}

}  // namespace detail

/* write records as CSV, one row per record in the given order */
inline auto save_matches(const std::vector<MatchRecord>& records,
                         std::ostream& os) {
  auto doc = detail::make_match_document(records);
  doc.Save(os);
}

/**
 * @brief write records into a CSV file
 * @throw std::runtime_error if `path` isn't a .csv file
 */
inline auto save_matches(const std::vector<MatchRecord>& records,
                         const fs::path& path) {
  if (path.extension() != ".csv") {
    throw std::runtime_error(
        fmt::format("Output file must be csv format: {}", path.string()));
  }
  auto doc = detail::make_match_document(records);
  spdlog::info("Write {} match(es) to {}", records.size(), path.string());
  doc.Save(path.string());
}

/* tab separated table with a header line, used when there's no output file */
inline auto print_matches(const std::vector<MatchRecord>& records,
                          std::ostream& os) {
  os << "Probe Name\tMatch Type\tStart Position\tEnd Position\tMatched "
        "Sequence\n";
  for (const auto& r : records) {
    os << r << '\n';
  }
}

}  // namespace probescan
