#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <biovoltron/file_io/fasta.hpp>
#include <boost/type_index.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "probescan/sequence/validator.hpp"
#include "probescan/utility/file_io/parse.hpp"

namespace probescan {

namespace fs = std::filesystem;
namespace bio = biovoltron;

template <class R>
auto read_records(std::istream& fin) {
  auto records = std::vector<R>{};
  for (R r; fin >> r;) {
    records.emplace_back(std::move(r));
  }
  return records;
}

template <class R>
auto read_records(const fs::path& path) {
  auto fin = std::ifstream(path);
  if (!fin.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open file: {}", path.string()));
  }
  spdlog::debug("Read {} from \"{}\" ...",
                boost::typeindex::type_id_with_cvr<R>().pretty_name(),
                path.string());
  return read_records<R>(fin);
}

namespace detail {

inline auto first_fasta_target(
    const std::vector<bio::FastaRecord<false>>& records) {
  if (records.empty()) {
    throw EmptyInputError("no FASTA record found for target sequence");
  }
  if (records.size() > 1) {
    spdlog::warn("{} FASTA records found, only the first one ({}) is used",
                 records.size(), records.front().name);
  }
  spdlog::info("Target: {}", records.front().name);
  return make_target(records.front().seq);
}

}  // namespace detail

/**
 * @brief read the target from FASTA, only the first record is used
 * @throw EmptyInputError if there's no record
 */
inline auto read_fasta_target(std::istream& fin) {
  return detail::first_fasta_target(
      read_records<bio::FastaRecord<false>>(fin));
}

/* the whole stream is the target, whitespace and line breaks are ignored */
inline auto read_text_target(std::istream& fin) {
  auto text = std::string(std::istreambuf_iterator<char>(fin),
                          std::istreambuf_iterator<char>());
  return make_target(text);
}

/**
 * @brief read the target sequence from a FASTA or plain text file
 *
 * @param path the path of target
 * @return the normalized target
 * @throw std::runtime_error if the file can't be opened
 * @throw EmptyInputError, InvalidAlphabetError from `make_target`
 */
inline auto read_target(const fs::path& path) {
  spdlog::info("Read target from \"{}\" ...", path.string());
  if (parse_file_format(path) == FILE_FORMAT::FASTA) {
    return detail::first_fasta_target(
        read_records<bio::FastaRecord<false>>(path));
  }
  auto fin = std::ifstream(path);
  if (!fin.is_open()) {
    throw std::runtime_error(fmt::format("Cannot open file: {}", path.string()));
  }
  return read_text_target(fin);
}

}  // namespace probescan
