#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <boost/program_options/errors.hpp>
#include <spdlog/spdlog.h>

namespace probescan {

namespace fs = std::filesystem;
namespace bpo = boost::program_options;

using namespace std::literals;

enum FILE_FORMAT {
  FASTA = 1 << 0,
  TXT = 1 << 1,
  CSV = 1 << 2,
  ERROR = 1 << 3
};

BOOST_DESCRIBE_ENUM(FILE_FORMAT, FASTA, TXT, CSV, ERROR);

inline int parse_file_format(const fs::path& p) {
  auto ext = p.extension().string();
  std::ranges::for_each(ext, [](auto& c) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  if (ext == ".fa" || ext == ".fasta" || ext == ".fna") {
    return FILE_FORMAT::FASTA;
  }
  if (ext == ".txt" || ext == ".seq") {
    return FILE_FORMAT::TXT;
  }
  if (ext == ".csv") {
    return FILE_FORMAT::CSV;
  }
  return FILE_FORMAT::ERROR;
}

/**
 * @brief check the extension of `p` is one of `accept_format`
 *
 * @param opt_name the option which gives `p`
 * @param p the path
 * @param accept_format bitwise OR of accepted `FILE_FORMAT`
 * @return the format of `p`
 * @throw bpo::validation_error if the format isn't accepted
 */
inline auto check_file_format(const std::string& opt_name, const fs::path& p,
                              const int accept_format) {
  auto format = parse_file_format(p);
  if (format & FILE_FORMAT::ERROR || !(format & accept_format)) {
    std::string msg;
    boost::mp11::mp_for_each<
        boost::describe::describe_enumerators<FILE_FORMAT>>([&](auto f) {
      if (accept_format & f.value) {
        if (!msg.empty()) {
          msg += ", ";
        }
        msg += "."s + f.name;
      }
    });
    std::ranges::for_each(msg, [](auto& c) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    spdlog::error("invalid file format: \"{}\", accepted format: \"{}\"",
                  p.extension().string(), msg);
    throw bpo::validation_error(bpo::validation_error::invalid_option_value,
                                opt_name);
  }
  return format;
}

inline auto make_path_checker(const std::string& opt_name) {
  return [opt_name](const fs::path& p) {
    if (!fs::exists(p)) {
      spdlog::error("{} does not exist", p.string());
      throw bpo::validation_error(bpo::validation_error::invalid_option_value,
                                  opt_name);
    }
  };
}

}  // namespace probescan
