#pragma once

#include <filesystem>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "probescan/utility/file_io/parse.hpp"

namespace probescan {

inline auto add_options(bpo::options_description& opts) -> void {
  opts.add_options()("help,h", "Show help message")
      // probe table
      ("probe,p",
       bpo::value<fs::path>()->required()->notifier(make_path_checker("probe")),
       "The path to the probe table(.csv), probe name in the first column "
       "and sequence in the second column")
      // target sequence from file
      ("target,r",
       bpo::value<fs::path>()->notifier(make_path_checker("target")),
       "The path to the target sequence(.fa, .fasta, .fna, .txt, .seq)")
      // target sequence from command line
      ("sequence,s", bpo::value<std::string>(),
       "The target sequence, used instead of --target")
      // output path of match table
      ("output_path,o", bpo::value<fs::path>(),
       "The output path of the match table(.csv), print to stdout if not "
       "given")
      // Max used threads
      ("thread,t", bpo::value<int>()->default_value(1),
       "The maximum number of threads")
      // progress bar
      ("progress", bpo::bool_switch()->default_value(false),
       "show a progress bar while searching")(
          "quiet,q", bpo::bool_switch()->default_value(false),
          "disable all log")
      // debug flag
      ("debug", bpo::bool_switch()->default_value(false),
       "enable debug mode (print verbose log to stderr)");
}

/**
 * @brief check the combination of parsed options
 * @throw bpo::validation_error on the first violated rule
 */
inline auto check_argument(const bpo::variables_map& vmap) -> void {
  check_file_format("probe", vmap["probe"].as<fs::path>(), FILE_FORMAT::CSV);
  if (vmap.contains("target") == vmap.contains("sequence")) {
    spdlog::error("Exactly one of --target and --sequence must be given");
    throw bpo::validation_error(bpo::validation_error::invalid_option_value,
                                "target");
  }
  if (vmap.contains("target")) {
    check_file_format("target", vmap["target"].as<fs::path>(),
                      FILE_FORMAT::FASTA | FILE_FORMAT::TXT);
  }
  if (vmap.contains("output_path")) {
    check_file_format("output_path", vmap["output_path"].as<fs::path>(),
                      FILE_FORMAT::CSV);
  }
  if (vmap["thread"].as<int>() < 1) {
    spdlog::error("Thread must be greater than 0");
    throw bpo::validation_error(bpo::validation_error::invalid_option_value,
                                "thread");
  }
}

}  // namespace probescan
