#include <chrono>
#include <concepts>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>

#include "probescan/matcher/probe_matcher.hpp"
#include "probescan/sequence/validator.hpp"
#include "probescan/utility/argument.hpp"
#include "probescan/utility/file_io/match_table.hpp"
#include "probescan/utility/file_io/probe_table.hpp"
#include "probescan/utility/file_io/read_record.hpp"

namespace bpo = boost::program_options;
namespace fs = std::filesystem;
namespace ps = probescan;

using namespace std::literals;

/* --- print some error message --- */
template <class T>
concept printable = requires(std::ostream& os, const T& obj) {
  { os << obj } -> std::same_as<std::ostream&>;
};

template <printable T = std::string>
void exit_and_print_help(T msg = ""s) {
  std::cerr << msg << std::endl;
  exit(EXIT_FAILURE);
}

int main(int argc, char* argv[]) {
  auto start = std::chrono::steady_clock::now();

  bpo::options_description opts{"probescan: find exact probe matches in a "
                                "target nucleotide sequence"};
  bpo::variables_map vmap;

  /* stdout is reserved for the match table */
  auto logger = spdlog::stderr_color_mt("logger");
  spdlog::set_default_logger(logger);

  try {
    ps::add_options(opts);
    bpo::store(bpo::parse_command_line(argc, argv, opts), vmap);
    if (vmap.contains("help")) {
      exit_and_print_help(opts);
    }
    bpo::notify(vmap);
    ps::check_argument(vmap);
  } catch (const std::exception& ex) {
    spdlog::error("{}", ex.what());
    exit_and_print_help(opts);
  }

  auto probe_path = vmap["probe"].as<fs::path>();
  auto thread = vmap["thread"].as<int>();
  auto show_progress = vmap["progress"].as<bool>();
  auto debug_mode = vmap["debug"].as<bool>();
  auto quiet = vmap["quiet"].as<bool>();

  if (debug_mode) {
    spdlog::set_level(spdlog::level::debug);
  } else if (quiet) {
    spdlog::set_level(spdlog::level::off);
  } else {
    spdlog::set_level(spdlog::level::info);
  }

  auto table = ps::ProbeTable{};
  auto target = std::string{};
  try {
    table = ps::read_probes(probe_path);
    target = vmap.contains("target")
                 ? ps::read_target(vmap["target"].as<fs::path>())
                 : ps::make_target(vmap["sequence"].as<std::string>());
  } catch (const ps::InvalidAlphabetError& ex) {
    spdlog::error("Target sequence contains invalid characters: {}",
                  ex.what());
    exit(EXIT_FAILURE);
  } catch (const std::exception& ex) {
    spdlog::error("{}", ex.what());
    exit(EXIT_FAILURE);
  }

  ps::report_rejected(table);
  if (table.probes.empty()) {
    spdlog::error("No valid probes found, please check {}",
                  probe_path.string());
    exit(EXIT_FAILURE);
  }

  auto matcher = ps::ProbeMatcher(std::move(table.probes), target, thread);
  matcher.set_progress(show_progress && !quiet);
  auto records = matcher.match();

  try {
    if (vmap.contains("output_path")) {
      ps::save_matches(records, vmap["output_path"].as<fs::path>());
    } else {
      ps::print_matches(records, std::cout);
    }
  } catch (const std::exception& ex) {
    spdlog::error("Failed to save results: {}", ex.what());
    exit(EXIT_FAILURE);
  }

  auto end = std::chrono::steady_clock::now();
  spdlog::info("{}", ps::to_string(matcher.summary()));
  spdlog::info(
      "Search complete in {} ms",
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count());
}
