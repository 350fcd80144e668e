#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <numeric>
#include <ranges>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <indicators/progress_bar.hpp>
#include <spdlog/spdlog.h>

#include "probescan/format/match_record.hpp"
#include "probescan/format/probe.hpp"
#include "probescan/matcher/match_engine.hpp"
#include "probescan/sequence/validator.hpp"

namespace probescan {

struct MatchSummary {
  std::size_t probes = 0;
  std::size_t probes_with_hits = 0;
  std::size_t forward = 0;
  std::size_t reverse_complement = 0;
  std::size_t total = 0;

  bool operator==(const MatchSummary&) const = default;
};

inline auto to_string(const MatchSummary& s) {
  return fmt::format(
      "Found {} match(es): {} {}, {} {}, {}/{} probes with hits", s.total,
      s.forward, to_label(Orientation::Forward), s.reverse_complement,
      to_label(Orientation::ReverseComplement), s.probes_with_hits, s.probes);
}

/**
 * @brief Search a list of probes against one target on a thread pool.
 * @details Every probe is an independent task which writes into its own
 * buffer, the buffers are concatenated in probe order, so the output doesn't
 * depend on the number of threads.
 */
class ProbeMatcher {
 private:
  struct Param {
    /* show a progress bar on stderr while searching */
    bool show_progress = false;

    /* width of the progress bar */
    const std::size_t bar_width = 30ul;
  } param;

  auto make_progress_bar() const {
    using namespace indicators;
    auto bar = std::make_unique<ProgressBar>();
    bar->set_option(option::BarWidth{param.bar_width});
    bar->set_option(option::Start{" ["});
    bar->set_option(option::Fill{"="});
    bar->set_option(option::Lead{">"});
    bar->set_option(option::Remainder{" "});
    bar->set_option(option::End{" ] "});
    bar->set_option(option::PrefixText{fmt::format("{:<15}", "Search probes")});
    bar->set_option(option::ForegroundColor{Color::yellow});
    bar->set_option(option::ShowElapsedTime{true});
    bar->set_option(option::ShowPercentage{true});
    bar->set_option(option::MaxProgress{probes.size()});
    bar->set_option(option::Stream{std::cerr});
    bar->set_option(
        option::FontStyles{std::vector<FontStyle>{FontStyle::bold}});
    return bar;
  }

 public:
  /* disable copy and move, the thread pool is owned */
  ProbeMatcher(const ProbeMatcher&) = delete;
  ProbeMatcher& operator=(const ProbeMatcher&) = delete;
  ProbeMatcher(ProbeMatcher&&) = delete;
  ProbeMatcher& operator=(ProbeMatcher&&) = delete;

  ProbeMatcher(std::vector<Probe>&& probes, std::string_view target,
               const std::size_t thread_num = std::thread::hardware_concurrency())
      : probes(std::move(probes)),
        target(normalize(target)),
        threads(std::max(thread_num, std::size_t{1})),
        threadpool(threads) {
    print_info();
  }

  auto set_progress(const bool show) { param.show_progress = show; }

  /**
   * @brief search all probes
   *
   * @return match records, grouped by probe in the order of probes, each group
   * as returned by `find_matches`
   */
  auto match() {
    auto buffers = std::vector<std::vector<MatchRecord>>(probes.size());
    auto bar = param.show_progress && !probes.empty() ? make_progress_bar()
                                                      : nullptr;

    auto forward_total = std::atomic<std::size_t>{0};
    auto mutex = std::mutex{};
    auto cv = std::condition_variable{};
    auto finished = 0ul;

    for (auto i = 0u; i < probes.size(); i++) {
      boost::asio::post(threadpool, [&, i]() {
        buffers[i] = find_matches(probes[i], target);
        auto forward = std::ranges::count(buffers[i], Orientation::Forward,
                                          &MatchRecord::orientation);
        forward_total += static_cast<std::size_t>(forward);
        spdlog::debug("Probe {}: {} match(es)", probes[i].name(),
                      buffers[i].size());
        if (bar) {
          bar->tick();
        }
        /* notify under the lock, `cv` lives on the caller's stack */
        auto lock = std::scoped_lock{mutex};
        finished++;
        cv.notify_one();
      });
    }
    {
      auto lock = std::unique_lock{mutex};
      cv.wait(lock, [&]() { return finished == probes.size(); });
    }
    if (bar && !bar->is_completed()) {
      bar->mark_as_completed();
    }

    forward_hits = forward_total.load();
    hits.resize(probes.size());
    auto total = 0ul;
    for (auto i = 0u; i < buffers.size(); i++) {
      hits[i] = buffers[i].size();
      total += hits[i];
    }
    auto records = std::vector<MatchRecord>{};
    records.reserve(total);
    for (auto& b : buffers) {
      std::ranges::move(b, std::back_inserter(records));
    }
    return records;
  }

  /**
   * @brief count the records of the last `match` call
   */
  auto summary() const {
    auto s = MatchSummary{.probes = probes.size()};
    s.probes_with_hits =
        std::ranges::count_if(hits, [](auto n) { return n > 0; });
    s.total = std::accumulate(hits.begin(), hits.end(), 0ul);
    s.forward = forward_hits;
    s.reverse_complement = s.total - s.forward;
    return s;
  }

  auto print_info() const -> void {
    spdlog::info("Probes: {}", probes.size());
    spdlog::info("Target length: {}", target.size());
    spdlog::info("Thread number: {}", threads);
  }

  auto get_target() const noexcept -> const std::string& { return target; }

 private:
  /* probes in upload order */
  std::vector<Probe> probes;

  /* uppercase target, read only while searching */
  std::string target;

  /* match count of each probe and forward match count of the last search */
  std::vector<std::size_t> hits;
  std::size_t forward_hits = 0;

  /* max threads and threadpool */
  std::size_t threads;
  boost::asio::thread_pool threadpool;
};

}  // namespace probescan
