#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "probescan/utility/file_io/probe_table.hpp"

#include "gtest/gtest.h"

namespace probescan {

namespace {

/* run `f` with a default logger writing bare messages into a string */
template <class F>
auto capture_log(F f) {
  auto os = std::ostringstream{};
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(os);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);
  f();
  spdlog::set_default_logger(previous);

  auto lines = std::vector<std::string>{};
  auto fin = std::istringstream(os.str());
  for (std::string line; std::getline(fin, line);) {
    lines.emplace_back(line);
  }
  return lines;
}

}  // namespace

TEST(ProbeTableTest, HeaderRowIsSkipped) {
  auto fin = std::istringstream("Probe Name,Sequence\n"
                                "p1,ACGT\n"
                                "p2,ttgca\n");
  auto table = read_probes(fin);
  ASSERT_EQ(table.probes.size(), 2u);
  EXPECT_TRUE(table.rejected.empty());
  EXPECT_EQ(table.probes[0], Probe("p1", "ACGT"));
  EXPECT_EQ(table.probes[1].name(), "p2");
  EXPECT_EQ(table.probes[1].seq(), "TTGCA");
}

TEST(ProbeTableTest, FirstRowWithoutHeaderIsData) {
  auto fin = std::istringstream("p1,ACGT\np2,GGCC\n");
  auto table = read_probes(fin);
  ASSERT_EQ(table.probes.size(), 2u);
  EXPECT_EQ(table.probes[0].name(), "p1");
}

TEST(ProbeTableTest, HeaderKeywordInSecondColumn) {
  auto fin = std::istringstream("oligo,seq_label\np1,ACGT\n");
  auto table = read_probes(fin);
  ASSERT_EQ(table.probes.size(), 1u);
  EXPECT_EQ(table.probes[0].name(), "p1");
}

TEST(ProbeTableTest, CellsAreTrimmedAndExtraColumnsIgnored) {
  auto fin = std::istringstream("name,sequence,note\n"
                                "  p1 , acgt  ,first\n");
  auto table = read_probes(fin);
  ASSERT_EQ(table.probes.size(), 1u);
  EXPECT_EQ(table.probes[0], Probe("p1", "ACGT"));
}

TEST(ProbeTableTest, InvalidRowsAreReported) {
  auto fin = std::istringstream("name,sequence\n"
                                "good,ACGT\n"
                                "bad,ATXG\n"
                                ",ACGT\n"
                                "nosequence,\n"
                                "lonely\n"
                                "amb,atgn\n"
                                "good2,CCGG\n");
  auto table = read_probes(fin);
  ASSERT_EQ(table.probes.size(), 2u);
  EXPECT_EQ(table.probes[0].name(), "good");
  EXPECT_EQ(table.probes[1].name(), "good2");

  ASSERT_EQ(table.rejected.size(), 5u);
  EXPECT_EQ(table.rejected[0], (RejectedProbe{.row = 3,
                                              .name = "bad",
                                              .seq = "ATXG",
                                              .issue = ProbeIssue::InvalidAlphabet}));
  EXPECT_EQ(table.rejected[1].issue, ProbeIssue::EmptyName);
  EXPECT_EQ(table.rejected[2].issue, ProbeIssue::EmptySequence);
  EXPECT_EQ(table.rejected[2].name, "nosequence");
  EXPECT_EQ(table.rejected[3].issue, ProbeIssue::MissingColumn);
  EXPECT_EQ(table.rejected[3].name, "lonely");
  EXPECT_EQ(table.rejected[4].issue, ProbeIssue::InvalidAlphabet);
  /* the raw sequence is kept for the report */
  EXPECT_EQ(table.rejected[4].seq, "atgn");
}

TEST(ProbeTableTest, BlankLinesAreSkipped) {
  auto fin = std::istringstream("p1,ACGT\n\n,\np2,GGCC\n");
  auto table = read_probes(fin);
  EXPECT_EQ(table.probes.size(), 2u);
  EXPECT_TRUE(table.rejected.empty());
}

TEST(ProbeTableTest, ByteOrderMarkIsIgnored) {
  auto fin = std::istringstream("\xEF\xBB\xBFprobe,sequence\np1,ACGT\n");
  auto table = read_probes(fin);
  ASSERT_EQ(table.probes.size(), 1u);
  EXPECT_EQ(table.probes[0].name(), "p1");
}

TEST(ProbeTableTest, EmptyTableThrows) {
  auto fin = std::istringstream("");
  EXPECT_THROW(read_probes(fin), std::runtime_error);
}

TEST(ProbeTableTest, HeaderOnlyGivesNoProbes) {
  auto fin = std::istringstream("name,sequence\n");
  auto table = read_probes(fin);
  EXPECT_TRUE(table.probes.empty());
  EXPECT_TRUE(table.rejected.empty());
}

TEST(ProbeTableTest, ReadFromFile) {
  auto table = read_probes(fs::path(PROBESCAN_TEST_DATA_DIR) / "probes.csv");
  ASSERT_EQ(table.probes.size(), 4u);
  EXPECT_EQ(table.probes[0].name(), "EcoRI");
  EXPECT_EQ(table.probes[0].seq(), "GAATTC");
  ASSERT_EQ(table.rejected.size(), 1u);
  EXPECT_EQ(table.rejected[0].name, "degenerate");
  EXPECT_EQ(to_string(table.rejected[0].issue), "InvalidAlphabet");
}

TEST(ProbeTableTest, MissingFileThrows) {
  EXPECT_THROW(read_probes(fs::path(PROBESCAN_TEST_DATA_DIR) / "missing.csv"),
               std::runtime_error);
}

TEST(ProbeTableTest, ReportRejectedListsAtMostFive) {
  auto table = ProbeTable{};
  for (auto i = 0u; i < 8; i++) {
    table.rejected.emplace_back(RejectedProbe{.row = i + 2,
                                              .name = fmt::format("bad{}", i),
                                              .seq = "NNN",
                                              .issue = ProbeIssue::InvalidAlphabet});
  }
  auto lines = capture_log([&]() { report_rejected(table); });
  ASSERT_EQ(lines.size(), 7u);
  EXPECT_EQ(lines[0], "Rejected 8 probe row(s):");
  EXPECT_EQ(lines[1], "  row 2: bad0: NNN (InvalidAlphabet)");
  EXPECT_EQ(lines[5], "  row 6: bad4: NNN (InvalidAlphabet)");
  EXPECT_EQ(lines[6], "  ... and 3 more");
}

TEST(ProbeTableTest, ReportRejectedShortList) {
  auto table = ProbeTable{};
  table.rejected.emplace_back(RejectedProbe{.row = 4,
                                            .name = "",
                                            .seq = "ACGT",
                                            .issue = ProbeIssue::EmptyName});
  auto lines = capture_log([&]() { report_rejected(table); });
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "Rejected 1 probe row(s):");
  EXPECT_EQ(lines[1], "  row 4: : ACGT (EmptyName)");

  EXPECT_TRUE(capture_log([]() { report_rejected(ProbeTable{}); }).empty());
}

}  // namespace probescan
