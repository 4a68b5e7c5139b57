#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_util.hpp"
#include "wlmerge/error_log.hpp"
#include "wlmerge/errors.hpp"
#include "wlmerge/merge_engine.hpp"
#include "wlmerge/progress_state.hpp"
#include "wlmerge/shutdown.hpp"
#include "wlmerge/timing.hpp"

using namespace wlmerge;
using wlmerge::testing::ReadFile;
using wlmerge::testing::ReadLines;
using wlmerge::testing::ReadLineSet;
using wlmerge::testing::TempDir;
using wlmerge::testing::WriteFile;
using wlmerge::testing::WriteGzip;
using wlmerge::testing::WriteList;

namespace {

using LineSet = std::set<std::string>;

// "w<from>\n" .. "w<to-1>\n"
std::string Words(int from, int to) {
  std::string body;
  for (int i = from; i < to; ++i) body += "w" + std::to_string(i) + "\n";
  return body;
}

LineSet WordSet(int from, int to) {
  LineSet s;
  for (int i = from; i < to; ++i) s.insert("w" + std::to_string(i));
  return s;
}

}  // namespace

class MergeEngineTest : public ::testing::Test {
 protected:
  ProgressState State(const std::string& list, const std::string& output,
                      std::size_t threads = 4) {
    ProgressState s;
    s.input_file = list;
    s.output_file = output;
    s.thread_count = threads;
    s.save_path = DefaultCheckpointPath(output);
    return s;
  }

  MergeOptions Options() {
    MergeOptions o;
    o.batch_capacity = 1000;
    return o;
  }

  MergeSummary RunFresh(const std::string& list, const std::string& output,
                        MergeOptions options) {
    Checkpoint cp(State(list, output));
    ShutdownFlag flag;
    MergeEngine engine(cp, flag, log_, std::move(options));
    return engine.Run();
  }

  TempDir dir_;
  ErrorLog log_{dir_.File("error.log")};
};

TEST_F(MergeEngineTest, MixedEncodingScenario) {
  WriteFile(dir_.File("a.txt"), "pass1\npass2\n");
  WriteFile(dir_.File("b.txt"), "caf\xE9\npass1\n");
  const auto list =
      WriteList(dir_, "list.txt", {dir_.File("a.txt"), dir_.File("b.txt")});
  const auto out = dir_.File("merged.txt");

  Checkpoint cp(State(list, out));
  ShutdownFlag flag;
  MergeEngine engine(cp, flag, log_, Options());
  const MergeSummary s = engine.Run();

  EXPECT_EQ(ReadLineSet(out), (LineSet{"pass1", "pass2", "caf\xC3\xA9"}));
  EXPECT_EQ(ReadLines(out).size(), 3u);
  EXPECT_EQ(s.files_total, 2u);
  EXPECT_EQ(s.files_processed, 2u);
  EXPECT_EQ(s.files_skipped, 0u);
  EXPECT_EQ(s.lines_read, 4u);
  EXPECT_EQ(s.unique_lines, 3u);
  EXPECT_FALSE(s.interrupted);
  EXPECT_EQ(engine.encoding_stats().files_processed(), 2u);
  EXPECT_EQ(engine.encoding_stats().conversion_errors(), 0u);

  const ProgressState saved = Checkpoint::Load(DefaultCheckpointPath(out)).Snapshot();
  EXPECT_EQ(saved.processed_files.size(), 2u);
  EXPECT_EQ(saved.current_position, 4u);
  EXPECT_FALSE(std::filesystem::exists(out + ".tmp"));
}

TEST_F(MergeEngineTest, NoDuplicatesAcrossOverlappingFiles) {
  std::vector<std::string> files;
  for (int i = 0; i < 20; ++i) {
    const auto f = dir_.File("w" + std::to_string(i) + ".txt");
    WriteFile(f, Words(i * 50, i * 50 + 200));
    files.push_back(f);
  }
  const auto list = WriteList(dir_, "list.txt", files);
  const auto out = dir_.File("merged.txt");

  MergeOptions o = Options();
  o.batch_capacity = 7;
  o.channel_capacity = 2;
  const MergeSummary s = RunFresh(list, out, std::move(o));

  const auto lines = ReadLines(out);
  const LineSet unique(lines.begin(), lines.end());
  EXPECT_EQ(lines.size(), unique.size());
  EXPECT_EQ(unique, WordSet(0, 19 * 50 + 200));
  EXPECT_EQ(s.lines_read, 20u * 200u);
  EXPECT_EQ(s.unique_lines, unique.size());
}

TEST_F(MergeEngineTest, FreshRunsAreIdempotent) {
  WriteFile(dir_.File("a.txt"), Words(0, 300));
  WriteFile(dir_.File("b.txt"), Words(100, 500));
  const auto list =
      WriteList(dir_, "list.txt", {dir_.File("a.txt"), dir_.File("b.txt")});

  RunFresh(list, dir_.File("one.txt"), Options());
  RunFresh(list, dir_.File("two.txt"), Options());
  EXPECT_EQ(ReadLineSet(dir_.File("one.txt")), ReadLineSet(dir_.File("two.txt")));
  EXPECT_EQ(ReadLineSet(dir_.File("one.txt")), WordSet(0, 500));
}

TEST_F(MergeEngineTest, MissingFileIsSkippedNotFatal) {
  WriteFile(dir_.File("a.txt"), "alpha\n");
  WriteFile(dir_.File("c.txt"), "gamma\n");
  const auto list = WriteList(
      dir_, "list.txt",
      {dir_.File("a.txt"), dir_.File("missing.txt"), dir_.File("c.txt")});
  const auto out = dir_.File("merged.txt");

  const MergeSummary s = RunFresh(list, out, Options());
  EXPECT_EQ(ReadLineSet(out), (LineSet{"alpha", "gamma"}));
  EXPECT_EQ(s.files_total, 3u);
  EXPECT_EQ(s.files_processed, 2u);
  EXPECT_EQ(s.files_skipped, 1u);
  EXPECT_EQ(log_.count(), 1u);
  EXPECT_NE(ReadFile(dir_.File("error.log")).find("missing.txt"),
            std::string::npos);
}

TEST_F(MergeEngineTest, TrimsAndDropsBlankLines) {
  WriteFile(dir_.File("a.txt"), "  spaced  \r\n\n\t\nplain\nspaced\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");

  const MergeSummary s = RunFresh(list, out, Options());
  EXPECT_EQ(ReadLineSet(out), (LineSet{"spaced", "plain"}));
  EXPECT_EQ(s.lines_read, 3u);
  EXPECT_EQ(Checkpoint::Load(DefaultCheckpointPath(out)).current_position(),
            3u);
}

TEST_F(MergeEngineTest, ReadsGzipInputs) {
  WriteGzip(dir_.File("a.txt.gz"), "zipped1\nzipped2\n");
  WriteFile(dir_.File("b.txt"), "zipped2\nplain\n");
  const auto list = WriteList(dir_, "list.txt",
                              {dir_.File("a.txt.gz"), dir_.File("b.txt")});
  const auto out = dir_.File("merged.txt");

  RunFresh(list, out, Options());
  EXPECT_EQ(ReadLineSet(out), (LineSet{"zipped1", "zipped2", "plain"}));
}

TEST_F(MergeEngineTest, ForcedUtf8KeepsFileWithReplacementChars) {
  WriteFile(dir_.File("b.txt"), "caf\xE9\npass1\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("b.txt")});
  const auto out = dir_.File("merged.txt");

  MergeOptions o = Options();
  o.strategy = EncodingStrategy::Force("UTF-8");
  Checkpoint cp(State(list, out));
  ShutdownFlag flag;
  MergeEngine engine(cp, flag, log_, std::move(o));
  const MergeSummary s = engine.Run();

  EXPECT_EQ(s.files_processed, 1u);
  EXPECT_EQ(ReadLineSet(out), (LineSet{"caf\xEF\xBF\xBD", "pass1"}));
  EXPECT_GE(engine.encoding_stats().conversion_errors(), 1u);
  EXPECT_EQ(engine.encoding_stats().forced().at("UTF-8"), 1u);
}

TEST_F(MergeEngineTest, BatchesNeverExceedCapacity) {
  WriteFile(dir_.File("a.txt"), Words(0, 23));
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});

  MergeOptions o = Options();
  o.batch_capacity = 5;
  const MergeSummary s = RunFresh(list, dir_.File("merged.txt"), std::move(o));
  EXPECT_EQ(s.batches, 5u);  // 5 + 5 + 5 + 5 + 3
  EXPECT_EQ(s.unique_lines, 23u);
}

TEST_F(MergeEngineTest, ByteThresholdAlsoClosesBatches) {
  WriteFile(dir_.File("a.txt"), "aaaa\nbbbb\ncccc\ndddd\neeee\nffff\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});

  MergeOptions o = Options();
  o.batch_byte_threshold = 10;  // two 5-byte lines
  const MergeSummary s = RunFresh(list, dir_.File("merged.txt"), std::move(o));
  EXPECT_EQ(s.batches, 3u);
  EXPECT_EQ(s.unique_lines, 6u);
}

TEST_F(MergeEngineTest, BatchCapacityComesFromMeminfo) {
  WriteFile(dir_.File("meminfo"), "MemAvailable:       1 kB\n");
  WriteFile(dir_.File("a.txt"), Words(0, 40));
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});

  MergeOptions o;
  o.meminfo_path = dir_.File("meminfo");
  const MergeSummary s = RunFresh(list, dir_.File("merged.txt"), std::move(o));
  // 1024 / 2 / sizeof(std::string) lines per batch.
  const std::size_t cap = 1024 / 2 / sizeof(std::string);
  EXPECT_EQ(s.batches, (40 + cap - 1) / cap);
}

TEST_F(MergeEngineTest, UnreadableMeminfoAbortsBeforeIngesting) {
  WriteFile(dir_.File("a.txt"), "x\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");

  MergeOptions o;
  o.meminfo_path = dir_.File("no_meminfo");
  EXPECT_THROW(RunFresh(list, out, std::move(o)), SystemResourceError);
  EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(MergeEngineTest, DuplicateListEntriesAreIngestedOnce) {
  WriteFile(dir_.File("a.txt"), "one\ntwo\n");
  const auto list = WriteList(dir_, "list.txt",
                              {dir_.File("a.txt"), dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");

  const MergeSummary s = RunFresh(list, out, Options());
  EXPECT_EQ(s.files_total, 1u);
  EXPECT_EQ(s.lines_read, 2u);
}

TEST_F(MergeEngineTest, EmptyListWritesEmptyOutput) {
  const auto list = WriteList(dir_, "list.txt", {});
  const auto out = dir_.File("merged.txt");
  const MergeSummary s = RunFresh(list, out, Options());
  EXPECT_EQ(s.files_total, 0u);
  EXPECT_TRUE(std::filesystem::exists(out));
  EXPECT_EQ(ReadFile(out), "");
}

TEST_F(MergeEngineTest, FlagRaisedBeforeStartProcessesNothing) {
  WriteFile(dir_.File("a.txt"), "one\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");

  Checkpoint cp(State(list, out));
  ShutdownFlag flag;
  flag.Request();
  MergeEngine engine(cp, flag, log_, Options());
  const MergeSummary s = engine.Run();

  EXPECT_TRUE(s.interrupted);
  EXPECT_EQ(s.files_processed, 0u);
  EXPECT_EQ(cp.processed_count(), 0u);
  EXPECT_EQ(ReadFile(out), "");
}

TEST_F(MergeEngineTest, InterruptAfterFirstFileThenResume) {
  WriteFile(dir_.File("a.txt"), "pass1\npass2\n");
  WriteFile(dir_.File("b.txt"), "caf\xE9\npass1\n");
  const auto list =
      WriteList(dir_, "list.txt", {dir_.File("a.txt"), dir_.File("b.txt")});
  const auto out = dir_.File("merged.txt");
  const auto cp_path = DefaultCheckpointPath(out);

  {
    Checkpoint cp(State(list, out, 1));
    ShutdownFlag flag;
    ShutdownCoordinator coordinator(cp, flag);
    MergeOptions o = Options();
    o.on_file_done = [&](const std::string&, std::uint64_t) {
      coordinator.RequestShutdown();
    };
    MergeEngine engine(cp, flag, log_, std::move(o));
    const MergeSummary s = engine.Run();
    coordinator.MarkStopped();

    EXPECT_TRUE(s.interrupted);
    EXPECT_EQ(s.files_processed, 1u);
    EXPECT_EQ(coordinator.state(), ShutdownState::Stopped);
  }

  const ProgressState saved = Checkpoint::Load(cp_path).Snapshot();
  // a.txt is larger, so it is ordered first.
  EXPECT_EQ(saved.processed_files,
            (std::vector<std::string>{dir_.File("a.txt")}));
  EXPECT_EQ(saved.current_position, 2u);
  EXPECT_EQ(ReadLineSet(out), (LineSet{"pass1", "pass2"}));

  // Anything re-read from a.txt would show up in the output.
  WriteFile(dir_.File("a.txt"), "poison\n");

  Checkpoint resumed = Checkpoint::Load(cp_path);
  ShutdownFlag flag;
  MergeOptions o = Options();
  o.resume = true;
  std::vector<std::string> ingested;
  o.on_file_done = [&](const std::string& path, std::uint64_t) {
    ingested.push_back(path);
  };
  MergeEngine engine(resumed, flag, log_, std::move(o));
  const MergeSummary s = engine.Run();

  EXPECT_EQ(ingested, (std::vector<std::string>{dir_.File("b.txt")}));
  EXPECT_EQ(s.files_already_done, 1u);
  EXPECT_EQ(s.files_processed, 1u);
  EXPECT_FALSE(s.interrupted);
  EXPECT_EQ(ReadLineSet(out), (LineSet{"pass1", "pass2", "caf\xC3\xA9"}));
  EXPECT_EQ(Checkpoint::Load(cp_path).current_position(), 4u);
}

TEST_F(MergeEngineTest, ResumeMatchesUninterruptedRun) {
  const std::vector<std::pair<int, int>> ranges = {
      {0, 400}, {300, 600}, {550, 700}, {690, 750}};
  std::vector<std::string> files;
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    const auto f = dir_.File("f" + std::to_string(i) + ".txt");
    WriteFile(f, Words(ranges[i].first, ranges[i].second));
    files.push_back(f);
  }
  const auto list = WriteList(dir_, "list.txt", files);

  RunFresh(list, dir_.File("reference.txt"), Options());
  const LineSet reference = ReadLineSet(dir_.File("reference.txt"));
  ASSERT_EQ(reference, WordSet(0, 750));

  const auto out = dir_.File("merged.txt");
  {
    Checkpoint cp(State(list, out, 1));
    ShutdownFlag flag;
    ShutdownCoordinator coordinator(cp, flag);
    MergeOptions o = Options();
    int done = 0;
    o.on_file_done = [&](const std::string&, std::uint64_t) {
      if (++done == 2) coordinator.RequestShutdown();
    };
    MergeEngine engine(cp, flag, log_, std::move(o));
    EXPECT_TRUE(engine.Run().interrupted);
  }
  const ProgressState saved =
      Checkpoint::Load(DefaultCheckpointPath(out)).Snapshot();
  ASSERT_EQ(saved.processed_files,
            (std::vector<std::string>{files[0], files[1]}));

  WriteFile(files[0], "poison0\n");
  WriteFile(files[1], "poison1\n");

  Checkpoint resumed = Checkpoint::Load(DefaultCheckpointPath(out));
  ShutdownFlag flag;
  MergeOptions o = Options();
  o.resume = true;
  MergeEngine engine(resumed, flag, log_, std::move(o));
  const MergeSummary s = engine.Run();

  EXPECT_EQ(s.files_already_done, 2u);
  EXPECT_EQ(s.files_processed, 2u);
  EXPECT_EQ(ReadLineSet(out), reference);
  EXPECT_EQ(ReadLines(out).size(), reference.size());
}

TEST_F(MergeEngineTest, ResumeRejectsCheckpointForAnotherList) {
  WriteFile(dir_.File("a.txt"), "x\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");

  ProgressState s = State(list, out);
  s.processed_files = {dir_.File("elsewhere.txt")};
  Checkpoint cp(std::move(s));
  ShutdownFlag flag;
  MergeOptions o = Options();
  o.resume = true;
  MergeEngine engine(cp, flag, log_, std::move(o));
  EXPECT_THROW(engine.Run(), ResumeError);
  EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(MergeEngineTest, FailedOutputWriteThenResumeRecoversLines) {
  WriteFile(dir_.File("a.txt"), "pass1\npass2\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");
  const auto cp_path = DefaultCheckpointPath(out);
  // A non-empty directory at the output path makes the final rename fail.
  std::filesystem::create_directories(out + "/occupied");

  {
    Checkpoint cp(State(list, out));
    ShutdownFlag flag;
    MergeEngine engine(cp, flag, log_, Options());
    EXPECT_THROW(engine.Run(), IoError);
  }
  const ProgressState saved = Checkpoint::Load(cp_path).Snapshot();
  EXPECT_EQ(saved.processed_files.size(), 1u);
  EXPECT_EQ(saved.committed_files, 0u);
  EXPECT_NE(ReadFile(dir_.File("error.log")).find("output not written"),
            std::string::npos);

  std::filesystem::remove_all(out);
  Checkpoint resumed = Checkpoint::Load(cp_path);
  ShutdownFlag flag;
  MergeOptions o = Options();
  o.resume = true;
  MergeEngine engine(resumed, flag, log_, std::move(o));
  const MergeSummary s = engine.Run();

  EXPECT_EQ(s.files_already_done, 0u);
  EXPECT_EQ(s.files_processed, 1u);
  EXPECT_EQ(ReadLineSet(out), (LineSet{"pass1", "pass2"}));
  const ProgressState after = Checkpoint::Load(cp_path).Snapshot();
  EXPECT_EQ(after.committed_files, 1u);
  EXPECT_EQ(after.current_position, 2u);
}

TEST_F(MergeEngineTest, AggregatorFailureStopsWorkersAndResumeRecovers) {
  std::vector<std::string> files;
  for (int i = 0; i < 12; ++i) {
    const auto f = dir_.File("w" + std::to_string(i) + ".txt");
    WriteFile(f, Words(i * 50, i * 50 + 200));
    files.push_back(f);
  }
  const auto list = WriteList(dir_, "list.txt", files);
  const auto out = dir_.File("merged.txt");
  const auto cp_path = DefaultCheckpointPath(out);

  {
    Checkpoint cp(State(list, out));
    ShutdownFlag flag;
    MergeOptions o = Options();
    o.batch_capacity = 5;
    o.channel_capacity = 1;
    o.on_batch_merged = [](std::uint64_t) {
      throw std::runtime_error("set insert failed");
    };
    MergeEngine engine(cp, flag, log_, std::move(o));
    // Returning at all means no worker is left waiting in Send.
    try {
      engine.Run();
      FAIL() << "Run() should rethrow the aggregator failure";
    } catch (const std::runtime_error& e) {
      EXPECT_STREQ(e.what(), "set insert failed");
    }
  }

  EXPECT_FALSE(std::filesystem::exists(out));
  const ProgressState saved = Checkpoint::Load(cp_path).Snapshot();
  EXPECT_EQ(saved.committed_files, 0u);
  const std::string errors = ReadFile(dir_.File("error.log"));
  EXPECT_NE(errors.find("aggregator failed: set insert failed"),
            std::string::npos);
  EXPECT_NE(errors.find("Channel error: send on closed channel"),
            std::string::npos);

  Checkpoint resumed = Checkpoint::Load(cp_path);
  ShutdownFlag flag;
  MergeOptions o = Options();
  o.resume = true;
  MergeEngine engine(resumed, flag, log_, std::move(o));
  const MergeSummary s = engine.Run();

  EXPECT_EQ(s.files_already_done, 0u);
  EXPECT_EQ(s.files_processed, 12u);
  EXPECT_EQ(ReadLineSet(out), WordSet(0, 11 * 50 + 200));
}

TEST_F(MergeEngineTest, ResumeRejectsCommittedCheckpointWhoseOutputIsGone) {
  WriteFile(dir_.File("a.txt"), "x\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  const auto out = dir_.File("merged.txt");
  RunFresh(list, out, Options());
  std::filesystem::remove(out);

  Checkpoint cp = Checkpoint::Load(DefaultCheckpointPath(out));
  ShutdownFlag flag;
  MergeOptions o = Options();
  o.resume = true;
  MergeEngine engine(cp, flag, log_, std::move(o));
  EXPECT_THROW(engine.Run(), ResumeError);
}

TEST_F(MergeEngineTest, RecordsStageTimingsForReport) {
  WriteFile(dir_.File("a.txt"), "one\n");
  const auto list = WriteList(dir_, "list.txt", {dir_.File("a.txt")});
  TimingRegistry::Instance().Clear();

  const MergeSummary s = RunFresh(list, dir_.File("merged.txt"), Options());

  std::set<std::string> stages;
  for (const auto& e : TimingRegistry::Instance().Entries()) {
    stages.insert(e.name);
  }
  for (const char* stage :
       {"collect_metadata", "ingest", "write_output", "merge_total"}) {
    EXPECT_EQ(stages.count(stage), 1u) << stage;
  }

  const auto report = dir_.File("timing/report.txt");
  WriteTimingReport(report, "wlmerge", {"merge", "-w", list},
                    RunCounters{{"unique_lines", s.unique_lines}});
  const std::string text = ReadFile(report);
  EXPECT_NE(text.find("args: merge -w"), std::string::npos);
  EXPECT_NE(text.find("merge_total"), std::string::npos);
  EXPECT_NE(text.find("unique_lines"), std::string::npos);
}

TEST(TimingReportTest, RepeatedStagesFoldIntoOneRow) {
  TempDir dir;
  using std::chrono::milliseconds;
  TimingRegistry::Instance().Clear();
  TimingRegistry::Instance().Add("scan", milliseconds(2));
  TimingRegistry::Instance().Add("write", milliseconds(1));
  TimingRegistry::Instance().Add("scan", milliseconds(4));

  const auto report = dir.File("report.txt");
  WriteTimingReport(report, "wlmerge", {"resume", "cp.json"},
                    RunCounters{{"files", 3}}, false);

  std::istringstream in(ReadFile(report));
  std::string line;
  int scan_rows = 0;
  bool saw_counter = false;
  while (std::getline(in, line)) {
    std::istringstream row(line);
    std::string name;
    row >> name;
    if (name == "scan") {
      ++scan_rows;
      std::uint64_t calls = 0;
      double total = 0, avg = 0;
      row >> calls >> total >> avg;
      EXPECT_EQ(calls, 2u);
      EXPECT_NEAR(total, 6.0, 1e-6);
      EXPECT_NEAR(avg, 3.0, 1e-6);
    } else if (name == "#files") {
      std::uint64_t value = 0;
      row >> value;
      EXPECT_EQ(value, 3u);
      saw_counter = true;
    }
  }
  EXPECT_EQ(scan_rows, 1);
  EXPECT_TRUE(saw_counter);
  TimingRegistry::Instance().Clear();
}
