#include "wlmerge/merge_engine.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <unordered_set>

#include "wlmerge/decoding_reader.hpp"
#include "wlmerge/error_log.hpp"
#include "wlmerge/errors.hpp"
#include "wlmerge/progress_state.hpp"
#include "wlmerge/shutdown.hpp"
#include "wlmerge/text_utils.hpp"
#include "wlmerge/timing.hpp"

namespace wlmerge {

void ValidateResume(const ProgressState& state,
                    const std::vector<std::string>& input_paths) {
  if (state.output_file.empty()) {
    throw ResumeError("checkpoint has no output_file");
  }
  const std::unordered_set<std::string> inputs(input_paths.begin(),
                                               input_paths.end());
  for (const auto& done : state.processed_files) {
    if (inputs.count(done) == 0) {
      throw ResumeError("checkpoint records " + done +
                        " which is not in input list " + state.input_file);
    }
  }
  if (state.committed_files > state.processed_files.size()) {
    throw ResumeError("checkpoint commits " +
                      std::to_string(state.committed_files) +
                      " files but records only " +
                      std::to_string(state.processed_files.size()));
  }
  std::error_code ec;
  if (state.committed_files > 0 &&
      !std::filesystem::is_regular_file(state.output_file, ec)) {
    throw ResumeError("output " + state.output_file + " is missing but holds " +
                      std::to_string(state.committed_files) +
                      " processed file(s)");
  }
}

MergeEngine::MergeEngine(Checkpoint& checkpoint, ShutdownFlag& flag,
                         ErrorLog& error_log, MergeOptions options)
    : checkpoint_(checkpoint),
      flag_(flag),
      error_log_(error_log),
      options_(std::move(options)) {}

MergeSummary MergeEngine::Run() {
  WLMERGE_SCOPE_TIMER("merge_total");
  MergeSummary summary;
  ProgressState start = checkpoint_.Snapshot();

  std::vector<std::string> listed = ReadInputList(start.input_file);
  if (options_.resume) {
    ValidateResume(start, listed);
    // Files recorded after the last output write are not in the output.
    const std::size_t dropped = checkpoint_.RollbackUncommitted();
    if (dropped > 0) {
      std::cerr << "[resume] " << dropped
                << " file(s) recorded after the last output write will be "
                   "read again\n";
      start = checkpoint_.Snapshot();
    }
  }

  // Duplicate entries in the list are ingested once.
  std::vector<std::string> remaining;
  std::unordered_set<std::string> seen;
  for (auto& p : listed) {
    if (!seen.insert(p).second) continue;
    ++summary.files_total;
    if (checkpoint_.IsProcessed(p)) {
      ++summary.files_already_done;
    } else {
      remaining.push_back(std::move(p));
    }
  }

  std::vector<FileDescriptor> files;
  {
    WLMERGE_SCOPE_TIMER("collect_metadata");
    files = OptimizeProcessingOrder(CollectFileMetadata(remaining, &error_log_));
  }
  files_skipped_.store(remaining.size() - files.size());

  const std::size_t capacity =
      options_.batch_capacity ? options_.batch_capacity
                              : ComputeBatchCapacity(options_.meminfo_path);

  DedupSet seed;
  if (options_.resume && start.committed_files > 0) {
    const auto seeded = SeedFromFile(start.output_file, seed);
    std::cerr << "[aggregate] seeded " << seeded << " lines from "
              << start.output_file << "\n";
  }

  const std::size_t requested =
      options_.threads ? options_.threads : start.thread_count;
  const std::size_t workers =
      std::min(std::max<std::size_t>(requested, 1), files.size());

  std::cerr << "[ingest] files=" << files.size()
            << " already_done=" << summary.files_already_done
            << " workers=" << workers << " batch_capacity=" << capacity
            << " encoding=" << options_.strategy.ToString() << "\n";

  BoundedChannel<LineBatch> channel(options_.channel_capacity);
  Aggregator aggregator(channel, std::move(seed), &flag_, options_.debug,
                        options_.on_batch_merged);
  aggregator.Start();

  {
    WLMERGE_SCOPE_TIMER("ingest");
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t t = 0; t < workers; ++t) {
      pool.emplace_back([&] { WorkerLoop(files, channel, capacity, aggregator); });
    }
    for (auto& t : pool) t.join();
  }
  channel.Close();

  DedupSet merged;
  try {
    merged = aggregator.Finish();
  } catch (const std::exception& e) {
    error_log_.Append(std::string("aggregator failed: ") + e.what());
    SaveCheckpointLogged();
    throw;
  }

  summary.interrupted = flag_.IsSet();
  if (summary.interrupted) {
    std::cerr << "[shutdown] writing partial output ("
              << checkpoint_.processed_count() << " files recorded)\n";
  }
  try {
    summary.unique_lines =
        WriteUniqueLines(merged, start.output_file, options_.write_chunk_bytes);
  } catch (const IoError& e) {
    error_log_.Append(std::string("output not written: ") + e.what());
    SaveCheckpointLogged();
    throw;
  }
  checkpoint_.MarkOutputCommitted();
  SaveCheckpointLogged();

  summary.files_processed = files_processed_.load();
  summary.files_skipped = files_skipped_.load();
  summary.lines_read = lines_read_.load();
  summary.batches = batches_.load();

  if (worker_error_) std::rethrow_exception(worker_error_);
  return summary;
}

void MergeEngine::WorkerLoop(const std::vector<FileDescriptor>& files,
                             BoundedChannel<LineBatch>& channel,
                             std::size_t capacity,
                             const Aggregator& aggregator) {
  EncodingStats local;
  while (true) {
    if (flag_.IsSet() || fatal_.load()) break;
    const std::size_t i = cursor_.fetch_add(1);
    if (i >= files.size()) break;
    const auto& file = files[i];

    std::uint64_t batches = 0;
    std::uint64_t lines = 0;
    try {
      lines = IngestFile(file, channel, capacity, local, batches);
    } catch (const ChannelError& e) {
      error_log_.Append("worker stopped on " + file.path + ": " + e.what());
      std::lock_guard<std::mutex> lk(mu_);
      if (!worker_error_) worker_error_ = std::current_exception();
      fatal_.store(true);
      break;
    } catch (const std::exception& e) {
      error_log_.Append("skipping " + file.path + ": " + e.what());
      files_skipped_.fetch_add(1);
      batches_.fetch_add(batches);
      continue;
    }
    batches_.fetch_add(batches);

    try {
      checkpoint_.RecordFileCompleted(file.path, lines);
    } catch (const IoError& e) {
      error_log_.Append("checkpoint not saved after " + file.path + ": " +
                        e.what());
    }
    const auto done = files_processed_.fetch_add(1) + 1;
    lines_read_.fetch_add(lines);

    if (options_.verbose) {
      std::cerr << "[ingest] " << done << "/" << files.size() << " "
                << file.path << " lines=" << lines
                << " unique=" << aggregator.unique_count() << "\n";
    }
    if (options_.on_file_done) options_.on_file_done(file.path, lines);
  }

  std::lock_guard<std::mutex> lk(mu_);
  stats_.Merge(local);
}

std::uint64_t MergeEngine::IngestFile(const FileDescriptor& file,
                                      BoundedChannel<LineBatch>& channel,
                                      std::size_t capacity,
                                      EncodingStats& stats,
                                      std::uint64_t& batches) {
  const auto t0 = std::chrono::steady_clock::now();
  const EncodingProfile profile =
      ResolveEncoding(file.path, options_.strategy, &stats);
  if (options_.debug) {
    std::cerr << "[encoding] " << file.path << ": " << profile.name << " ("
              << ToString(profile.basis);
    if (profile.basis == EncodingBasis::Detected) {
      std::cerr << ", confidence " << profile.confidence;
    }
    std::cerr << ")\n";
  }
  if (profile.likely_binary) {
    std::cerr << "[encoding] warning: " << file.path
              << " looks like binary data\n";
  }

  DecodingLineReader reader(file.path, profile.name);
  LineBatch batch;
  std::size_t batch_bytes = 0;
  std::uint64_t lines = 0;

  auto hand_off = [&] {
    const std::size_t n = batch.size();
    channel.Send(std::move(batch));
    ++batches;
    if (options_.debug) {
      std::cerr << "[ingest] " << file.path << ": batch of " << n
                << " lines handed off\n";
    }
    batch = LineBatch();
    batch_bytes = 0;
  };

  std::string raw;
  while (reader.ReadLine(raw)) {
    batch_bytes += raw.size() + 1;
    const std::string_view line = TrimAscii(raw);
    if (line.empty()) continue;
    ++lines;
    batch.emplace(line);
    if (batch.size() >= capacity ||
        batch_bytes >= options_.batch_byte_threshold) {
      hand_off();
    }
  }
  if (!batch.empty()) hand_off();

  stats.RecordBytes(reader.bytes_read());
  stats.RecordFileConversion(reader.replacements());
  stats.AddElapsed(std::chrono::steady_clock::now() - t0);
  if (reader.replacements() > 0) {
    std::cerr << "[encoding] " << file.path << ": " << reader.replacements()
              << " invalid sequence(s) replaced with U+FFFD\n";
  }
  if (reader.split_lines() > 0) {
    std::cerr << "[ingest] warning: " << file.path << ": "
              << reader.split_lines() << " line(s) longer than "
              << DecodingLineReader::MAX_LINE_BYTES << " bytes were split\n";
  }
  return lines;
}

void MergeEngine::SaveCheckpointLogged() {
  try {
    checkpoint_.Save();
  } catch (const IoError& e) {
    error_log_.Append(std::string("checkpoint save failed: ") + e.what());
  }
}

}  // namespace wlmerge
