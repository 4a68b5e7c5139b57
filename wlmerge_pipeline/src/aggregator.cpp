#include "wlmerge/aggregator.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

#include "wlmerge/errors.hpp"
#include "wlmerge/shutdown.hpp"
#include "wlmerge/text_utils.hpp"
#include "wlmerge/timing.hpp"

namespace wlmerge {

Aggregator::Aggregator(BoundedChannel<LineBatch>& channel, DedupSet seed,
                       const ShutdownFlag* flag, bool debug,
                       MergeHook on_merge)
    : channel_(channel),
      set_(std::move(seed)),
      flag_(flag),
      debug_(debug),
      on_merge_(std::move(on_merge)) {
  unique_count_.store(set_.size());
}

Aggregator::~Aggregator() {
  if (thread_.joinable()) {
    channel_.Close();
    thread_.join();
  }
}

void Aggregator::Start() {
  thread_ = std::thread([this] { Run(); });
}

void Aggregator::Run() {
  bool noted_shutdown = false;
  try {
    LineBatch batch;
    while (channel_.Receive(batch)) {
      if (flag_ && flag_->IsSet() && !noted_shutdown) {
        std::cerr << "[aggregate] stop requested, draining in-flight batches\n";
        noted_shutdown = true;
      }
      const std::size_t incoming = batch.size();
      set_.merge(batch);
      batch.clear();

      lines_received_.fetch_add(incoming);
      const auto merged = batches_merged_.fetch_add(1) + 1;
      unique_count_.store(set_.size());
      if (debug_) {
        std::cerr << "[aggregate] batch " << merged << ": " << incoming
                  << " lines, unique=" << set_.size() << "\n";
      }
      if (on_merge_) on_merge_(set_.size());
    }
  } catch (const std::exception& e) {
    std::cerr << "[aggregate] failed: " << e.what() << "\n";
    error_ = std::current_exception();
    channel_.Close();
  }
}

DedupSet Aggregator::Finish() {
  if (thread_.joinable()) thread_.join();
  if (error_) std::rethrow_exception(error_);
  return std::move(set_);
}

std::uint64_t WriteUniqueLines(const DedupSet& lines, const std::string& output,
                               std::size_t chunk_bytes) {
  WLMERGE_SCOPE_TIMER("write_output");

  std::filesystem::path out_path(output);
  if (out_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(out_path.parent_path(), ec);
    if (ec) {
      std::cerr << "[write] warning: failed to create "
                << out_path.parent_path().string() << ": " << ec.message()
                << "\n";
    }
  }

  const std::string tmp = output + ".tmp";
  std::vector<char> stream_buf(1 << 20);
  std::ofstream out;
  out.rdbuf()->pubsetbuf(stream_buf.data(),
                         static_cast<std::streamsize>(stream_buf.size()));
  out.open(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) throw IoError("cannot open output " + tmp);

  std::string chunk;
  chunk.reserve(chunk_bytes + 4096);
  std::uint64_t written = 0;
  for (const auto& line : lines) {
    chunk.append(line);
    chunk.push_back('\n');
    ++written;
    if (chunk.size() >= chunk_bytes) {
      out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      if (!out) throw IoError("write failed for " + tmp);
      chunk.clear();
    }
  }
  if (!chunk.empty()) {
    out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  }
  out.flush();
  if (!out) throw IoError("write failed for " + tmp);
  out.close();

  std::error_code ec;
  std::filesystem::rename(tmp, output, ec);
  if (ec) {
    throw IoError("cannot move " + tmp + " to " + output + ": " +
                  ec.message());
  }
  std::cerr << "[write] " << written << " unique lines -> " << output << "\n";
  return written;
}

std::uint64_t SeedFromFile(const std::string& path, DedupSet& set) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return 0;

  std::ifstream in(path, std::ios::binary);
  if (!in) throw IoError("cannot read existing output " + path);

  std::uint64_t inserted = 0;
  std::string line;
  while (std::getline(in, line)) {
    const std::string_view trimmed = TrimAscii(line);
    if (trimmed.empty()) continue;
    if (set.emplace(trimmed).second) ++inserted;
  }
  if (in.bad()) throw IoError("read failed for existing output " + path);
  return inserted;
}

}  // namespace wlmerge
