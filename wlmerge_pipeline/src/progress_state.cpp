#include "wlmerge/progress_state.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include "wlmerge/errors.hpp"

namespace wlmerge {

using nlohmann::json;

json ProgressToJson(const ProgressState& state) {
  json j;
  j["input_file"] = state.input_file;
  j["output_file"] = state.output_file;
  j["thread_count"] = state.thread_count;
  j["processed_files"] = state.processed_files;
  j["current_position"] = state.current_position;
  j["committed_files"] = state.committed_files;
  j["committed_position"] = state.committed_position;
  j["save_path"] = state.save_path;
  return j;
}

ProgressState ProgressFromJson(const json& j) {
  ProgressState s;
  s.input_file = j.at("input_file").get<std::string>();
  s.output_file = j.at("output_file").get<std::string>();
  if (j.contains("thread_count")) {
    s.thread_count = j.at("thread_count").get<std::size_t>();
  } else {
    s.thread_count = j.at("threads").get<std::size_t>();
  }
  s.processed_files =
      j.at("processed_files").get<std::vector<std::string>>();
  s.current_position = j.at("current_position").get<std::uint64_t>();
  if (j.contains("committed_files")) {
    s.committed_files = j.at("committed_files").get<std::size_t>();
    s.committed_position = j.at("committed_position").get<std::uint64_t>();
  } else {
    s.committed_files = s.processed_files.size();
    s.committed_position = s.current_position;
  }
  if (j.contains("save_path") && j.at("save_path").is_string()) {
    s.save_path = j.at("save_path").get<std::string>();
  }
  return s;
}

std::string DefaultCheckpointPath(const std::string& output_file) {
  return output_file + ".checkpoint.json";
}

Checkpoint::Checkpoint(ProgressState state) : state_(std::move(state)) {
  processed_index_.insert(state_.processed_files.begin(),
                          state_.processed_files.end());
}

Checkpoint Checkpoint::Load(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw ResumeError("checkpoint not found: " + path);
  }
  std::ifstream in(path);
  if (!in) throw ResumeError("cannot read checkpoint " + path);

  ProgressState state;
  try {
    json j;
    in >> j;
    state = ProgressFromJson(j);
  } catch (const json::exception& e) {
    throw ResumeError("corrupted checkpoint " + path + ": " + e.what());
  }
  state.save_path = path;
  return Checkpoint(std::move(state));
}

void Checkpoint::Save() const {
  std::lock_guard<std::mutex> save_lock(save_mu_);

  std::string path;
  std::string payload;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (state_.save_path.empty()) return;
    path = state_.save_path;
    payload = ProgressToJson(state_).dump(2, ' ', false,
                                           nlohmann::json::error_handler_t::replace);
  }

  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      std::cerr << "[checkpoint] warning: failed to create "
                << p.parent_path().string() << ": " << ec.message() << "\n";
    }
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out) throw IoError("cannot write checkpoint " + tmp);
    out << payload << "\n";
    out.flush();
    if (!out) throw IoError("write failed for checkpoint " + tmp);
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    throw IoError("cannot replace checkpoint " + path + ": " + ec.message());
  }
}

void Checkpoint::RecordFileCompleted(const std::string& path,
                                     std::uint64_t lines) {
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (processed_index_.insert(path).second) {
      state_.processed_files.push_back(path);
      state_.current_position += lines;
    }
  }
  Save();
}

void Checkpoint::MarkOutputCommitted() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  state_.committed_files = state_.processed_files.size();
  state_.committed_position = state_.current_position;
}

std::size_t Checkpoint::RollbackUncommitted() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (state_.committed_files >= state_.processed_files.size()) return 0;
  const std::size_t dropped =
      state_.processed_files.size() - state_.committed_files;
  for (std::size_t i = state_.committed_files;
       i < state_.processed_files.size(); ++i) {
    processed_index_.erase(state_.processed_files[i]);
  }
  state_.processed_files.resize(state_.committed_files);
  state_.current_position = state_.committed_position;
  return dropped;
}

bool Checkpoint::IsProcessed(const std::string& path) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return processed_index_.count(path) > 0;
}

ProgressState Checkpoint::Snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return state_;
}

std::uint64_t Checkpoint::current_position() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return state_.current_position;
}

std::size_t Checkpoint::processed_count() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return state_.processed_files.size();
}

std::string Checkpoint::save_path() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return state_.save_path;
}

}  // namespace wlmerge
