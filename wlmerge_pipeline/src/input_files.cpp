#include "wlmerge/input_files.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include "wlmerge/error_log.hpp"
#include "wlmerge/errors.hpp"
#include "wlmerge/text_utils.hpp"

namespace wlmerge {

std::vector<std::string> ReadInputList(const std::string& list_path) {
  std::ifstream in(list_path);
  if (!in) throw IoError("cannot read input list " + list_path);

  std::vector<std::string> paths;
  std::string line;
  while (std::getline(in, line)) {
    std::string_view p = TrimAscii(line);
    if (!p.empty()) paths.emplace_back(p);
  }
  if (in.bad()) throw IoError("read failed for input list " + list_path);
  return paths;
}

std::vector<FileDescriptor> CollectFileMetadata(
    const std::vector<std::string>& paths, ErrorLog* error_log) {
  std::vector<FileDescriptor> files;
  files.reserve(paths.size());
  for (const auto& p : paths) {
    std::error_code ec;
    const auto status = std::filesystem::status(p, ec);
    std::string problem;
    if (ec || !std::filesystem::exists(status)) {
      problem = "input file not found: " + p;
    } else if (!std::filesystem::is_regular_file(status)) {
      problem = "input is not a regular file: " + p;
    } else {
      const auto size = std::filesystem::file_size(p, ec);
      if (ec) {
        problem = "cannot stat " + p + ": " + ec.message();
      } else {
        files.push_back(FileDescriptor{p, size});
        continue;
      }
    }
    if (error_log) {
      error_log->Append(problem);
    } else {
      std::cerr << "[error] " << problem << "\n";
    }
  }
  return files;
}

std::vector<FileDescriptor> OptimizeProcessingOrder(
    std::vector<FileDescriptor> files) {
  std::vector<FileDescriptor> small, medium, large;
  for (auto& f : files) {
    if (f.byte_size < SMALL_FILE_LIMIT) {
      small.push_back(std::move(f));
    } else if (f.byte_size < MEDIUM_FILE_LIMIT) {
      medium.push_back(std::move(f));
    } else {
      large.push_back(std::move(f));
    }
  }

  auto by_size_desc = [](const FileDescriptor& a, const FileDescriptor& b) {
    return a.byte_size > b.byte_size;
  };
  std::stable_sort(small.begin(), small.end(), by_size_desc);
  std::stable_sort(medium.begin(), medium.end(), by_size_desc);
  std::stable_sort(large.begin(), large.end(), by_size_desc);

  std::vector<FileDescriptor> ordered;
  ordered.reserve(small.size() + medium.size() + large.size());
  for (auto* bucket : {&large, &medium, &small}) {
    std::move(bucket->begin(), bucket->end(), std::back_inserter(ordered));
  }
  return ordered;
}

}  // namespace wlmerge
