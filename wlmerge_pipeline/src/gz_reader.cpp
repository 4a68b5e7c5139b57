#include "wlmerge/gz_reader.hpp"

#include <cerrno>
#include <climits>
#include <cstring>

#include "wlmerge/errors.hpp"

namespace wlmerge {

namespace {

constexpr unsigned GZ_BUFFER_SIZE = 1u << 20;

}  // namespace

GzReader::GzReader(const std::string& path) : path_(path) {
  errno = 0;
  f_ = gzopen(path.c_str(), "rb");
  if (!f_) {
    const int err = errno;
    throw IoError("cannot open " + path +
                  (err ? std::string(": ") + std::strerror(err) : ""));
  }
  gzbuffer(f_, GZ_BUFFER_SIZE);
}

GzReader::~GzReader() {
  if (f_) gzclose(f_);
}

std::size_t GzReader::Read(char* dst, std::size_t n) {
  if (n > static_cast<std::size_t>(INT_MAX)) n = INT_MAX;
  const int got = gzread(f_, dst, static_cast<unsigned>(n));
  if (got < 0) {
    int errnum = 0;
    const char* msg = gzerror(f_, &errnum);
    throw IoError("read failed for " + path_ + ": " +
                  (errnum == Z_ERRNO ? std::strerror(errno) : msg));
  }
  return static_cast<std::size_t>(got);
}

}  // namespace wlmerge
