#include "delim_cleanse/chunk_reader.hpp"
#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

namespace dc {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  bool owns{false};
  bool opened{false};
  bool eof{false};
  bool failed{false};
  int last_errno{0};
  std::string err;
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  std::vector<char> buf;
  std::size_t pos{0}, len{0};
  std::string carry;          // partial line spanning chunk boundaries
  bool carry_emitted{false};

  void fail(const std::string& what, int e) {
    failed = true;
    last_errno = e;
    err = what;
    if (e != 0) { err += ": "; err += std::strerror(e); }
  }

  bool open() {
    opened = true;
    if (!f) {
      if (path == "-") {
        f = stdin;
      } else {
        f = std::fopen(path.c_str(), "rb");
        if (!f) { fail("cannot open " + path, errno); return false; }
        owns = true;
      }
    }
    buf.resize(cfg.chunk_bytes ? cfg.chunk_bytes : 1);
    return true;
  }

  bool fill() {
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) { fail("read error on " + path, errno); return false; }
      eof = true;
      return false;
    }
    bytes += n;
    pos = 0; len = n;
    return true;
  }

  bool next_line(std::string_view& out) {
    if (failed) return false;
    if (!opened && !open()) return false;
    if (carry_emitted) { carry.clear(); carry_emitted = false; }

    while (true) {
      if (pos < len) {
        const char* s = buf.data() + pos;
        const void* hit = std::memchr(s, cfg.terminator, len - pos);
        if (hit) {
          const std::size_t n = static_cast<const char*>(hit) - s;
          if (carry.empty()) {
            out = std::string_view(s, n);
          } else {
            if (carry.size() + n > cfg.max_line_bytes) {
              fail("line " + std::to_string(lines + 1) + " exceeds max_line_bytes", EFBIG);
              return false;
            }
            carry.append(s, n);
            out = std::string_view(carry.data(), carry.size());
            carry_emitted = true;
          }
          pos += n + 1;
          ++lines;
          return true;
        }
        // unfinished line: stash and keep reading
        if (carry.size() + (len - pos) > cfg.max_line_bytes) {
          fail("line " + std::to_string(lines + 1) + " exceeds max_line_bytes", EFBIG);
          return false;
        }
        carry.append(s, len - pos);
        pos = len;
      }
      if (eof || !fill()) {
        if (failed) return false;
        if (carry.empty()) return false;
        out = std::string_view(carry.data(), carry.size());
        carry_emitted = true;
        ++lines;
        return true;
      }
    }
  }

  ~Impl() { if (owns && f) std::fclose(f); }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{}) {
  p_->path = std::move(path);
  p_->cfg = cfg;
}

ChunkReader::ChunkReader(std::FILE* stream, Config cfg)
  : p_(new Impl{}) {
  p_->path = "<stream>";
  p_->cfg = cfg;
  p_->f = stream;
}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::next_line(std::string_view& out) { return p_->next_line(out); }

bool ChunkReader::for_each_line(const LineCallback& cb) {
  std::string_view line;
  while (p_->next_line(line)) {
    if (!cb(line)) return true;
  }
  return !p_->failed;
}

bool ChunkReader::failed() const noexcept { return p_->failed; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
const std::string& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines() const noexcept { return p_->lines; }

}
