// ============================================================================
// reassembler.cpp: implementation for reassembler.hpp
// For the algorithm walk-through see the matching .hpp; for scenarios see
// tests/test_reassembler.cpp.
// ============================================================================

#include "fusionflex/reassembler.hpp"
#include "fusionflex/command.hpp"   // MESSAGE_START / MESSAGE_END
#include "fusionflex/log.hpp"

#include <cstring>                  // std::strlen / std::strncmp for the start token
#include <utility>

namespace fusionflex {

static const size_t START_LEN = std::strlen(MESSAGE_START);

// True when the pending buffer holds an open frame (begins with "'@").
static bool has_pending_start(const Reassembler::Buffer& b) {
  return b.size() >= START_LEN && std::strncmp(b.c_str(), MESSAGE_START, START_LEN) == 0;
}

const char* to_string(FeedResult r) {
  switch (r) {
    case FeedResult::Ok:             return "ok";
    case FeedResult::MalformedChunk: return "malformed_chunk";
    case FeedResult::BufferOverflow: return "buffer_overflow";
  }
  return "unknown";
}

FeedResult Reassembler::feed(const std::string& chunk, std::vector<std::string>& frames) {
  return feed(reinterpret_cast<const uint8_t*>(chunk.data()), chunk.size(), frames);
}

// ---------------------------------------------------------------------------
// feed()
// ------
// Phases:
//   1) reject the chunk outright if it is not 7-bit ASCII,
//   2) walk the segments between start tokens,
//   3) per segment: close a frame, stash a partial, or overflow.
// The segment walk is done with find() offsets instead of building a vector
// of substrings; the semantics are the same as a split on the start token.
// ---------------------------------------------------------------------------
FeedResult Reassembler::feed(const uint8_t* data, size_t len, std::vector<std::string>& frames) {
  // 1) charset check before anything is touched
  for (size_t i = 0; i < len; ++i) {
    if (data[i] & 0x80) {
      log::warn("dropping chunk: not ascii len={} offset={}", len, i);
      return FeedResult::MalformedChunk;
    }
  }

  const std::string text(reinterpret_cast<const char*>(data), len);
  log::debug("data received: \"{}\"", text);

  // 2) segment walk
  bool   first_segment = true;
  size_t pos = 0;
  for (;;) {
    const size_t next    = text.find(MESSAGE_START, pos);
    const size_t seg_end = (next == std::string::npos) ? text.size() : next;
    const size_t seg_len = seg_end - pos;

    if (seg_len > 0) {
      // A segment after the first lost its start token to the split; put it back.
      if (!first_segment) buffer_.assign(MESSAGE_START);

      if (has_pending_start(buffer_)) {
        const size_t end = text.find(MESSAGE_END, pos);
        if (end == std::string::npos || end >= seg_end) {
          // 3a) no end token yet: keep the partial if it fits, else drop it
          if (buffer_.size() + seg_len <= MAX_PENDING) {
            buffer_.append(text.data() + pos, seg_len);
            return FeedResult::Ok;
          }
          log::debug("reassembly overflow: dropped {} pending + {} new bytes", buffer_.size(), seg_len);
          buffer_.clear();
          return FeedResult::BufferOverflow;
        }

        // 3b) frame complete: pending bytes + segment through the end token
        std::string frame(buffer_.c_str(), buffer_.size());
        frame.append(text, pos, end - pos + 1);
        buffer_.clear();
        frames.push_back(std::move(frame));
      }
      // else: leading noise before the first start token, ignored
    }

    first_segment = false;
    if (next == std::string::npos) break;
    pos = next + START_LEN;
  }
  return FeedResult::Ok;
}

} // namespace fusionflex
