#ifndef FUSIONFLEX_REASSEMBLER_HPP
#define FUSIONFLEX_REASSEMBLER_HPP
/**
 * @page ff-reassembler fusionflex Frame Reassembler
 * @file reassembler.hpp
 * @brief Turns arbitrary transport reads into complete '@...' frames.
 *
 * @details
 * WHY THIS EXISTS
 * ---------------
 * Serial ports and sockets hand us whatever bytes happen to be there: half a
 * frame, three frames, a frame and a half. The amplifier's frames are tiny
 * ("'@112'") and delimited by a two-byte start token `'@` and a one-byte end
 * token `'`. The reassembler keeps just enough state between reads to stitch
 * frames back together, and nothing more.
 *
 * HOW IT WORKS
 * ------------
 * Each chunk is split on the start token. Every segment after the first began
 * with a start token that the split removed, so the pending buffer is reset to
 * exactly `'@` before that segment is looked at. Then, for each non-empty
 * segment while a frame is pending:
 *   - end token found:  emit buffer + segment through the end token, clear the
 *                       buffer, move on to the next segment;
 *   - no end token:     stash the segment if buffer + segment fits in
 *                       MAX_PENDING bytes, otherwise throw the partial frame
 *                       away; either way stop looking at this chunk.
 * A first segment that arrives with nothing pending is noise and is skipped.
 *
 * FAILURE MODEL
 * -------------
 * - A chunk with any byte >= 0x80 is not 7-bit ASCII: the whole chunk is
 *   dropped (FeedResult::MalformedChunk) and the pending buffer is untouched.
 * - A partial frame that would grow past MAX_PENDING is dropped
 *   (FeedResult::BufferOverflow). The next start token resynchronizes.
 * Neither is fatal. The reassembler never blocks and never grows.
 *
 * EXAMPLE
 * -------
 * @code
 *   fusionflex::Reassembler r;
 *   std::vector<std::string> frames;
 *   r.feed("'@11", frames);   // frames empty, "'@11" pending
 *   r.feed("2'", frames);     // frames == { "'@112'" }
 * @endcode
 *
 * One instance per connection; not safe for concurrent use.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "etl/string.h"

namespace fusionflex {

enum class FeedResult : uint8_t {
  Ok = 0,
  MalformedChunk,   ///< non-ASCII byte; chunk dropped, pending buffer kept
  BufferOverflow    ///< pending partial frame exceeded MAX_PENDING and was dropped
};

const char* to_string(FeedResult r);

class Reassembler {
public:
  /// Upper bound on bytes held between chunks (start token included).
  static constexpr size_t MAX_PENDING = 16;

  using Buffer = etl::string<MAX_PENDING>;

  /**
   * @brief Consume one raw chunk and append every completed frame to @p frames.
   *
   * Frames are appended in the order their end tokens appear. Frames completed
   * before an overflow in the same chunk are still delivered.
   */
  FeedResult feed(const uint8_t* data, size_t len, std::vector<std::string>& frames);

  /// Convenience overload for text already in memory (tests, loopback).
  FeedResult feed(const std::string& chunk, std::vector<std::string>& frames);

  /// Drop any pending partial frame.
  void reset() { buffer_.clear(); }

  /// Bytes of the partial frame currently held (0 when idle).
  size_t pending() const { return buffer_.size(); }

  const Buffer& buffer() const { return buffer_; }

private:
  Buffer buffer_;
};

} // namespace fusionflex

#endif // FUSIONFLEX_REASSEMBLER_HPP
