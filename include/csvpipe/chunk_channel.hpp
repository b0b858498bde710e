#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>
#include <vector>

namespace cp {

class ByteSource;
struct Error;

using Chunk = std::vector<char>;

// Bounded FIFO between exactly one producer and one consumer. Closing the
// sender is the only end-of-data signal the receiver sees.
class ChunkChannel {
public:
  explicit ChunkChannel(std::size_t capacity);

  // Blocks while full. Returns false once the receiver is closed; the chunk
  // is dropped.
  bool send(Chunk chunk);

  // Blocks while empty. Returns false once the sender is closed and every
  // queued chunk has been taken.
  bool receive(Chunk& out);

  void close_sender() noexcept;
  void close_receiver() noexcept;

private:
  std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Chunk> queue_;
  std::size_t capacity_;
  bool sender_closed_{false};
  bool receiver_closed_{false};
};

// Reads fixed-size chunks on the calling thread and applies `handler` to them
// in order on a dedicated processing thread.
class ChunkedTransfer {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024;
    std::size_t queue_depth = 4;
  };

  // Return false (and fill *err) to stop the transfer.
  using ChunkHandler = std::function<bool(std::string_view chunk, Error* err)>;

  explicit ChunkedTransfer(Config cfg);

  // Runs to end of stream. The processing thread is always joined before
  // this returns. A handler that throws is reported as ErrorKind::Threading.
  bool run(ByteSource& src, const ChunkHandler& handler, Error* err);

  std::uint64_t chunks_sent() const noexcept { return chunks_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  Config cfg_;
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
};

}
