#include "csvpipe/chunk_channel.hpp"
#include "csvpipe/byte_stream.hpp"
#include "csvpipe/errors.hpp"
#include "csvpipe/log.hpp"

#include <cstring>
#include <exception>
#include <new>
#include <ostream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace cp {

ChunkChannel::ChunkChannel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

bool ChunkChannel::send(Chunk chunk) {
  std::unique_lock<std::mutex> lk(mu_);
  not_full_.wait(lk, [&] { return receiver_closed_ || queue_.size() < capacity_; });
  if (receiver_closed_ || sender_closed_) return false;
  queue_.push_back(std::move(chunk));
  lk.unlock();
  not_empty_.notify_one();
  return true;
}

bool ChunkChannel::receive(Chunk& out) {
  std::unique_lock<std::mutex> lk(mu_);
  not_empty_.wait(lk, [&] { return receiver_closed_ || sender_closed_ || !queue_.empty(); });
  if (receiver_closed_ || queue_.empty()) return false;
  out = std::move(queue_.front());
  queue_.pop_front();
  lk.unlock();
  not_full_.notify_one();
  return true;
}

void ChunkChannel::close_sender() noexcept {
  {
    std::lock_guard<std::mutex> lk(mu_);
    sender_closed_ = true;
  }
  not_empty_.notify_all();
}

void ChunkChannel::close_receiver() noexcept {
  {
    std::lock_guard<std::mutex> lk(mu_);
    receiver_closed_ = true;
    queue_.clear();
  }
  not_full_.notify_all();
  not_empty_.notify_all();
}

ChunkedTransfer::ChunkedTransfer(Config cfg) : cfg_(cfg) {}

bool ChunkedTransfer::run(ByteSource& src, const ChunkHandler& handler, Error* err) {
  chunks_ = bytes_ = 0;
  // Allocated before the processing thread exists, so a failure has nothing to join.
  std::vector<char> buf;
  try {
    buf.resize(cfg_.chunk_bytes);
  } catch (const std::bad_alloc&) {
    return fail(err, ErrorKind::Io,
                "cannot allocate a " + std::to_string(cfg_.chunk_bytes) + " byte read buffer");
  }
  ChunkChannel channel(cfg_.queue_depth);

  Error handler_err;
  bool handler_failed = false;
  std::exception_ptr crash;

  std::thread consumer;
  try {
    consumer = std::thread([&] {
      try {
        Chunk chunk;
        while (channel.receive(chunk)) {
          if (!handler(std::string_view(chunk.data(), chunk.size()), &handler_err)) {
            handler_failed = true;
            break;
          }
        }
      } catch (...) {
        crash = std::current_exception();
      }
      // unblocks a producer waiting on a full queue
      channel.close_receiver();
    });
  } catch (const std::system_error& e) {
    return fail(err, ErrorKind::Threading, std::string("cannot start processing thread: ") + e.what());
  }

  bool read_failed = false;
  std::string read_what;
  try {
    while (true) {
      const std::size_t n = src.read(buf.data(), buf.size());
      if (n == 0) {
        if (src.failed()) {
          read_failed = true;
          read_what = "read from " + src.name() + " failed: " + std::strerror(src.last_error());
        }
        break;
      }
      bytes_ += n;
      if (!channel.send(Chunk(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n)))) {
        log_at(LogLevel::Debug, "transfer", [&](std::ostream& o) {
          o << "processing side closed after " << chunks_ << " chunks";
        });
        break;
      }
      ++chunks_;
    }
  } catch (const std::bad_alloc&) {
    read_failed = true;
    read_what = "cannot allocate a chunk of " + std::to_string(buf.size()) + " bytes";
  }
  channel.close_sender();
  consumer.join();

  if (crash) {
    std::string what = "unknown exception";
    try {
      std::rethrow_exception(crash);
    } catch (const std::exception& e) {
      what = e.what();
    } catch (...) {
      // non-std exception type; keep the generic text
    }
    return fail(err, ErrorKind::Threading, "processing thread terminated abnormally: " + what);
  }
  if (handler_failed) {
    if (err) *err = handler_err;
    if (!handler_err) return fail(err, ErrorKind::Io, "chunk handler failed");
    return false;
  }
  if (read_failed) return fail(err, ErrorKind::Io, read_what);
  return true;
}

}
