#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cp {

struct Error;

// Any byte source the pipeline can pull from. Chosen once at setup.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to `n` bytes into `buf`. Returns 0 at end of stream or on a read
  // error; failed() tells the two apart.
  virtual std::size_t read(char* buf, std::size_t n) = 0;
  virtual bool failed() const noexcept = 0;
  virtual int last_error() const noexcept = 0;
  virtual std::string name() const = 0;
};

// Any byte sink the pipeline can push rows to.
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual bool write(std::string_view bytes) = 0;
  virtual bool flush() = 0;
  virtual int last_error() const noexcept = 0;
  virtual std::string name() const = 0;
};

// A named file opened for reading, or stdin when `path` is empty. Either way
// the OS is read in blocks of exactly `buffer_size` bytes.
std::unique_ptr<ByteSource> open_input(const std::optional<std::string>& path,
                                       std::size_t buffer_size, Error* err);

// A named file created/truncated for writing, or stdout when `path` is empty.
// Writes are held in a `buffer_size` byte buffer until it fills or flush().
std::unique_ptr<ByteSink> open_output(const std::optional<std::string>& path,
                                      std::size_t buffer_size, Error* err);

}
