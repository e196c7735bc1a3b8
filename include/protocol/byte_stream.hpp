#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace glonax_agent::protocol {

// Transport failure: refused connect, reset, peer closed. Recoverable by
// reconnecting after the fixed retry delay.
class ConnectionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct StreamAddress {
  std::string unix_socket{};
  std::string host{};
  std::uint16_t port{0};

  [[nodiscard]] bool is_unix() const noexcept { return !unix_socket.empty(); }
  [[nodiscard]] std::string to_string() const;
};

// "unix:///path", "/path" or "host:port". Throws std::runtime_error.
StreamAddress parse_stream_address(const std::string& value);

class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Reads up to size bytes, blocking until at least one is available.
  // Returns 0 at end of stream. Throws ConnectionError on I/O failure.
  virtual std::size_t read_some(std::uint8_t* buffer, std::size_t size) = 0;

  // Writes all bytes or throws ConnectionError.
  virtual void write_all(const std::uint8_t* data, std::size_t size) = 0;

  // Wakes any thread blocked in read_some. Writes stay possible and the
  // descriptor stays owned.
  virtual void shutdown() noexcept = 0;

  virtual void close() noexcept = 0;
  [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

// Fills the whole buffer. Returns the number of bytes read, which is less
// than size only when the stream ended.
std::size_t read_exact(ByteStream& stream, std::uint8_t* buffer, std::size_t size);

class SocketStream final : public ByteStream {
 public:
  explicit SocketStream(int fd) noexcept;
  ~SocketStream() override;

  SocketStream(const SocketStream&) = delete;
  SocketStream& operator=(const SocketStream&) = delete;

  std::size_t read_some(std::uint8_t* buffer, std::size_t size) override;
  void write_all(const std::uint8_t* data, std::size_t size) override;
  void shutdown() noexcept override;
  void close() noexcept override;
  [[nodiscard]] bool is_open() const noexcept override { return fd_.load() >= 0; }

 private:
  std::atomic<int> fd_{-1};
};

// Connects a blocking stream socket. Throws ConnectionError.
std::unique_ptr<ByteStream> connect_stream(const StreamAddress& address);

}  // namespace glonax_agent::protocol
