#include "protocol/byte_stream.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>

namespace glonax_agent::protocol {
namespace {

std::string errno_message(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

int connect_unix(const std::string& path) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path)) {
    throw ConnectionError("unix socket path too long: " + path);
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

  const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw ConnectionError(errno_message("socket() failed"));
  }

  if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    const std::string message = errno_message(("connect() to " + path + " failed").c_str());
    ::close(fd);
    throw ConnectionError(message);
  }

  return fd;
}

int connect_tcp(const std::string& host, const std::uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
  if (rc != 0) {
    throw ConnectionError("unable to resolve " + host + ": " + ::gai_strerror(rc));
  }

  std::string last_error = "no address for " + host;
  int fd = -1;
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_error = errno_message("socket() failed");
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    last_error = errno_message(("connect() to " + host + ':' + std::to_string(port) + " failed").c_str());
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(result);

  if (fd < 0) {
    throw ConnectionError(last_error);
  }
  return fd;
}

}  // namespace

std::string StreamAddress::to_string() const {
  if (is_unix()) {
    return "unix://" + unix_socket;
  }
  return host + ':' + std::to_string(port);
}

StreamAddress parse_stream_address(const std::string& value) {
  StreamAddress address{};
  if (value.empty()) {
    throw std::runtime_error("stream address must not be empty");
  }

  if (value.rfind("unix://", 0) == 0) {
    address.unix_socket = value.substr(std::string("unix://").size());
    if (address.unix_socket.empty()) {
      throw std::runtime_error("unix socket path must not be empty");
    }
    return address;
  }

  if (value.front() == '/') {
    address.unix_socket = value;
    return address;
  }

  const auto split = value.rfind(':');
  if (split == std::string::npos || split == 0) {
    throw std::runtime_error("stream address must be unix://path, /path or host:port");
  }

  address.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("stream address port must be in range 1..65535");
  }
  address.port = static_cast<std::uint16_t>(parsed_port);
  return address;
}

std::size_t read_exact(ByteStream& stream, std::uint8_t* buffer, const std::size_t size) {
  std::size_t total = 0;
  while (total < size) {
    const std::size_t n = stream.read_some(buffer + total, size - total);
    if (n == 0) {
      break;
    }
    total += n;
  }
  return total;
}

SocketStream::SocketStream(const int fd) noexcept : fd_(fd) {}

SocketStream::~SocketStream() { close(); }

std::size_t SocketStream::read_some(std::uint8_t* buffer, const std::size_t size) {
  while (true) {
    const int fd = fd_.load();
    if (fd < 0) {
      throw ConnectionError("stream is closed");
    }

    const ssize_t n = ::recv(fd, buffer, size, 0);
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    throw ConnectionError(errno_message("recv() failed"));
  }
}

void SocketStream::write_all(const std::uint8_t* data, const std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const int fd = fd_.load();
    if (fd < 0) {
      throw ConnectionError("stream is closed");
    }

    const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ConnectionError(errno_message("send() failed"));
    }
    sent += static_cast<std::size_t>(n);
  }
}

void SocketStream::shutdown() noexcept {
  const int fd = fd_.load();
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RD);
  }
}

void SocketStream::close() noexcept {
  const int fd = fd_.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
}

std::unique_ptr<ByteStream> connect_stream(const StreamAddress& address) {
  const int fd = address.is_unix() ? connect_unix(address.unix_socket) : connect_tcp(address.host, address.port);
  return std::make_unique<SocketStream>(fd);
}

}  // namespace glonax_agent::protocol
