#include "model/uuid.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace glonax_agent::model {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool is_dash_position(const std::size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

}  // namespace

std::string Uuid::to_string() const {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[bytes[i] >> 4U]);
    out.push_back(kHexDigits[bytes[i] & 0x0FU]);
  }
  return out;
}

bool Uuid::is_nil() const noexcept {
  return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

Uuid Uuid::parse(const std::string& text) {
  if (text.size() != 36) {
    throw std::invalid_argument("uuid must be 36 characters");
  }

  Uuid uuid{};
  std::size_t byte_index = 0;
  for (std::size_t pos = 0; pos < text.size();) {
    if (is_dash_position(pos)) {
      if (text[pos] != '-') {
        throw std::invalid_argument("uuid has misplaced separator");
      }
      ++pos;
      continue;
    }

    const int high = hex_value(text[pos]);
    const int low = hex_value(text[pos + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("uuid has non-hex digit");
    }
    uuid.bytes[byte_index++] = static_cast<std::uint8_t>((high << 4) | low);
    pos += 2;
  }

  return uuid;
}

}  // namespace glonax_agent::model
