#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace glonax_agent::model {

// RFC 4122 layout, stored in network byte order exactly as it appears on the wire.
struct Uuid {
  std::array<std::uint8_t, 16> bytes{};

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] bool is_nil() const noexcept;

  // Accepts the canonical 8-4-4-4-12 form in either case. Throws std::invalid_argument.
  static Uuid parse(const std::string& text);

  friend bool operator==(const Uuid&, const Uuid&) = default;
};

}  // namespace glonax_agent::model
