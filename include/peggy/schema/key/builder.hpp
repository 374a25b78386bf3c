#pragma once
#include <boost/endian/conversion.hpp>
#include <peggy/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace peggy::schema::key {

/// Appends key components. Integers are written fixed width big endian so the
/// byte order of finished keys matches numeric order.
struct builder final {
  peggy::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const eth_address_t& address);
  builder& write(const amount_t& amount);

  /// Length prefixed (big endian uint32) variable sized component.
  builder& write_sized(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace peggy::schema::key
