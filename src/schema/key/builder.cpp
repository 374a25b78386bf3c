#include <algorithm>
#include <iterator>
#include <peggy/common/critical.hpp>
#include <peggy/schema/key/builder.hpp>
#include <ranges>

using namespace peggy::schema::key;

namespace {

constexpr auto kAmountWidth = size_t{32};

}  // namespace

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const eth_address_t& address) {
  std::ranges::copy(address, std::back_inserter(data));
  return *this;
}

builder& builder::write(const amount_t& amount) {
  auto digits = peggy::schema::bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(digits), 8,
                                     true);
  if (digits.size() > kAmountWidth) {
    peggy::common::critical("amount does not fit a 256 bit key component");
  }
  data.insert(std::end(data), kAmountWidth - digits.size(), uint8_t{0});
  data.insert(std::end(data), std::begin(digits), std::end(digits));
  return *this;
}

builder& builder::write_sized(const std::span<const uint8_t>& bytes) {
  write(static_cast<uint32_t>(bytes.size()));
  return write(bytes);
}
