#include <peggy/common/critical.hpp>
#include <peggy/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace peggy::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Table = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
constexpr auto kBech32Charset =
    std::string_view{"qpzry9x8gf2tvdw0s3jn54khce6mua7l"};
constexpr auto kBech32ChecksumSize = size_t{6};
constexpr auto kBech32MaxSize = size_t{90};

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_value(const char c) {
  auto position = kBase64Table.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

uint32_t bech32_polymod(const bytes_t& values) {
  static constexpr auto kGenerator = std::array<uint32_t, 5>{
      0x3b6a57b2u, 0x26508e6du, 0x1ea119fau, 0x3d4233ddu, 0x2a1462b3u};
  auto checksum = uint32_t{1};
  for (const auto value : values) {
    auto top = static_cast<uint8_t>(checksum >> 25u);
    checksum = ((checksum & 0x1ffffffu) << 5u) ^ value;
    for (size_t i = 0; i < kGenerator.size(); ++i) {
      if (((top >> i) & 1u) != 0) {
        checksum ^= kGenerator[i];
      }
    }
  }
  return checksum;
}

bytes_t bech32_expand_hrp(const std::string_view hrp) {
  auto expanded = bytes_t{};
  expanded.reserve((hrp.size() * 2) + 1);
  for (const auto c : hrp) {
    expanded.push_back(static_cast<uint8_t>(static_cast<uint8_t>(c) >> 5u));
  }
  expanded.push_back(0);
  for (const auto c : hrp) {
    expanded.push_back(static_cast<uint8_t>(static_cast<uint8_t>(c) & 0x1fu));
  }
  return expanded;
}

// Regroup a bit stream from `from_bits` wide words into `to_bits` wide words.
std::optional<bytes_t> convert_bits(const bytes_view_t& input,
                                    const uint32_t from_bits,
                                    const uint32_t to_bits,
                                    const bool pad) {
  auto accumulator = uint32_t{0};
  auto bits = uint32_t{0};
  auto max_value = (uint32_t{1} << to_bits) - 1;
  auto output = bytes_t{};
  for (const auto value : input) {
    if ((value >> from_bits) != 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      output.push_back(
          static_cast<uint8_t>((accumulator >> bits) & max_value));
    }
  }
  if (pad) {
    if (bits > 0) {
      output.push_back(
          static_cast<uint8_t>((accumulator << (to_bits - bits)) & max_value));
    }
  } else if (bits >= from_bits ||
             ((accumulator << (to_bits - bits)) & max_value) != 0) {
    return std::nullopt;
  }
  return output;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHexDigits[(value >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[value & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  auto digits = strip_hex_prefix(hex);
  if ((digits.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    auto high = hex_nibble(digits[i]);
    auto low = hex_nibble(digits[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    peggy::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (size_t index = 0; index < bytes.size(); index += 3) {
    auto remaining = bytes.size() - index;
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    if (remaining > 1) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
    }
    if (remaining > 2) {
      value |= static_cast<uint32_t>(bytes[index + 2]);
    }
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Table[(value >> 6u) & 0x3Fu] : '=');
    out.push_back(remaining > 2 ? kBase64Table[value & 0x3Fu] : '=');
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      compact.push_back(ch);
    }
  }
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (size_t i = 0; i < compact.size(); i += 4) {
    auto is_last_chunk = (i + 4) == compact.size();
    auto padding = size_t{0};
    if (compact[i + 3] == '=') {
      padding = compact[i + 2] == '=' ? 2 : 1;
    }
    if (padding > 0 && !is_last_chunk) {
      return std::nullopt;
    }

    auto value = uint32_t{0};
    for (size_t j = 0; j < 4 - padding; ++j) {
      auto sextet = base64_value(compact[i + j]);
      if (!sextet) {
        return std::nullopt;
      }
      value |= static_cast<uint32_t>(*sextet) << (18u - (6u * j));
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    peggy::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::optional<eth_address_t> try_make_eth_address(const std::string_view hex) {
  auto digits = strip_hex_prefix(hex);
  if (digits.size() != 40) {
    return std::nullopt;
  }
  auto decoded = try_from_hex(digits);
  if (!decoded) {
    return std::nullopt;
  }
  auto address = eth_address_t{};
  std::copy(decoded->begin(), decoded->end(), address.begin());
  return address;
}

eth_address_t make_eth_address(const std::string_view hex) {
  auto address = try_make_eth_address(hex);
  if (!address) {
    peggy::common::critical("invalid ethereum address");
  }
  return *address;
}

std::string to_string(const eth_address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

std::optional<std::pair<std::string, bytes_t>> try_decode_bech32(
    const std::string_view encoded) {
  if (encoded.size() < 8 || encoded.size() > kBech32MaxSize) {
    return std::nullopt;
  }
  auto has_lower = false;
  auto has_upper = false;
  for (const auto c : encoded) {
    if (c < 33 || c > 126) {
      return std::nullopt;
    }
    has_lower = has_lower || (c >= 'a' && c <= 'z');
    has_upper = has_upper || (c >= 'A' && c <= 'Z');
  }
  if (has_lower && has_upper) {
    return std::nullopt;
  }

  auto separator = encoded.rfind('1');
  if (separator == std::string_view::npos || separator == 0 ||
      separator + kBech32ChecksumSize + 1 > encoded.size()) {
    return std::nullopt;
  }

  auto hrp = std::string{};
  hrp.reserve(separator);
  for (const auto c : encoded.substr(0, separator)) {
    hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  auto values = bech32_expand_hrp(hrp);
  auto data_size = encoded.size() - separator - 1;
  for (const auto c : encoded.substr(separator + 1)) {
    auto lowered =
        static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    auto position = kBech32Charset.find(lowered);
    if (position == std::string_view::npos) {
      return std::nullopt;
    }
    values.push_back(static_cast<uint8_t>(position));
  }
  if (bech32_polymod(values) != 1) {
    return std::nullopt;
  }

  auto data_begin = values.size() - data_size;
  auto payload = convert_bits(
      bytes_view_t{values.data() + data_begin,
                   data_size - kBech32ChecksumSize},
      5, 8, false);
  if (!payload) {
    return std::nullopt;
  }
  return std::pair<std::string, bytes_t>{std::move(hrp), std::move(*payload)};
}

std::string encode_bech32(const std::string_view hrp,
                          const bytes_view_t& payload) {
  auto data = convert_bits(payload, 8, 5, true);
  if (!data) {
    peggy::common::critical("failed to regroup bech32 payload");
  }

  auto values = bech32_expand_hrp(hrp);
  values.insert(std::end(values), std::begin(*data), std::end(*data));
  values.insert(std::end(values), kBech32ChecksumSize, 0);
  auto checksum = bech32_polymod(values) ^ 1u;

  auto out = std::string{hrp};
  out.push_back('1');
  for (const auto value : *data) {
    out.push_back(kBech32Charset[value]);
  }
  for (size_t i = 0; i < kBech32ChecksumSize; ++i) {
    out.push_back(kBech32Charset[(checksum >> (5u * (5u - i))) & 0x1fu]);
  }
  return out;
}

bool is_valid_native_address(const std::string_view address) {
  // Addresses are keys; only the lowercase form is accepted so one account
  // maps to one key.
  if (std::any_of(std::begin(address), std::end(address), [](const char c) {
        return c >= 'A' && c <= 'Z';
      })) {
    return false;
  }
  auto decoded = try_decode_bech32(address);
  if (!decoded) {
    return false;
  }
  auto size = decoded->second.size();
  return size == 20 || size == 32;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }
  static const auto kMax = std::numeric_limits<amount_t>::max();
  auto value = amount_t{0};
  for (const auto c : decimal) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = (value * 10) + digit;
  }
  return value;
}

}  // namespace peggy::schema
