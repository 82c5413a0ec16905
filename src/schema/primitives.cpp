#include <hopper/schema/primitives.hpp>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <string_view>

namespace hopper::schema {

namespace {

constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

std::optional<uint8_t> base58_digit(const char c) {
  auto position = kBase58Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
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

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(
    const std::string_view encoded) {
  auto decoded = try_from_base58(encoded);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
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
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_base58(const bytes_view_t& bytes) {
  auto zeros = std::size_t{0};
  while (zeros < bytes.size() && bytes[zeros] == 0) {
    ++zeros;
  }

  // Little-endian base58 digits of the non-zero tail.
  auto digits = std::vector<uint8_t>{};
  digits.reserve(((bytes.size() - zeros) * 138 / 100) + 1);
  for (auto i = zeros; i < bytes.size(); ++i) {
    auto carry = static_cast<uint32_t>(bytes[i]);
    for (auto& digit : digits) {
      carry += static_cast<uint32_t>(digit) << 8u;
      digit = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58));
      carry /= 58;
    }
  }

  auto out = std::string(zeros, '1');
  out.reserve(zeros + digits.size());
  std::transform(std::rbegin(digits), std::rend(digits),
                 std::back_inserter(out),
                 [](const uint8_t digit) { return kBase58Alphabet[digit]; });
  return out;
}

std::optional<bytes_t> try_from_base58(const std::string_view encoded) {
  auto zeros = std::size_t{0};
  while (zeros < encoded.size() && encoded[zeros] == '1') {
    ++zeros;
  }

  auto bytes = std::vector<uint8_t>{};
  bytes.reserve(((encoded.size() - zeros) * 733 / 1000) + 1);
  for (auto i = zeros; i < encoded.size(); ++i) {
    auto digit = base58_digit(encoded[i]);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    for (auto& byte : bytes) {
      carry += static_cast<uint32_t>(byte) * 58;
      byte = static_cast<uint8_t>(carry & 0xFFu);
      carry >>= 8u;
    }
    while (carry > 0) {
      bytes.push_back(static_cast<uint8_t>(carry & 0xFFu));
      carry >>= 8u;
    }
  }

  auto out = bytes_t(zeros, 0);
  out.insert(std::end(out), std::rbegin(bytes), std::rend(bytes));
  return out;
}

std::optional<public_key_t> try_make_public_key(const std::string_view encoded) {
  return try_make_fixed<32>(encoded);
}

std::string short_id(const hash32_t& id) {
  return to_hex(bytes_view_t{id.data(), 6});
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace hopper::schema
