#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hopper::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using public_key_t = std::array<uint8_t, 32>;
using signature_t = std::array<uint8_t, 64>;
using blockhash_t = hash32_t;
using lamports_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Bitcoin-alphabet base58, the textual form of addresses and signatures.
std::string to_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

/// Decode a base58 address; std::nullopt unless it is exactly 32 bytes.
std::optional<public_key_t> try_make_public_key(std::string_view encoded);

template <std::size_t N>
std::string to_base58(const std::array<uint8_t, N>& value) {
  return to_base58(bytes_view_t{value.data(), value.size()});
}

/// Short hex prefix used to tag log lines with a plan id.
std::string short_id(const hash32_t& id);

timestamp_milliseconds_t now_milliseconds();

}  // namespace hopper::schema
