#pragma once

#include <hopper/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace hopper::testing {

inline hopper::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = hopper::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline hopper::schema::public_key_t make_public_key(const uint8_t seed) {
  return make_hash(seed);
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint32_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace hopper::testing
