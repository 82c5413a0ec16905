#pragma once
#include <hopper/schema/primitives.hpp>
#include <optional>
#include <span>

namespace hopper::schema::encoding {

// The encoding library is a build time choice made by tag; there is no
// runtime registry and hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  hopper::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const hopper::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hopper::schema::bytes_view_t& bytes);
};

}  // namespace hopper::schema::encoding
