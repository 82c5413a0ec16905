#pragma once
#include <hopper/schema/primitives.hpp>
#include <string>

namespace hopper::schema {

/// Public identity of a vault-held key. The signing material stays inside
/// the vault that produced this value.
struct hop_account_t final {
  public_key_t address{};
  std::string key_path;
};

}  // namespace hopper::schema
