#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <hopper/common/critical.hpp>
#include <hopper/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace hopper::storage {

namespace detail {

inline hopper::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const hopper::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

// Plan and attempt records must survive a power loss once written, so every
// write is fsynced to the WAL.
inline ROCKSDB_NAMESPACE::WriteOptions durable_write_options() {
  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  return options;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hopper::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hopper::schema::bytes_view_t& key,
           const T& value) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const hopper::schema::bytes_view_t& prefix) const;
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const hopper::schema::bytes_view_t& key) const {
  if (!database) {
    hopper::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      hopper::common::critical("Failed to get value from RocksDB: {}",
                               status.ToString());
    }
  }
  return {encoder.template decode<T>(hopper::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const hopper::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    hopper::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      detail::durable_write_options(), detail::to_slice(key),
      detail::to_slice(hopper::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    hopper::common::critical("Failed to put value into RocksDB: {}",
                             status.ToString());
  }
}

}  // namespace hopper::storage
