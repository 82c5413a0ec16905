#include <hopper/common/critical.hpp>
#include <hopper/storage/rocksdb/storage.hpp>

namespace hopper::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    hopper::common::critical("Failed to open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::debug("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const hopper::schema::bytes_view_t& prefix) const {
  if (!database) {
    hopper::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    hopper::common::critical("RocksDB iteration failed: {}",
                             iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    hopper::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(hopper::schema::make_bytes_view(key)),
        detail::to_slice(hopper::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      hopper::common::critical("Failed staging key in write batch: {}",
                               put_status.ToString());
    }
  }

  auto write_status = database->Write(detail::durable_write_options(), &batch);
  if (!write_status.ok()) {
    hopper::common::critical("Failed to commit write batch: {}",
                             write_status.ToString());
  }
}

}  // namespace hopper::storage
