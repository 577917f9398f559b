#include <credo/common/critical.hpp>
#include <credo/storage/rocksdb/storage.hpp>

#include <string>

namespace credo::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    credo::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<credo::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const credo::schema::bytes_view_t& key) const {
  if (!database) {
    credo::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    credo::common::critical("Failed to get value from RocksDB");
  }
  return credo::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<write_entry_t>& entries) {
  if (!database) {
    credo::common::critical("RocksDB database is not initialized");
  }
  if (entries.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice = detail::to_slice(
        credo::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? batch.Put(key_slice,
                        detail::to_slice(credo::schema::bytes_view_t{
                            value->data(), value->size()}))
            : batch.Delete(key_slice);
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB batch entry: {}",
                    status.ToString());
      credo::common::critical("failed to stage write batch");
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    credo::common::critical("failed to commit write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const credo::schema::bytes_view_t& prefix) const {
  if (!database) {
    credo::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_slice);
  while (iterator->Valid() && iterator->key().starts_with(prefix_slice)) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace credo::storage
