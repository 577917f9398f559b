#pragma once

#include <credo/storage/rocksdb/storage.hpp>
#include <credo/testing/common.hpp>

#include <string>
#include <string_view>

namespace credo::testing {

/// RocksDB store in a fresh temp directory, removed on destruction.
class scoped_storage final {
 public:
  explicit scoped_storage(const std::string_view prefix)
      : path_{make_db_path(prefix)},
        storage_{credo::storage::make_storage<
            credo::storage::rocksdb_storage_tag>(path_)} {}

  scoped_storage(const scoped_storage&) = delete;
  scoped_storage& operator=(const scoped_storage&) = delete;

  ~scoped_storage() {
    storage_.database.reset();
    remove_path(path_);
  }

  credo::storage::storage<credo::storage::rocksdb_storage_tag>& get() {
    return storage_;
  }

 private:
  std::string path_;
  credo::storage::storage<credo::storage::rocksdb_storage_tag> storage_;
};

}  // namespace credo::testing
