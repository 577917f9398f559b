#pragma once
#include <credo/schema/primitives.hpp>
#include <credo/storage/storage.hpp>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace credo::storage {

/// Write set of one engine call.
///
/// Reads see staged writes first and fall through to storage. `commit` applies
/// every staged write in a single atomic batch and remembers what it
/// overwrote, so a committed call can still be reverted with `rollback` until
/// the transaction is destroyed.
template <typename Library>
class state_transaction final {
 public:
  explicit state_transaction(storage<Library>& store) : store_{store} {}

  state_transaction(const state_transaction&) = delete;
  state_transaction& operator=(const state_transaction&) = delete;

  std::optional<credo::schema::bytes_t> get_raw(
      const credo::schema::bytes_t& key) const {
    auto staged = staged_.find(key);
    if (staged != std::end(staged_)) {
      return staged->second;
    }
    return store_.get_raw(
        credo::schema::bytes_view_t{key.data(), key.size()});
  }

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const credo::schema::bytes_t& key) const {
    auto value = get_raw(key);
    if (!value.has_value()) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        credo::schema::bytes_view_t{value->data(), value->size()})};
  }

  template <typename T, typename Encoder>
  void put(Encoder& encoder, const credo::schema::bytes_t& key, const T& value) {
    staged_[key] = encoder.encode(value);
  }

  void erase(const credo::schema::bytes_t& key) { staged_[key] = std::nullopt; }

  bool empty() const { return staged_.empty(); }

  void commit() {
    auto entries = std::vector<write_entry_t>{};
    entries.reserve(staged_.size());
    undo_.clear();
    undo_.reserve(staged_.size());
    for (const auto& [key, value] : staged_) {
      undo_.emplace_back(key, store_.get_raw(credo::schema::bytes_view_t{
                                  key.data(), key.size()}));
      entries.emplace_back(key, value);
    }
    store_.write(entries);
    staged_.clear();
    committed_ = true;
  }

  /// Drop staged writes, or revert the last commit when one happened.
  void rollback() {
    staged_.clear();
    if (!committed_) {
      return;
    }
    store_.write(undo_);
    undo_.clear();
    committed_ = false;
  }

 private:
  storage<Library>& store_;
  std::map<credo::schema::bytes_t, std::optional<credo::schema::bytes_t>>
      staged_;
  std::vector<write_entry_t> undo_;
  bool committed_{false};
};

}  // namespace credo::storage
