#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <lockbox/common/critical.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace lockbox::storage {

namespace detail {

using encoder_t = lockbox::schema::encoding::encoder<
    lockbox::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline lockbox::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const lockbox::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const lockbox::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const lockbox::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const lockbox::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const lockbox::schema::bytes_view_t& key) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    lockbox::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(lockbox::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const lockbox::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(lockbox::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    lockbox::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    lockbox::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, lockbox::schema::hash32_t>>(
          lockbox::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    lockbox::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(lockbox::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            lockbox::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      lockbox::common::critical("failed staging row in commit batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.sequence, state.state_root});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!state_status.ok()) {
    lockbox::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch at sequence {}: {}", state.sequence,
                  write_status.ToString());
    lockbox::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const lockbox::schema::bytes_view_t& prefix) const {
  if (!database) {
    lockbox::common::critical("RocksDB database is not initialized");
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
    spdlog::error("Prefix scan failed: {}", iterator->status().ToString());
    lockbox::common::critical("failed scanning RocksDB prefix");
  }
  return entries;
}

}  // namespace lockbox::storage
