#pragma once

#include <lockbox/execution/engine.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>
#include <lockbox/testing/common.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace lockbox::testing {

using scale_encoder_t = lockbox::schema::encoding::encoder<
    lockbox::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    lockbox::storage::storage<lockbox::storage::rocksdb_storage_tag>;

/// Engine over a throwaway RocksDB directory that can be reopened in place.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)} {
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  rocksdb_storage_t& storage() { return *storage_; }
  lockbox::execution::engine& engine() { return *engine_; }

  /// Close the database and load a fresh engine from what was committed.
  void restart() {
    engine_.reset();
    storage_.reset();
    open();
  }

 private:
  void open() {
    storage_ = std::make_unique<rocksdb_storage_t>(
        lockbox::storage::make_storage<lockbox::storage::rocksdb_storage_tag>(
            db_path_));
    engine_ = std::make_unique<lockbox::execution::engine>(encoder_, *storage_);
  }

  std::string db_path_;
  scale_encoder_t encoder_;
  std::unique_ptr<rocksdb_storage_t> storage_;
  std::unique_ptr<lockbox::execution::engine> engine_;
};

}  // namespace lockbox::testing
