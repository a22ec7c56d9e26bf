#include <custodian/common/critical.hpp>
#include <custodian/storage/rocksdb/storage.hpp>

namespace custodian::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_ledger_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // The ledger is a handful of small records per account; corrupt data must
  // stop startup rather than be skipped.
  options.paranoid_checks = true;
  options.OptimizeForSmallDb();
  options.IncreaseParallelism();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_ledger_options(),
                                            std::string{path}, &database);
  if (!status.ok()) {
    custodian::common::critical("failed to open ledger store at {}: {}", path,
                                status.ToString());
  }
  store.database.reset(database);
  spdlog::info("Opened ledger store at {}", path);
  return store;
}

}  // namespace custodian::storage
