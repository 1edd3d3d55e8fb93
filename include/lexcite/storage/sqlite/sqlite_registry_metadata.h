#pragma once

#include "lexcite/storage/eu_reference_store.h"
#include "lexcite/storage/sqlite/sqlite_db.h"

#include <memory>

namespace lexcite::storage::sqlite {

// SqliteRegistryMetadata reads db_metadata(key, value) and counts the rows
// of the registry tables. Absent tables read as no value and zero rows.
class SqliteRegistryMetadata final : public IRegistryMetadata {
 public:
  explicit SqliteRegistryMetadata(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] std::optional<std::string> metadata_value(std::string_view key) const override;
  [[nodiscard]] std::int64_t row_count(RegistryTable table) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace lexcite::storage::sqlite
