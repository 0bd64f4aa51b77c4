#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace durable::db::sqlite {

/*
  Creates or upgrades the schema of a freshly opened database.

  Applied versions are tracked in durable_schema_migrations; re-running on
  an up-to-date file is a no-op.
*/
int BootstrapSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace durable::db::sqlite
