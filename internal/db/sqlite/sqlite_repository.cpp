#include "sqlite_repository.hpp"

#include "internal/db/sql/migrations.hpp"

namespace keyshop::db::sqlite {

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

void SqliteRepository::Bootstrap() {
    std::scoped_lock lock(db_->TransactionMutex());
    sql::RunMigrations(*db_, sql::SqliteSchema());
}

}
