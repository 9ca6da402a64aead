#include "migrations.hpp"

namespace keyshop::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS pending_transactions (payment_id TEXT PRIMARY KEY, owner_id INTEGER NOT NULL, amount_minor INTEGER NOT NULL, currency TEXT NOT NULL, metadata TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','paid')), created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_pending_owner_status ON pending_transactions(owner_id, status);",
      "CREATE TABLE IF NOT EXISTS processed_payments (payment_id TEXT PRIMARY KEY, claimed_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS credentials (credential_id INTEGER PRIMARY KEY AUTOINCREMENT, owner_id INTEGER NOT NULL, provider_host TEXT NOT NULL, remote_uuid TEXT NOT NULL, unique_identity TEXT NOT NULL UNIQUE, expires_at_ms INTEGER NOT NULL, missing_since_ms INTEGER, origin TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_credentials_owner ON credentials(owner_id);",
      "CREATE INDEX IF NOT EXISTS idx_credentials_missing_since ON credentials(missing_since_ms);",
      "CREATE TABLE IF NOT EXISTS accounts (owner_id INTEGER PRIMARY KEY, balance_minor INTEGER NOT NULL DEFAULT 0, referrer_id INTEGER, referral_balance_minor INTEGER NOT NULL DEFAULT 0, referral_total_minor INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payment_log (log_id INTEGER PRIMARY KEY AUTOINCREMENT, owner_id INTEGER NOT NULL, payment_id TEXT NOT NULL, payment_method TEXT NOT NULL, amount_minor INTEGER NOT NULL, currency TEXT NOT NULL, action TEXT NOT NULL, status TEXT NOT NULL, metadata TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_payment_log_owner ON payment_log(owner_id);",
      "CREATE TABLE IF NOT EXISTS promo_codes (code TEXT PRIMARY KEY, discount_minor INTEGER NOT NULL DEFAULT 0, discount_percent REAL NOT NULL DEFAULT 0, usage_limit_total INTEGER NOT NULL DEFAULT 0, usage_limit_per_owner INTEGER NOT NULL DEFAULT 0, used_total INTEGER NOT NULL DEFAULT 0, valid_until_ms INTEGER, is_active INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS promo_usages (usage_id INTEGER PRIMARY KEY AUTOINCREMENT, code TEXT NOT NULL, owner_id INTEGER NOT NULL, applied_minor INTEGER NOT NULL, order_id TEXT NOT NULL UNIQUE, used_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_promo_usages_code_owner ON promo_usages(code, owner_id);",
      "CREATE TABLE IF NOT EXISTS partner_commissions (instance_id TEXT NOT NULL, payment_id TEXT NOT NULL, owner_id INTEGER NOT NULL, amount_minor INTEGER NOT NULL, percent REAL NOT NULL, commission_minor INTEGER NOT NULL, payment_method TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (instance_id, payment_id));",
      "CREATE TABLE IF NOT EXISTS pending_gifts (payment_id TEXT PRIMARY KEY, payer_id INTEGER NOT NULL, metadata TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fulfillment_outcomes (payment_id TEXT NOT NULL, step TEXT NOT NULL, seq INTEGER NOT NULL, status TEXT NOT NULL, detail TEXT NOT NULL DEFAULT '', recorded_at_ms INTEGER NOT NULL, PRIMARY KEY (payment_id, seq));"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS pending_transactions (payment_id TEXT PRIMARY KEY, owner_id BIGINT NOT NULL, amount_minor BIGINT NOT NULL, currency TEXT NOT NULL, metadata TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'pending' CHECK (status IN ('pending','paid')), created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_pending_owner_status ON pending_transactions(owner_id, status);",
      "CREATE TABLE IF NOT EXISTS processed_payments (payment_id TEXT PRIMARY KEY, claimed_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS credentials (credential_id BIGSERIAL PRIMARY KEY, owner_id BIGINT NOT NULL, provider_host TEXT NOT NULL, remote_uuid TEXT NOT NULL, unique_identity TEXT NOT NULL UNIQUE, expires_at_ms BIGINT NOT NULL, missing_since_ms BIGINT, origin TEXT NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_credentials_owner ON credentials(owner_id);",
      "CREATE INDEX IF NOT EXISTS idx_credentials_missing_since ON credentials(missing_since_ms);",
      "CREATE TABLE IF NOT EXISTS accounts (owner_id BIGINT PRIMARY KEY, balance_minor BIGINT NOT NULL DEFAULT 0, referrer_id BIGINT, referral_balance_minor BIGINT NOT NULL DEFAULT 0, referral_total_minor BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS payment_log (log_id BIGSERIAL PRIMARY KEY, owner_id BIGINT NOT NULL, payment_id TEXT NOT NULL, payment_method TEXT NOT NULL, amount_minor BIGINT NOT NULL, currency TEXT NOT NULL, action TEXT NOT NULL, status TEXT NOT NULL, metadata TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_payment_log_owner ON payment_log(owner_id);",
      "CREATE TABLE IF NOT EXISTS promo_codes (code TEXT PRIMARY KEY, discount_minor BIGINT NOT NULL DEFAULT 0, discount_percent DOUBLE PRECISION NOT NULL DEFAULT 0, usage_limit_total BIGINT NOT NULL DEFAULT 0, usage_limit_per_owner BIGINT NOT NULL DEFAULT 0, used_total BIGINT NOT NULL DEFAULT 0, valid_until_ms BIGINT, is_active SMALLINT NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS promo_usages (usage_id BIGSERIAL PRIMARY KEY, code TEXT NOT NULL, owner_id BIGINT NOT NULL, applied_minor BIGINT NOT NULL, order_id TEXT NOT NULL UNIQUE, used_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_promo_usages_code_owner ON promo_usages(code, owner_id);",
      "CREATE TABLE IF NOT EXISTS partner_commissions (instance_id TEXT NOT NULL, payment_id TEXT NOT NULL, owner_id BIGINT NOT NULL, amount_minor BIGINT NOT NULL, percent DOUBLE PRECISION NOT NULL, commission_minor BIGINT NOT NULL, payment_method TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (instance_id, payment_id));",
      "CREATE TABLE IF NOT EXISTS pending_gifts (payment_id TEXT PRIMARY KEY, payer_id BIGINT NOT NULL, metadata TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS fulfillment_outcomes (payment_id TEXT NOT NULL, step TEXT NOT NULL, seq INTEGER NOT NULL, status TEXT NOT NULL, detail TEXT NOT NULL DEFAULT '', recorded_at_ms BIGINT NOT NULL, PRIMARY KEY (payment_id, seq));"};
  return kSchema;
}

} // namespace keyshop::db::sql
