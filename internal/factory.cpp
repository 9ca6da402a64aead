#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/fulfillment/balance_payments.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/fulfillment/orchestrator.hpp"
#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "internal/notify/logging_sink.hpp"
#include "internal/notify/telegram_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/payments/payment_intake.hpp"
#include "internal/payments/relay_verifier.hpp"
#include "internal/provisioning/panel_client.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "internal/util/http_client.hpp"
#if KEYSHOP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if KEYSHOP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace keyshop::factory {

namespace {

db::RetryPolicy RetryFromConfig(const keyshop::runtime::config::LedgerConfig& ledger) {
  db::RetryPolicy policy;
  if (ledger.retry_attempts() > 0) policy.attempts = static_cast<int>(ledger.retry_attempts());
  if (ledger.retry_base_delay_ms() > 0) policy.base_delay = std::chrono::milliseconds(ledger.retry_base_delay_ms());
  return policy;
}

std::shared_ptr<notify::NotificationSink> BuildNotifications(const keyshop::runtime::config::RuntimeConfig& config,
                                                             const std::shared_ptr<util::HttpClient>&  http) {
  const auto& telegram = config.notifications().telegram();
  if (telegram.bot_token().empty()) {
    KEYSHOP_LOG_WARN("no bot token configured; notifications are only logged");
    return std::make_shared<notify::LoggingNotificationSink>();
  }
  return std::make_shared<notify::TelegramNotificationSink>(telegram, http);
}

std::shared_ptr<payments::VerifierRegistry> BuildVerifiers(const keyshop::runtime::config::PaymentsConfig& payments) {
  auto registry = std::make_shared<payments::VerifierRegistry>();
  for (const auto& relay : payments.relays()) {
    if (relay.token().empty()) throw std::runtime_error("payment relay without a token: " + relay.provider());
    registry->Register(relay.provider(), std::make_shared<payments::RelayTokenVerifier>(relay.token()));
  }
  return registry;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const keyshop::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if KEYSHOP_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());

    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->Bootstrap();
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if KEYSHOP_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    auto       repository      = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->Bootstrap();
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  KEYSHOP_LOG_WARN("no database configured; using the in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

void Application::Shutdown() {
  if (reconcile_worker) reconcile_worker->Stop();
  if (fulfillment_worker) fulfillment_worker->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const keyshop::runtime::config::RuntimeConfig& config, Collaborators collaborators) {
  Application app;
  const auto  retry = RetryFromConfig(config.ledger());

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto http = std::make_shared<util::CurlHttpClient>();

  auto repository    = collaborators.repository ? collaborators.repository : BuildRepository(config);
  auto panel         = collaborators.provisioning ? collaborators.provisioning
                                                  : std::shared_ptr<provisioning::ProvisioningClient>(
                                                        provisioning::PanelProvisioningClient::FromConfig(config.provisioning(), http));
  auto notifications = collaborators.notifications ? collaborators.notifications : BuildNotifications(config, http);

  // ------------------------------------------------------------------
  // Ledger + fulfillment
  // ------------------------------------------------------------------
  app.settings = std::make_shared<fulfillment::StaticSettingsProvider>(fulfillment::SettingsFromConfig(config));

  auto pending      = std::make_shared<ledger::PendingLedger>(repository, retry);
  auto coordinator  = std::make_shared<ledger::CompletionCoordinator>(repository, retry);
  auto guard        = std::make_shared<fulfillment::FulfillmentGuard>(repository, retry);
  auto orchestrator = std::make_shared<fulfillment::FulfillmentOrchestrator>(repository, guard, panel, notifications, app.settings, retry);
  auto balance      = std::make_shared<fulfillment::BalancePayments>(repository, guard, orchestrator, app.settings, retry);

  app.queue              = std::make_shared<fulfillment::FulfillmentQueue>();
  app.fulfillment_worker = std::make_shared<fulfillment::FulfillmentWorker>(app.queue, orchestrator, config.fulfillment().workers());

  auto intake = std::make_shared<payments::PaymentIntake>(BuildVerifiers(config.payments()), pending, coordinator, app.queue, orchestrator);

  // ------------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------------
  auto reconciler = std::make_shared<reconcile::Reconciler>(repository, panel, notifications,
                                                            reconcile::OptionsFromConfig(config.reconciliation()), retry);
  if (config.reconciliation().enabled()) {
    app.reconcile_worker =
        std::make_shared<reconcile::ReconcileWorker>(reconciler, std::chrono::seconds(config.reconciliation().interval_sec()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.repository       = repository;
  app.context.ledger           = pending;
  app.context.coordinator      = coordinator;
  app.context.guard            = guard;
  app.context.orchestrator     = orchestrator;
  app.context.balance_payments = balance;
  app.context.intake           = intake;
  app.context.reconciler       = reconciler;

  app.fulfillment_worker->Start();
  if (app.reconcile_worker) app.reconcile_worker->Start();

  return app;
}

} // namespace keyshop::factory
