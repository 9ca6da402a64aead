#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/fulfillment/fulfillment_queue.hpp"
#include "internal/fulfillment/fulfillment_worker.hpp"
#include "internal/fulfillment/settings.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/provisioning/provisioning_client.hpp"
#include "internal/reconcile/reconcile_worker.hpp"
#include "internal/service/service_context.hpp"

namespace keyshop::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<fulfillment::StaticSettingsProvider> settings;
  std::shared_ptr<fulfillment::FulfillmentQueue>       queue;

  // started by Build, stopped by Shutdown
  std::shared_ptr<fulfillment::FulfillmentWorker> fulfillment_worker;
  std::shared_ptr<reconcile::ReconcileWorker>     reconcile_worker;

  // Drains queued fulfillments, then stops the periodic reconciler.
  void Shutdown();
};

// External collaborators; Build creates the configured ones when left empty.
struct Collaborators {
  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<provisioning::ProvisioningClient> provisioning;
  std::shared_ptr<notify::NotificationSink>         notifications;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const keyshop::runtime::config::RuntimeConfig& config, Collaborators collaborators = {});

std::shared_ptr<db::Repository> BuildRepository(const keyshop::runtime::config::RuntimeConfig& config);

} // namespace keyshop::factory
