#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/registry/page_registry.hpp"
#include "internal/service/page_service.hpp"
#include "internal/treasury/account_ledger.hpp"

namespace pagereg::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<treasury::AccountLedger>     ledger;
  std::shared_ptr<registry::PageRegistry>      registry;
  std::shared_ptr<service::PageService>        page_service;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  Transport adapters are attached by the executable.
*/
Application Build(const pagereg::runtime::config::RuntimeConfig& config);

}
