#pragma once

#include <memory>

namespace pagereg::registry { class PageRegistry; }
namespace pagereg::treasury { class AccountLedger; }

namespace pagereg::service {

/*
  Dependency container shared by the service layer.
*/
struct ServiceContext {
  std::shared_ptr<pagereg::registry::PageRegistry> registry;
  // Optional; GetAccountBalance fails when absent.
  std::shared_ptr<pagereg::treasury::AccountLedger> ledger;
};

}
