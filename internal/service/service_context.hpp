#pragma once

#include <memory>

namespace release::coordination {
class ReleaseCoordinator;
}
namespace release::registry {
class ReleaseRegistry;
}

namespace release::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<release::coordination::ReleaseCoordinator> coordinator;
  std::shared_ptr<release::registry::ReleaseRegistry>        registry;
};

} // namespace release::service
