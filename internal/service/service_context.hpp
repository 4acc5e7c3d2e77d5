#pragma once

#include <memory>

#include "internal/util/deadline.hpp"

namespace siros::core {
class ResourceManager;
}

namespace siros::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<siros::core::ResourceManager> manager;
};

// Per-call data the transport hands down.
struct RequestContext {
  util::Deadline deadline = util::Deadline::Never();
};

} // namespace siros::service
