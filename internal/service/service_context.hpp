#pragma once

#include <memory>

namespace upload::core {
class SessionInitiator;
class CompletionPipeline;
class SessionLifecycle;
} // namespace upload::core

namespace upload::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<upload::core::SessionInitiator>   initiator;
  std::shared_ptr<upload::core::CompletionPipeline> completion;
  std::shared_ptr<upload::core::SessionLifecycle>   lifecycle;
};

} // namespace upload::service
