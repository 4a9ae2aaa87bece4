#pragma once

#include <memory>

namespace jobq::queue { class JobQueue; }
namespace jobq::worker { class WorkerRegistry; }

namespace jobq::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<jobq::queue::JobQueue> queue;
  std::shared_ptr<jobq::worker::WorkerRegistry> registry;
};

}
