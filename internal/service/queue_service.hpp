#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/queue/poll_stream.hpp"
#include "jobq/v1/queue_service.pb.h"
#include "service_context.hpp"

namespace jobq::service {

/*
  Transport-independent implementation of jobq.v1.JobQueueService.

  Validates requests, calls into JobQueue / WorkerRegistry and builds
  responses. Throws util::InvalidArgument, util::NotFound,
  util::StoreError, util::SerializationError.
*/
class QueueService {
 public:
  explicit QueueService(ServiceContext ctx);

  jobq::v1::EnqueueResponse Enqueue(const jobq::v1::EnqueueRequest& req);
  jobq::v1::GetJobResponse  GetJob(const jobq::v1::GetJobRequest& req);

  // Started stream delivering every tick to sink; ToResponse() renders one.
  std::unique_ptr<jobq::queue::PollStream> Consume(const jobq::v1::ConsumeRequest& req, jobq::queue::TickSink sink);

  jobq::v1::LifecycleResponse  Ack(const jobq::v1::LifecycleRequest& req);
  jobq::v1::LifecycleResponse  Kill(const jobq::v1::LifecycleRequest& req);
  jobq::v1::LifecycleResponse  Retry(const jobq::v1::LifecycleRequest& req);
  jobq::v1::RescheduleResponse Reschedule(const jobq::v1::RescheduleRequest& req);
  jobq::v1::UpdateJobResponse  UpdateJob(const jobq::v1::UpdateJobRequest& req);

  jobq::v1::HeartbeatResponse Heartbeat(const jobq::v1::HeartbeatRequest& req);
  jobq::v1::LenResponse       Len(const jobq::v1::LenRequest& req);
  jobq::v1::ListJobsResponse  ListJobs(const jobq::v1::ListJobsRequest& req);
  jobq::v1::SweepResponse     Sweep(const jobq::v1::SweepRequest& req);

  static jobq::v1::ConsumeResponse ToResponse(const jobq::queue::PollTick& tick);

  // Hands jobs claimed for a consumer that never received them back to the
  // queue. Returns how many were released.
  std::size_t ReleaseUndelivered(const std::string& worker_id, const std::vector<jobq::queue::PollTick>& ticks);

 private:
  ServiceContext ctx_;
};

}
