#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/queue_service.hpp"
#include "jobq/v1.hpp"

namespace jobq::grpc {

class QueueServer final : public jobq::v1::JobQueueService::Service {
public:
  explicit QueueServer(std::shared_ptr<jobq::service::QueueService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*, const jobq::v1::EnqueueRequest*,
                         jobq::v1::EnqueueResponse*) override;
  ::grpc::Status GetJob(::grpc::ServerContext*, const jobq::v1::GetJobRequest*,
                        jobq::v1::GetJobResponse*) override;

  ::grpc::Status Consume(::grpc::ServerContext*, const jobq::v1::ConsumeRequest*,
                         ::grpc::ServerWriter<jobq::v1::ConsumeResponse>*) override;

  ::grpc::Status Ack(::grpc::ServerContext*, const jobq::v1::LifecycleRequest*,
                     jobq::v1::LifecycleResponse*) override;
  ::grpc::Status Kill(::grpc::ServerContext*, const jobq::v1::LifecycleRequest*,
                      jobq::v1::LifecycleResponse*) override;
  ::grpc::Status Retry(::grpc::ServerContext*, const jobq::v1::LifecycleRequest*,
                       jobq::v1::LifecycleResponse*) override;
  ::grpc::Status Reschedule(::grpc::ServerContext*, const jobq::v1::RescheduleRequest*,
                            jobq::v1::RescheduleResponse*) override;
  ::grpc::Status UpdateJob(::grpc::ServerContext*, const jobq::v1::UpdateJobRequest*,
                           jobq::v1::UpdateJobResponse*) override;

  ::grpc::Status Heartbeat(::grpc::ServerContext*, const jobq::v1::HeartbeatRequest*,
                           jobq::v1::HeartbeatResponse*) override;
  ::grpc::Status Len(::grpc::ServerContext*, const jobq::v1::LenRequest*,
                     jobq::v1::LenResponse*) override;
  ::grpc::Status ListJobs(::grpc::ServerContext*, const jobq::v1::ListJobsRequest*,
                          jobq::v1::ListJobsResponse*) override;
  ::grpc::Status Sweep(::grpc::ServerContext*, const jobq::v1::SweepRequest*,
                       jobq::v1::SweepResponse*) override;

private:
  std::shared_ptr<jobq::service::QueueService> service_;
};

}
