#include "queue_server.hpp"

#include <chrono>
#include <vector>

#include "grpc_error.hpp"
#include "internal/queue/tick_buffer.hpp"

namespace jobq::grpc {

namespace {

// How often a Consume handler wakes to check for client cancellation.
constexpr std::chrono::milliseconds kCancelPoll{200};

} // namespace

QueueServer::QueueServer(std::shared_ptr<jobq::service::QueueService> svc)
    : service_(std::move(svc)) {}

::grpc::Status QueueServer::Enqueue(::grpc::ServerContext*,
                                    const jobq::v1::EnqueueRequest* req,
                                    jobq::v1::EnqueueResponse* resp) {
  try {
    *resp = service_->Enqueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::GetJob(::grpc::ServerContext*,
                                   const jobq::v1::GetJobRequest* req,
                                   jobq::v1::GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Consume(::grpc::ServerContext* ctx,
                                    const jobq::v1::ConsumeRequest* req,
                                    ::grpc::ServerWriter<jobq::v1::ConsumeResponse>* writer) {
  try {
    // buffer outlives the stream feeding it
    jobq::queue::TickBuffer buffer(/*keep_empty=*/true);
    auto stream = service_->Consume(*req, buffer.Sink());

    std::vector<jobq::queue::PollTick> undelivered;
    while (!ctx->IsCancelled()) {
      auto tick = buffer.PopFor(kCancelPoll);
      if (!tick) continue;
      if (!writer->Write(jobq::service::QueueService::ToResponse(*tick))) {
        undelivered.push_back(std::move(*tick));
        break;
      }
    }

    // Cancel() joins the poller, so an in-flight claim lands in buffer first.
    stream->Cancel();
    buffer.Shutdown();
    for (auto& tick : buffer.Drain()) undelivered.push_back(std::move(tick));
    service_->ReleaseUndelivered(req->worker_id(), undelivered);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Ack(::grpc::ServerContext*,
                                const jobq::v1::LifecycleRequest* req,
                                jobq::v1::LifecycleResponse* resp) {
  try {
    *resp = service_->Ack(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Kill(::grpc::ServerContext*,
                                 const jobq::v1::LifecycleRequest* req,
                                 jobq::v1::LifecycleResponse* resp) {
  try {
    *resp = service_->Kill(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Retry(::grpc::ServerContext*,
                                  const jobq::v1::LifecycleRequest* req,
                                  jobq::v1::LifecycleResponse* resp) {
  try {
    *resp = service_->Retry(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Reschedule(::grpc::ServerContext*,
                                       const jobq::v1::RescheduleRequest* req,
                                       jobq::v1::RescheduleResponse* resp) {
  try {
    *resp = service_->Reschedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::UpdateJob(::grpc::ServerContext*,
                                      const jobq::v1::UpdateJobRequest* req,
                                      jobq::v1::UpdateJobResponse* resp) {
  try {
    *resp = service_->UpdateJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Heartbeat(::grpc::ServerContext*,
                                      const jobq::v1::HeartbeatRequest* req,
                                      jobq::v1::HeartbeatResponse* resp) {
  try {
    *resp = service_->Heartbeat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Len(::grpc::ServerContext*,
                                const jobq::v1::LenRequest* req,
                                jobq::v1::LenResponse* resp) {
  try {
    *resp = service_->Len(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::ListJobs(::grpc::ServerContext*,
                                     const jobq::v1::ListJobsRequest* req,
                                     jobq::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status QueueServer::Sweep(::grpc::ServerContext*,
                                  const jobq::v1::SweepRequest* req,
                                  jobq::v1::SweepResponse* resp) {
  try {
    *resp = service_->Sweep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
