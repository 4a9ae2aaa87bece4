#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/util/time_util.h>

#include "jobq/v1.hpp"

using namespace jobq::v1;
using google::protobuf::util::TimeUtil;

static void Usage() {
  std::cout << "Usage:\n"
            << "  jobqctl <addr> enqueue <job_type> <payload> [delay_ms] [max_attempts]\n"
            << "  jobqctl <addr> get <job_id>\n"
            << "  jobqctl <addr> consume <worker_id> <job_type> [poll_ms] [max_jobs]\n"
            << "  jobqctl <addr> ack <worker_id> <job_id>\n"
            << "  jobqctl <addr> kill <worker_id> <job_id>\n"
            << "  jobqctl <addr> retry <worker_id> <job_id>\n"
            << "  jobqctl <addr> reschedule <job_id> <wait_ms>\n"
            << "  jobqctl <addr> update <job_id> <status> <attempts> [last_error]\n"
            << "  jobqctl <addr> heartbeat <worker_id> <worker_type>\n"
            << "  jobqctl <addr> len <job_type>\n"
            << "  jobqctl <addr> list <status> [page] [job_type]\n"
            << "  jobqctl <addr> sweep <scheduled|orphans> <job_type> <count> [liveness_ms]\n"
            << "\n"
            << "  status = pending|running|done|failed|killed\n";
}

static std::optional<JobStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return JOB_STATUS_PENDING;
  if (value == "running") return JOB_STATUS_RUNNING;
  if (value == "done") return JOB_STATUS_DONE;
  if (value == "failed") return JOB_STATUS_FAILED;
  if (value == "killed") return JOB_STATUS_KILLED;
  return std::nullopt;
}

static void PrintJob(const Job& job) {
  std::cout << "id=" << job.id() << " type=" << job.job_type() << " status=" << JobStatus_Name(job.status())
            << " attempts=" << job.attempts() << "/" << job.max_attempts()
            << " run_at=" << TimeUtil::ToString(job.run_at());
  if (job.has_lock_by()) std::cout << " lock_by=" << job.lock_by();
  if (job.has_lock_at()) std::cout << " lock_at=" << TimeUtil::ToString(job.lock_at());
  if (job.has_done_at()) std::cout << " done_at=" << TimeUtil::ToString(job.done_at());
  if (job.has_last_error()) std::cout << " last_error=\"" << job.last_error() << "\"";
  std::cout << " payload_bytes=" << job.payload().size() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = JobQueueService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "enqueue") {
      if (argc < 5) return 1;

      EnqueueRequest req;
      req.set_job_type(argv[3]);
      req.set_payload(argv[4]);
      if (argc >= 6) {
        *req.mutable_run_at() = TimeUtil::GetCurrentTime() + TimeUtil::MillisecondsToDuration(std::stoll(argv[5]));
      }
      if (argc >= 7) req.set_max_attempts(std::stoi(argv[6]));

      EnqueueResponse resp;
      auto status = stub->Enqueue(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "id=" << resp.id() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get") {
      if (argc < 4) return 1;

      GetJobRequest req;
      req.set_id(argv[3]);

      GetJobResponse resp;
      auto status = stub->GetJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintJob(resp.job());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "consume") {
      if (argc < 5) return 1;

      ConsumeRequest req;
      req.set_worker_id(argv[3]);
      req.set_job_type(argv[4]);
      if (argc >= 6) *req.mutable_poll_interval() = TimeUtil::MillisecondsToDuration(std::stoll(argv[5]));
      const long max_jobs = argc >= 7 ? std::stol(argv[6]) : 1;

      auto reader = stub->Consume(&ctx, req);

      long           received = 0;
      ConsumeResponse resp;
      while (received < max_jobs && reader->Read(&resp)) {
        if (!resp.error().empty()) {
          std::cerr << "tick error: " << resp.error() << "\n";
          continue;
        }
        if (!resp.has_job()) continue;
        PrintJob(resp.job());
        ++received;
      }

      ctx.TryCancel();
      auto status = reader->Finish();
      if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) return Fail(status);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "ack" || cmd == "kill" || cmd == "retry") {
      if (argc < 5) return 1;

      LifecycleRequest req;
      req.set_worker_id(argv[3]);
      req.set_job_id(argv[4]);

      LifecycleResponse resp;
      grpc::Status      status;
      if (cmd == "ack") status = stub->Ack(&ctx, req, &resp);
      else if (cmd == "kill") status = stub->Kill(&ctx, req, &resp);
      else status = stub->Retry(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.applied() ? "applied" : "not owner") << "\n";
      return resp.applied() ? 0 : 3;
    }

    // ------------------------------------------------------------

    if (cmd == "reschedule") {
      if (argc < 5) return 1;

      RescheduleRequest req;
      req.set_job_id(argv[3]);
      *req.mutable_wait() = TimeUtil::MillisecondsToDuration(std::stoll(argv[4]));

      RescheduleResponse resp;
      auto status = stub->Reschedule(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "rescheduled\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "update") {
      if (argc < 6) return 1;

      auto parsed = ParseStatus(argv[4]);
      if (!parsed) {
        std::cerr << "unsupported status: " << argv[4] << "\n";
        return 1;
      }

      UpdateJobRequest req;
      req.set_job_id(argv[3]);
      req.set_status(*parsed);
      req.set_attempts(std::stoi(argv[5]));
      if (argc >= 7) req.set_last_error(argv[6]);

      UpdateJobResponse resp;
      auto status = stub->UpdateJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "updated\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "heartbeat") {
      if (argc < 5) return 1;

      HeartbeatRequest req;
      req.set_worker_id(argv[3]);
      req.set_worker_type(argv[4]);

      HeartbeatResponse resp;
      auto status = stub->Heartbeat(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "ok\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "len") {
      if (argc < 4) return 1;

      LenRequest req;
      req.set_job_type(argv[3]);

      LenResponse resp;
      auto status = stub->Len(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "pending=" << resp.pending() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      if (argc < 4) return 1;

      auto parsed = ParseStatus(argv[3]);
      if (!parsed) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }

      ListJobsRequest req;
      req.set_status(*parsed);
      req.set_page(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 1);
      if (argc >= 6) req.set_job_type(argv[5]);

      ListJobsResponse resp;
      auto status = stub->ListJobs(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& job : resp.jobs()) PrintJob(job);
      std::cout << "count=" << resp.jobs_size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "sweep") {
      if (argc < 6) return 1;

      const std::string kind = argv[3];
      SweepRequest      req;
      if (kind == "scheduled") {
        req.set_kind(SweepRequest::KIND_ENQUEUE_SCHEDULED);
      } else if (kind == "orphans") {
        req.set_kind(SweepRequest::KIND_RECLAIM_ORPHANS);
      } else {
        std::cerr << "unsupported sweep: " << kind << "\n";
        return 1;
      }
      req.set_job_type(argv[4]);
      req.set_count(static_cast<uint32_t>(std::stoul(argv[5])));
      if (argc >= 7) *req.mutable_liveness_timeout() = TimeUtil::MillisecondsToDuration(std::stoll(argv[6]));

      SweepResponse resp;
      auto status = stub->Sweep(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "requeued=" << resp.requeued() << "\n";
      return 0;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid number: " << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "number out of range: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
