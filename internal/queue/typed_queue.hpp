#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "codec.hpp"
#include "job_queue.hpp"

namespace jobq::queue {

template <typename T>
struct TypedJob {
  db::model::JobRecord record;
  T                    payload;
};

template <typename T>
struct TypedTick {
  std::optional<TypedJob<T>> job;
  std::optional<std::string> error;
};

/*
  JobQueue bound to one job type and payload codec.

  Decode failures on the consume path become error ticks; the claimed job
  stays Running under the worker and is left to the caller (Kill or Retry)
  or the orphan sweep.
*/
template <typename T, typename Codec = ProtoJsonCodec<T>>
class TypedQueue {
 public:
  TypedQueue(std::shared_ptr<JobQueue> queue, std::string job_type)
      : queue_(std::move(queue)), job_type_(std::move(job_type)) {
  }

  const std::string& job_type() const {
    return job_type_;
  }

  JobQueue& queue() {
    return *queue_;
  }

  // Returns the new job id. Throws util::SerializationError.
  std::string Push(const T& value) {
    return queue_->Enqueue(job_type_, Codec::Encode(value)).id;
  }

  std::string Schedule(const T& value, util::TimePoint when) {
    return queue_->EnqueueAt(job_type_, Codec::Encode(value), when).id;
  }

  std::unique_ptr<PollStream> Consume(const std::string& worker_id, std::chrono::milliseconds poll_interval,
                                      std::function<void(TypedTick<T>)> sink) {
    return queue_->Consume(worker_id, job_type_, poll_interval, [sink = std::move(sink)](PollTick tick) {
      TypedTick<T> typed;
      typed.error = std::move(tick.error);
      if (tick.job) {
        try {
          T payload = Codec::Decode(tick.job->payload);
          typed.job = TypedJob<T>{std::move(*tick.job), std::move(payload)};
        } catch (const util::SerializationError& e) {
          typed.error = "job " + tick.job->id + ": " + e.what();
        }
      }
      sink(std::move(typed));
    });
  }

  // Throws util::SerializationError when the stored payload does not decode.
  std::optional<TypedJob<T>> Fetch(const std::string& job_id) {
    auto record = queue_->FetchById(job_id);
    if (!record) {
      return std::nullopt;
    }
    T payload = Codec::Decode(record->payload);
    return TypedJob<T>{std::move(*record), std::move(payload)};
  }

 private:
  std::shared_ptr<JobQueue> queue_;
  std::string               job_type_;
};

} // namespace jobq::queue
