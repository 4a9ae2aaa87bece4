#pragma once

#include "internal/db/model/job_record.hpp"
#include "internal/model/job_status.hpp"
#include "jobq/v1/job.pb.h"

namespace jobq::service {

jobq::v1::JobStatus ToProto(jobq::model::JobStatus status);

// Throws util::InvalidArgument for JOB_STATUS_UNSPECIFIED / unknown values.
jobq::model::JobStatus FromProto(jobq::v1::JobStatus status);

jobq::v1::Job ToProto(const jobq::db::model::JobRecord& record);

}
