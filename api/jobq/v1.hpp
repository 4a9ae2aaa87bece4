#pragma once

#include "jobq/v1/job.pb.h"
#include "jobq/v1/queue_service.pb.h"
#include "jobq/v1/queue_service.grpc.pb.h"
