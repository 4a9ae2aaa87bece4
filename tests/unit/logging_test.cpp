#include "internal/observability/logging.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using namespace std::chrono_literals;
using jobq::observability::DurationField;
using jobq::observability::IntField;
using jobq::observability::StringField;

void TestFieldsAreAppended() {
  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(logger);

  JOBQ_LOG_WARN("poll tick failed", {StringField("worker_id", "w1"), StringField("error", "store unreachable"),
                                     DurationField("poll_interval", 250ms), IntField("count", 3)});
  JOBQ_LOG_INFO("bare");

  spdlog::set_default_logger(previous);

  const auto text = out.str();
  assert(text.find("poll tick failed worker_id=w1 error=\"store unreachable\" poll_interval=250ms count=3") !=
         std::string::npos);
  assert(text.find("bare\n") != std::string::npos);
}

void TestUnknownLevelFallsBackToInfo() {
  unsetenv("JOBQ_LOG_LEVEL");

  jobq::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("loud");
  jobq::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.mutable_logging()->set_level("debug");
  jobq::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  config.mutable_logging()->set_level("off");
  jobq::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::off);
}

} // namespace

int main() {
  TestFieldsAreAppended();
  TestUnknownLevelFallsBackToInfo();

  std::cout << "jobq_unit_logging: pass\n";
  return 0;
}
