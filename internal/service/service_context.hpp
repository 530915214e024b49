#pragma once

#include <memory>

#include "gate/v1/submission.pb.h"

namespace gate::core { class SubmissionPipeline; }
namespace gate::db { class Repository; }

namespace gate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<gate::core::SubmissionPipeline> pipeline;
  std::shared_ptr<gate::db::Repository> repository;

  // served when the tasks table is empty
  gate::v1::TaskInfo default_task;
};

}
