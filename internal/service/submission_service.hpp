#pragma once

#include "gate/v1/submission.pb.h"
#include "internal/core/submission.hpp"
#include "service_context.hpp"

namespace gate::service {

class SubmissionService {
public:
  explicit SubmissionService(ServiceContext ctx);

  // Always a decision; rejection is not an error.
  gate::v1::SubmitResponse Submit(const gate::core::SubmissionEnvelope& envelope);

  gate::v1::TaskInfo GetTask();

private:
  ServiceContext ctx_;
};

}
