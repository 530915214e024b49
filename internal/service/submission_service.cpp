#include "submission_service.hpp"

#include "internal/core/submission_pipeline.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "observe.hpp"

namespace gate::service {

SubmissionService::SubmissionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

gate::v1::SubmitResponse SubmissionService::Submit(const gate::core::SubmissionEnvelope& envelope) {
  return ObserveRpc("SubmissionService.Submit", [&] {
    const auto decision = ctx_.pipeline->Process(envelope);

    gate::v1::SubmitResponse resp;
    if (decision.accepted) {
      resp.set_status("accepted");
      resp.mutable_reason()->set_null_value(google::protobuf::NULL_VALUE);
    } else {
      resp.set_status("rejected");
      resp.mutable_reason()->set_string_value(gate::core::ReasonCode(decision.reason));
    }
    return resp;
  });
}

gate::v1::TaskInfo SubmissionService::GetTask() {
  return ObserveRpc("SubmissionService.GetTask", [&] {
    std::optional<gate::db::model::TaskRecord> current;
    try {
      auto tx = ctx_.repository->Begin();
      current = ctx_.repository->GetCurrentTask(*tx);
      tx->Commit();
    } catch (const std::exception& e) {
      GATE_LOG_WARN("task lookup failed, serving configured task", {gate::observability::StringField("error", e.what())});
    }

    if (!current) {
      return ctx_.default_task;
    }

    gate::v1::TaskInfo info;
    info.set_task_id(current->task_id);
    info.set_performance_threshold(current->performance_threshold);
    info.set_validation_data_hash(current->validation_data_hash);
    return info;
  });
}

}
