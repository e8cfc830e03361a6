#include "executor/results.hpp"

#include "absl/strings/str_cat.h"

namespace executor {

proto::Result MakeSuccess(const std::string& job_id) {
  proto::Result result;
  result.set_job_id(job_id);
  result.set_status(proto::Result::SUCCESS);
  return result;
}

proto::Result MakeFailure(const std::string& job_id,
                          proto::Result::ErrorKind kind,
                          const std::string& error) {
  proto::Result result;
  result.set_job_id(job_id);
  result.set_status(proto::Result::FAILURE);
  result.set_error_kind(kind);
  result.set_error(error);
  return result;
}

proto::Result MakeTimeout(const std::string& job_id, int64_t timeout_millis) {
  proto::Result result;
  result.set_job_id(job_id);
  result.set_status(proto::Result::TIMEOUT);
  result.set_error_kind(proto::Result::EXECUTION_TIMEOUT);
  result.set_error(
      absl::StrCat("Job exceeded timeout of ", timeout_millis, "ms"));
  return result;
}

proto::Result MakeCancelled(const std::string& job_id,
                            const std::string& error) {
  proto::Result result;
  result.set_job_id(job_id);
  result.set_status(proto::Result::CANCELLED);
  result.set_error_kind(proto::Result::JOB_CANCELLED);
  result.set_error(error);
  return result;
}

}  // namespace executor
