#ifndef EXECUTOR_RESULTS_HPP
#define EXECUTOR_RESULTS_HPP

#include <string>

#include "proto/result.pb.h"

namespace executor {

proto::Result MakeSuccess(const std::string& job_id);
proto::Result MakeFailure(const std::string& job_id,
                          proto::Result::ErrorKind kind,
                          const std::string& error);
proto::Result MakeTimeout(const std::string& job_id, int64_t timeout_millis);
proto::Result MakeCancelled(const std::string& job_id,
                            const std::string& error);

// A terminal status other than SUCCESS.
inline bool IsFailure(const proto::Result& result) {
  return result.status() != proto::Result::SUCCESS;
}

}  // namespace executor

#endif
