#ifndef EXECUTOR_COLLABORATORS_HPP
#define EXECUTOR_COLLABORATORS_HPP

#include <string>

#include "proto/job.pb.h"

namespace executor {

// Performs the requests of api jobs. Implementations must be thread-safe.
class ApiTransport {
 public:
  // Returns false and sets error_msg if the request could not be completed.
  virtual bool Call(const proto::ApiJob& request, std::string* response,
                    std::string* error_msg) = 0;
  virtual ~ApiTransport() = default;
};

// Runs the queries of database jobs. Implementations must be thread-safe.
class DatabaseClient {
 public:
  // Returns false and sets error_msg if the query failed.
  virtual bool Query(const proto::DatabaseJob& query, std::string* rows,
                     std::string* error_msg) = 0;
  virtual ~DatabaseClient() = default;
};

}  // namespace executor

#endif
