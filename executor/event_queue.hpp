#ifndef EXECUTOR_EVENT_QUEUE_HPP
#define EXECUTOR_EVENT_QUEUE_HPP

#include <queue>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/event.pb.h"
#include "proto/result.pb.h"

namespace executor {

// Lifecycle notifications of jobs, consumed by a single reader. Events of the
// same job are enqueued in order.
class EventQueue {
 public:
  void JobStarted(const std::string& job_id) {
    proto::Event event;
    event.set_job_id(job_id);
    event.set_type(proto::Event::STARTED);
    Enqueue(std::move(event));
  }
  void JobCompleted(const proto::Result& result) {
    Finished(proto::Event::COMPLETED, result);
  }
  void JobFailed(const proto::Result& result) {
    Finished(proto::Event::FAILED, result);
  }

  // Blocks until an event is available. Returns nothing once the queue is
  // stopped and drained.
  absl::optional<proto::Event> Dequeue();
  void Stop();
  bool IsStopped();

 private:
  absl::Mutex queue_mutex_;
  std::queue<proto::Event> queue_ ABSL_GUARDED_BY(queue_mutex_);
  bool stopped_ ABSL_GUARDED_BY(queue_mutex_) = false;
  void Enqueue(proto::Event&& event);
  void Finished(proto::Event::Type type, const proto::Result& result) {
    proto::Event event;
    event.set_job_id(result.job_id());
    event.set_type(type);
    *event.mutable_result() = result;
    Enqueue(std::move(event));
  }
};

}  // namespace executor

#endif
