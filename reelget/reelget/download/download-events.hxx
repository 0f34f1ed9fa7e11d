#pragma once

#include <string>
#include <cstdint>

#include <reelget/download/download-task.hxx>

namespace reelget
{
  // Download event sink.
  //
  // Used both by the batch runner to report to the manager and by the
  // manager to report to its subscribers. Callbacks are invoked on the
  // manager's worker thread, except for task_added and the task_cancelled of
  // an individual cancel which come from the calling thread. They must not
  // block for long and should not throw.
  //
  class download_listener
  {
  public:
    virtual
    ~download_listener () = default;

    virtual void
    task_added (const download_task_ptr&) {}

    virtual void
    task_started (const std::string& /*id*/) {}

    // Only fired while the total size is known. Within one task the byte
    // count never decreases.
    //
    virtual void
    task_progress (const std::string& /*id*/,
                   double /*percent*/,
                   std::uint64_t /*downloaded*/,
                   std::uint64_t /*total*/,
                   double /*speed*/) {}

    virtual void
    task_completed (const std::string& /*id*/) {}

    virtual void
    task_failed (const std::string& /*id*/, const std::string& /*error*/) {}

    virtual void
    task_paused (const std::string& /*id*/) {}

    virtual void
    task_cancelled (const std::string& /*id*/) {}

    // The active batch has run out of work.
    //
    virtual void
    all_completed () {}
  };
}
