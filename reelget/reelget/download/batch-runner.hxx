#pragma once

#include <set>
#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <utility>

#include <boost/asio.hpp>

#include <reelget/download/download-types.hxx>
#include <reelget/download/download-task.hxx>
#include <reelget/download/download-events.hxx>
#include <reelget/download/download-semaphore.hxx>
#include <reelget/download/transfer-engine.hxx>
#include <reelget/resolve/url-resolver.hxx>

namespace reelget
{
  namespace asio = boost::asio;

  // Batch runner.
  //
  // Fan a set of pending tasks out to the transfer engine with at most N of
  // them in the fetching/downloading phase at a time, and report their
  // lifecycle (started, progress, completed, failed, paused, cancelled) to a
  // single listener. One task failing never affects its siblings.
  //
  // All the task coroutines run on the executor passed at construction,
  // which must be single-threaded. The control functions (pause, resume,
  // admit, cancel) may be called from any thread.
  //
  // Must be owned by a shared_ptr.
  //
  class batch_runner: public std::enable_shared_from_this<batch_runner>
  {
  public:
    batch_runner (asio::any_io_executor,
                  url_resolver&,
                  download_listener&,
                  download_settings);

    batch_runner (const batch_runner&) = delete;
    batch_runner& operator= (const batch_runner&) = delete;

    // Run the tasks to completion. Return once every task (including those
    // admitted while running) has reached a terminal state, paused, or was
    // skipped.
    //
    asio::awaitable<void>
    run (std::vector<download_task_ptr> tasks, std::size_t max_concurrent);

    // Ask the task to pause at the next chunk boundary (or to be skipped if
    // it hasn't been admitted yet).
    //
    void
    pause (const download_task_ptr&);

    // Stop treating the task as paused and, if its coroutine has already
    // finished, admit it again. Return false if the runner is done.
    //
    bool
    resume (const download_task_ptr&);

    // Add a (pending) task to the running batch. Return false if the runner
    // is done, in which case the caller has to start a new one.
    //
    bool
    admit (const download_task_ptr&);

    // Ask the task to stop at the next chunk boundary.
    //
    void
    cancel (const download_task_ptr&);

    // Stop the whole batch: in-flight tasks stop at the next chunk boundary
    // and tasks that haven't been admitted yet are left pending.
    //
    void
    cancel ();

    bool
    cancelled () const noexcept
    {
      return cancelled_.load ();
    }

    bool
    finished () const;

  private:
    asio::awaitable<void>
    process (download_task_ptr);

    void
    spawn (download_task_ptr);

    // Mark the task's coroutine as done and, if specified, move it to the
    // new state (unless it is already terminal).
    //
    // If the pause or cancel that led to the new state was withdrawn in the
    // meantime (resume, retry), instead move the task back to pending, keep
    // it live, and return true. The caller must then spawn it again.
    //
    bool
    settle (download_task&, std::optional<task_state> = std::nullopt);

  private:
    asio::any_io_executor ex_;
    download_listener& events_;
    transfer_engine engine_;
    std::uint16_t verb_;

    std::atomic<bool> cancelled_ {false};
    std::unique_ptr<async_semaphore> semaphore_;

    mutable std::mutex mutex_;
    bool started_ {false};
    bool finished_ {false};
    std::size_t outstanding_ {0};          // Spawned, not yet returned.
    std::set<std::string> live_;           // Ids with a live coroutine.
    std::vector<download_task_ptr> queued_; // Admitted before run().
  };
}
