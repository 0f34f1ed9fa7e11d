#pragma once

#include <mutex>
#include <atomic>
#include <string>
#include <memory>
#include <utility>
#include <cstdint>
#include <filesystem>

#include <reelget/download/download-types.hxx>

namespace reelget
{
  // Download task.
  //
  // The unit of work and its observable state. Counters and control flags
  // are atomic since they are written by the worker thread and read (or, for
  // the flags, written) by whoever drives the manager. The string fields are
  // guarded by a mutex.
  //
  class download_task
  {
  public:
    download_task (collection_item c, sub_item i);

    download_task (const download_task&) = delete;
    download_task& operator= (const download_task&) = delete;

    const std::string&
    id () const noexcept
    {
      return id_;
    }

    const collection_item&
    collection () const noexcept
    {
      return collection_;
    }

    const sub_item&
    item () const noexcept
    {
      return item_;
    }

    // State tracking.
    //
    // The byte counters are updated together (see update_bytes()). Use
    // bytes() to read them as a consistent pair.
    //
    std::atomic<task_state> state {task_state::pending};
    std::atomic<std::uint64_t> downloaded_bytes {0};
    std::atomic<std::uint64_t> total_bytes {0};
    std::atomic<double> speed {0.0}; // Bytes/sec, sampled.

    // Control.
    //
    std::atomic<bool> pause_requested {false};
    std::atomic<bool> cancel_requested {false};

    // Switch to the new state only if we are still in the expected one.
    //
    bool
    transition (task_state from, task_state to) noexcept
    {
      return state.compare_exchange_strong (from, to);
    }

    // Percentage derived from the byte counters: 100 once completed, 0 while
    // the total is unknown.
    //
    double
    progress () const;

    bool
    completed () const noexcept
    {
      return state.load () == task_state::completed;
    }

    bool
    failed () const noexcept
    {
      return state.load () == task_state::failed;
    }

    // In the fetching or downloading phase.
    //
    bool
    active () const noexcept
    {
      task_state s (state.load ());
      return s == task_state::fetching || s == task_state::downloading;
    }

    bool
    terminal () const noexcept
    {
      return reelget::terminal (state.load ());
    }

    // Update the byte counters keeping downloaded <= total once the total is
    // known.
    //
    void
    update_bytes (std::uint64_t downloaded, std::uint64_t total);

    // Consistent (downloaded, total) pair.
    //
    std::pair<std::uint64_t, std::uint64_t>
    bytes () const;

    // Record the failure and switch to failed unless the task has already
    // reached a terminal state (say, was cancelled). Return false in the
    // latter case.
    //
    bool
    fail (std::string error);

    // Clear the per-run state before the task is attempted again.
    //
    void
    reset ();

    std::string
    transfer_url () const;

    void
    transfer_url (std::string);

    std::filesystem::path
    temp_path () const;

    std::filesystem::path
    final_path () const;

    void
    paths (std::filesystem::path temp, std::filesystem::path final);

    std::string
    error () const;

  private:
    std::string id_;
    collection_item collection_;
    sub_item item_;

    mutable std::mutex mutex_;
    std::string url_;
    std::filesystem::path temp_path_;
    std::filesystem::path final_path_;
    std::string error_;
  };

  using download_task_ptr = std::shared_ptr<download_task>;
}
