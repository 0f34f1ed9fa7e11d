#pragma once

#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <chrono>
#include <cstddef>
#include <optional>
#include <filesystem>
#include <condition_variable>
#include <utility>

#include <boost/asio.hpp>

#include <reelget/download/download-types.hxx>
#include <reelget/download/download-task.hxx>
#include <reelget/download/download-events.hxx>
#include <reelget/download/batch-runner.hxx>
#include <reelget/resolve/url-resolver.hxx>

namespace reelget
{
  namespace asio = boost::asio;

  // Download manager.
  //
  // The facade: owns the task registry, at most one active batch runner, and
  // the worker thread the runner executes on. None of the functions block
  // for long (the batch-wide cancel() waits for the runner to unwind, up to
  // a few seconds) and none throw because of a task failing; failures are
  // reported as task_failed events with the task left in the failed state.
  //
  // The resolver must outlive the manager.
  //
  class download_manager
  {
  public:
    explicit
    download_manager (url_resolver&, download_settings = download_settings ());

    ~download_manager ();

    download_manager (const download_manager&) = delete;
    download_manager& operator= (const download_manager&) = delete;

    // Register a task. If one with the same identity already exists, return
    // it unchanged (and don't notify).
    //
    download_task_ptr
    add (const collection_item&, const sub_item&);

    std::vector<download_task_ptr>
    add (const collection_item&, const std::vector<sub_item>&);

    // Launch a batch runner over all the pending tasks unless one is already
    // running or there is nothing to do.
    //
    void
    start ();

    // Only has effect while running.
    //
    void
    pause (const std::string& id);

    void
    resume (const std::string& id);

    // Put a failed or cancelled task back to pending and run it again. Any
    // partial file is resumed.
    //
    void
    retry (const std::string& id);

    void
    cancel (const std::string& id);

    // Stop the whole batch and wait (briefly) for the runner to unwind.
    //
    void
    cancel ();

    // Remove completed tasks from the registry (the files stay). Return the
    // number removed.
    //
    std::size_t
    clear_completed ();

    download_task_ptr
    get (const std::string& id) const;

    // In the order added.
    //
    std::vector<download_task_ptr>
    list () const;

    bool
    running () const;

    // Block until no runner is active. Return false on timeout.
    //
    bool
    wait (std::chrono::milliseconds timeout);

    void
    wait ();

    // Settings. Changes apply to the next runner.
    //
    download_settings
    settings () const;

    void
    max_concurrent (long long);

    void
    speed_limit (long long);

    void
    download_root (std::filesystem::path);

    void
    quality (std::string);

    // The listener must stay valid until unsubscribed.
    //
    void
    subscribe (download_listener&);

    void
    unsubscribe (download_listener&);

  private:
    // Fan the events out to the subscribers.
    //
    class relay: public download_listener
    {
    public:
      void
      attach (download_listener&);

      void
      detach (download_listener&);

      void
      task_added (const download_task_ptr&) override;

      void
      task_started (const std::string&) override;

      void
      task_progress (const std::string&,
                     double,
                     std::uint64_t,
                     std::uint64_t,
                     double) override;

      void
      task_completed (const std::string&) override;

      void
      task_failed (const std::string&, const std::string&) override;

      void
      task_paused (const std::string&) override;

      void
      task_cancelled (const std::string&) override;

      void
      all_completed () override;

    private:
      template <typename F>
      void
      each (F&&);

      std::mutex mutex_;
      std::vector<download_listener*> listeners_;
    };

    download_task_ptr
    find (const std::string& id) const;

    // Launch a runner over the pending tasks. Call with the mutex held.
    //
    void
    launch ();

    // Hand a pending task to the active runner or launch one. Call with the
    // mutex held.
    //
    void
    enqueue (const download_task_ptr&);

    void
    finish (const std::shared_ptr<batch_runner>&);

  private:
    url_resolver& resolver_;
    relay relay_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    download_settings settings_;
    std::vector<download_task_ptr> tasks_;
    std::shared_ptr<batch_runner> runner_;
    bool restart_ {false}; // Relaunch once the active runner finishes.

    asio::io_context ioc_;
    std::optional<asio::executor_work_guard<
      asio::io_context::executor_type>> work_;
    std::thread worker_;
  };
}
