#pragma once

#include <atomic>
#include <filesystem>
#include <utility>

#include <boost/asio.hpp>

#include <reelget/download/download-types.hxx>
#include <reelget/download/download-task.hxx>
#include <reelget/download/download-events.hxx>
#include <reelget/resolve/url-resolver.hxx>

namespace reelget
{
  namespace asio = boost::asio;

  // Where a task's bytes go.
  //
  struct task_files
  {
    std::filesystem::path temp;  // <root>/<collection>/<item><ext>.tmp
    std::filesystem::path final; // Same without .tmp.
  };

  // Transfer engine.
  //
  // Drive one task from URL resolution to the final file: resolve, issue a
  // (ranged, if there is a partial temporary file) GET, stream the body to
  // the temporary file, and rename it once the body is consumed.
  //
  // Pause and cancellation are cooperative and checked once per chunk. A
  // paused or cancelled transfer leaves the temporary file where it is.
  //
  // Failures (resolution, unexpected HTTP status, transport, filesystem) are
  // not handled here: they propagate as exceptions to the caller, which is
  // expected to mark the task failed.
  //
  class transfer_engine
  {
  public:
    transfer_engine (url_resolver&, download_listener&, download_settings);

    transfer_engine (const transfer_engine&) = delete;
    transfer_engine& operator= (const transfer_engine&) = delete;

    // Execute the task. The batch_cancelled flag is the batch-wide stop
    // request; the per-task ones are on the task itself.
    //
    asio::awaitable<transfer_outcome>
    execute (download_task&, const std::atomic<bool>& batch_cancelled);

    const download_settings&
    settings () const noexcept
    {
      return settings_;
    }

    // Compute the file paths for the task. Names that sanitize to nothing
    // fall back to the corresponding id.
    //
    static task_files
    files (const download_settings&, const download_task&);

  private:
    url_resolver& resolver_;
    download_listener& events_;
    download_settings settings_;
  };
}
