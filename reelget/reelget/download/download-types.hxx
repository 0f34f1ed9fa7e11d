#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <filesystem>

namespace reelget
{
  namespace fs = std::filesystem;

  // Task state.
  //
  // pending -> fetching -> downloading -> {completed | failed | cancelled}
  //
  // Paused is reachable from pending and downloading and goes back to
  // pending on resume. Anything can be cancelled.
  //
  enum class task_state
  {
    pending,     // Waiting for admission.
    fetching,    // Resolving the transfer URL.
    downloading, // Streaming to the temporary file.
    paused,      // Stopped by the user, partial file kept.
    completed,
    failed,
    cancelled
  };

  std::string
  to_string (task_state);

  inline std::ostream&
  operator<< (std::ostream& os, task_state s)
  {
    return os << to_string (s);
  }

  inline bool
  terminal (task_state s) noexcept
  {
    return s == task_state::completed ||
           s == task_state::failed    ||
           s == task_state::cancelled;
  }

  // How a single transfer ended (failures are exceptions).
  //
  enum class transfer_outcome
  {
    completed,
    paused,
    cancelled
  };

  std::ostream&
  operator<< (std::ostream&, transfer_outcome);

  // The collection (a drama, a series) that sub-items belong to. The name is
  // what the download directory is called.
  //
  struct collection_item
  {
    std::string id;
    std::string name;
  };

  // A single downloadable sub-item (an episode).
  //
  struct sub_item
  {
    std::string id;
    std::string title;
    std::uint32_t number {0};
  };

  // Task identity: stable for the same (collection, sub-item) pair.
  //
  std::string
  make_task_id (const std::string& collection_id, const std::string& item_id);

  // Replace the characters that are invalid in file names on at least one of
  // the platforms we care about (<>:"/\|?*) with '_' and trim surrounding
  // whitespace.
  //
  std::string
  sanitize_filename (const std::string&);

  // Download settings.
  //
  struct download_settings
  {
    // Root directory; each collection gets a subdirectory.
    //
    fs::path download_root {"downloads"};

    // Quality label passed to the URL resolver.
    //
    std::string quality {"1080p"};

    // Maximum number of tasks in the fetching/downloading phase.
    //
    std::size_t max_concurrent {3};

    // Per-task throughput cap in bytes/sec (0 = unlimited).
    //
    std::uint64_t speed_limit {0};

    // Body chunk size. Pause and cancel are honored at this granularity.
    //
    std::size_t chunk_size {64 * 1024};

    // Appended to the sub-item title to form the file name.
    //
    std::string file_extension {".mp4"};

    // Timeouts in seconds (0 = none). The read timeout applies to each
    // chunk, not to the whole transfer.
    //
    std::uint32_t connect_timeout {30};
    std::uint32_t read_timeout {60};

    std::string user_agent {"Mozilla/5.0"};

    // Diagnostics level: 0 errors only, 1 warnings, 2 info, 3 trace.
    //
    std::uint16_t verbosity {0};

    static constexpr std::size_t min_concurrent = 1;
    static constexpr std::size_t max_concurrent_limit = 10;

    static std::size_t
    clamp_concurrent (long long n) noexcept
    {
      if (n < static_cast<long long> (min_concurrent))
        return min_concurrent;

      if (n > static_cast<long long> (max_concurrent_limit))
        return max_concurrent_limit;

      return static_cast<std::size_t> (n);
    }

    static std::uint64_t
    clamp_speed_limit (long long n) noexcept
    {
      return n > 0 ? static_cast<std::uint64_t> (n) : 0;
    }
  };
}
