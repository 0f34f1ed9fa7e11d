#pragma once

#include <mutex>
#include <deque>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include <boost/asio.hpp>

#include <reelget/resolve/url-resolver.hxx>

namespace reelget
{
  // Sliding-window rate limiter.
  //
  // Allow at most max_calls acquisitions in any trailing window. Callers over
  // the limit are delayed until the oldest call in the window expires, never
  // rejected. Thread-safe.
  //
  class sliding_window_limiter
  {
  public:
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

    sliding_window_limiter (std::size_t max_calls, duration window);

    // Record a call at now if there is room and return nullopt. Otherwise
    // return how long to wait before trying again.
    //
    std::optional<duration>
    try_acquire (time_point now);

    // Wait (on the current coroutine's executor) until a call is allowed and
    // record it. Return the total time spent waiting.
    //
    asio::awaitable<duration>
    acquire ();

    std::size_t
    max_calls () const noexcept
    {
      return max_calls_;
    }

    duration
    window () const noexcept
    {
      return window_;
    }

  private:
    std::size_t max_calls_;
    duration window_;

    std::mutex mutex_;
    std::deque<time_point> calls_;
  };

  // Resolver decorator that runs every call through a limiter.
  //
  class rate_limited_resolver: public url_resolver
  {
  public:
    // Five calls per ten seconds is what the public playback APIs we know of
    // tolerate.
    //
    static constexpr std::size_t default_max_calls = 5;
    static constexpr std::chrono::seconds default_window {10};

    explicit
    rate_limited_resolver (url_resolver& r,
                           std::size_t max_calls = default_max_calls,
                           sliding_window_limiter::duration window =
                             default_window,
                           std::uint16_t verbosity = 0);

    asio::awaitable<resolved_url>
    resolve (const std::string& item_id, const std::string& quality) override;

    sliding_window_limiter&
    limiter () noexcept
    {
      return limiter_;
    }

  private:
    url_resolver& resolver_;
    sliding_window_limiter limiter_;
    std::uint16_t verb_;
  };
}
