#include <reelget/resolve/rate-limiter.hxx>

#include <iostream>
#include <utility>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace reelget
{
  sliding_window_limiter::
  sliding_window_limiter (size_t n, duration w)
    : max_calls_ (n != 0 ? n : 1), window_ (w)
  {
  }

  optional<sliding_window_limiter::duration> sliding_window_limiter::
  try_acquire (time_point now)
  {
    lock_guard<mutex> l (mutex_);

    // Drop the calls that have slid out of the window.
    //
    while (!calls_.empty () && calls_.front () + window_ <= now)
      calls_.pop_front ();

    if (calls_.size () < max_calls_)
    {
      calls_.push_back (now);
      return nullopt;
    }

    return calls_.front () + window_ - now;
  }

  asio::awaitable<sliding_window_limiter::duration> sliding_window_limiter::
  acquire ()
  {
    auto ex (co_await asio::this_coro::executor);

    duration waited (duration::zero ());

    for (;;)
    {
      time_point now (clock_type::now ());
      optional<duration> w (try_acquire (now));

      if (!w)
        co_return waited;

      asio::steady_timer t (ex, *w);
      co_await t.async_wait (asio::use_awaitable);

      waited += clock_type::now () - now;
    }
  }

  rate_limited_resolver::
  rate_limited_resolver (url_resolver& r,
                         size_t n,
                         sliding_window_limiter::duration w,
                         uint16_t v)
    : resolver_ (r), limiter_ (n, w), verb_ (v)
  {
  }

  asio::awaitable<resolved_url> rate_limited_resolver::
  resolve (const string& id, const string& quality)
  {
    auto w (co_await limiter_.acquire ());

    if (verb_ >= 3 && w != sliding_window_limiter::duration::zero ())
    {
      cerr << "trace: rate limit delayed resolution of " << id << " by "
           << chrono::duration_cast<chrono::milliseconds> (w).count ()
           << "ms" << endl;
    }

    co_return co_await resolver_.resolve (id, quality);
  }
}
