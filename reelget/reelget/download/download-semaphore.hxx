#pragma once

#include <deque>
#include <cstddef>
#include <utility>

#include <boost/asio.hpp>

namespace reelget
{
  namespace asio = boost::asio;

  // Counting semaphore for coroutines.
  //
  // Waiters park on a timer that never expires and are woken by cancelling
  // it. A released slot is handed directly to the oldest waiter so that
  // nobody can barge in between the release and the wakeup.
  //
  // Note that this is not thread-safe: all the coroutines using it must run
  // on the same single-threaded executor.
  //
  class async_semaphore
  {
  public:
    async_semaphore (asio::any_io_executor ex, std::size_t count);

    async_semaphore (const async_semaphore&) = delete;
    async_semaphore& operator= (const async_semaphore&) = delete;

    asio::awaitable<void>
    acquire ();

    void
    release ();

    std::size_t
    available () const noexcept
    {
      return count_;
    }

    std::size_t
    waiting () const noexcept
    {
      return waiters_.size ();
    }

  private:
    struct waiter
    {
      explicit
      waiter (const asio::any_io_executor& ex)
        : timer (ex, asio::steady_timer::time_point::max ()) {}

      asio::steady_timer timer;
      bool granted {false};
    };

    asio::any_io_executor ex_;
    std::size_t count_;
    std::deque<waiter*> waiters_;
  };

  // Release the slot on scope exit, including when unwinding.
  //
  class semaphore_slot
  {
  public:
    explicit
    semaphore_slot (async_semaphore& s) noexcept : s_ (s) {}

    semaphore_slot (const semaphore_slot&) = delete;
    semaphore_slot& operator= (const semaphore_slot&) = delete;

    ~semaphore_slot ()
    {
      s_.release ();
    }

  private:
    async_semaphore& s_;
  };
}
