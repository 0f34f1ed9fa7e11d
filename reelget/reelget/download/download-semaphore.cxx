#include <reelget/download/download-semaphore.hxx>

#include <algorithm>
#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace reelget
{
  async_semaphore::
  async_semaphore (asio::any_io_executor ex, size_t n)
    : ex_ (move (ex)), count_ (n)
  {
  }

  asio::awaitable<void> async_semaphore::
  acquire ()
  {
    if (count_ != 0 && waiters_.empty ())
    {
      --count_;
      co_return;
    }

    waiter w (ex_);
    waiters_.push_back (&w);

    // If the coroutine is destroyed while parked (say, the context is torn
    // down), take ourselves off the queue so release() won't touch a dead
    // frame.
    //
    struct unlink
    {
      deque<waiter*>& q;
      waiter& w;

      ~unlink ()
      {
        if (!w.granted)
          q.erase (remove (q.begin (), q.end (), &w), q.end ());
      }
    } g {waiters_, w};

    while (!w.granted)
    {
      boost::system::error_code ec;
      co_await w.timer.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));
    }
  }

  void async_semaphore::
  release ()
  {
    if (waiters_.empty ())
    {
      ++count_;
      return;
    }

    waiter* w (waiters_.front ());
    waiters_.pop_front ();

    w->granted = true;
    w->timer.cancel ();
  }
}
