#include <reelget/download/batch-runner.hxx>

#include <chrono>
#include <utility>
#include <iostream>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace reelget
{
  batch_runner::
  batch_runner (asio::any_io_executor ex,
                url_resolver& r,
                download_listener& e,
                download_settings s)
    : ex_ (move (ex)),
      events_ (e),
      engine_ (r, e, s),
      verb_ (s.verbosity)
  {
  }

  asio::awaitable<void> batch_runner::
  run (vector<download_task_ptr> tasks, size_t n)
  {
    semaphore_ = make_unique<async_semaphore> (ex_, n != 0 ? n : 1);

    vector<download_task_ptr> ts;
    {
      lock_guard<mutex> l (mutex_);

      started_ = true;

      for (download_task_ptr& t: tasks)
      {
        if (live_.insert (t->id ()).second)
        {
          ++outstanding_;
          ts.push_back (move (t));
        }
      }

      for (download_task_ptr& t: queued_)
        ts.push_back (move (t));

      queued_.clear ();
    }

    for (download_task_ptr& t: ts)
      spawn (move (t));

    // Wait for every task coroutine to return.
    //
    // Tasks can be admitted while we are waiting so there is no fixed set
    // to join; we just poll the outstanding count.
    //
    asio::steady_timer timer (ex_);

    for (;;)
    {
      {
        lock_guard<mutex> l (mutex_);

        if (outstanding_ == 0)
        {
          finished_ = true;
          break;
        }
      }

      timer.expires_after (chrono::milliseconds (50));
      co_await timer.async_wait (asio::use_awaitable);
    }

    co_return;
  }

  void batch_runner::
  spawn (download_task_ptr t)
  {
    auto self (shared_from_this ());

    asio::co_spawn (
      ex_,
      process (t),
      [self, t] (exception_ptr e)
      {
        // process() handles everything derived from std::exception so this
        // is something exotic. Still account for the task.
        //
        if (e)
        {
          try
          {
            rethrow_exception (e);
          }
          catch (const exception& x)
          {
            cerr << "error: task " << t->id () << ": " << x.what () << endl;
          }
          catch (...)
          {
            cerr << "error: task " << t->id () << ": unknown exception"
                 << endl;
          }

          bool f (t->fail ("unknown error"));
          self->settle (*t);

          if (f)
            self->events_.task_failed (t->id (), "unknown error");
        }

        lock_guard<mutex> l (self->mutex_);
        --self->outstanding_;
      });
  }

  asio::awaitable<void> batch_runner::
  process (download_task_ptr t)
  {
    const string& id (t->id ());

    // Return true if the task should not be admitted, settling it.
    //
    auto skip = [this, &t] () -> bool
    {
      // A batch-wide cancel leaves the remaining tasks pending.
      //
      if (cancelled_.load ())
      {
        settle (*t);
        return true;
      }

      if (t->pause_requested.load ())
      {
        if (t->state.load () == task_state::pending)
        {
          if (settle (*t, task_state::paused))
            spawn (t);
          else
            events_.task_paused (t->id ());
        }
        else
          settle (*t);

        return true;
      }

      // Cancelled while waiting. Possibly retried since, in which case
      // settle() hands it back.
      //
      if (t->cancel_requested.load () ||
          t->state.load () == task_state::cancelled)
      {
        if (settle (*t, task_state::cancelled))
          spawn (t);

        return true;
      }

      // Otherwise dealt with.
      //
      if (t->state.load () != task_state::pending)
      {
        settle (*t);
        return true;
      }

      return false;
    };

    if (skip ())
      co_return;

    co_await semaphore_->acquire ();
    semaphore_slot slot (*semaphore_);

    if (skip ())
      co_return;

    if (verb_ >= 3)
      cerr << "trace: admitting " << id << endl;

    events_.task_started (id);

    optional<string> error;

    try
    {
      transfer_outcome o (co_await engine_.execute (*t, cancelled_));

      switch (o)
      {
      case transfer_outcome::completed:
        {
          settle (*t);
          events_.task_completed (id);
          break;
        }
      case transfer_outcome::paused:
        {
          if (settle (*t, task_state::paused))
            spawn (t);
          else
            events_.task_paused (id);

          break;
        }
      case transfer_outcome::cancelled:
        {
          if (settle (*t, task_state::cancelled))
          {
            spawn (t);
            break;
          }

          // An individually-cancelled task has already been reported by
          // whoever cancelled it. Neither is a retried one that the batch
          // cancel caught before it could run again.
          //
          if (!t->cancel_requested.load () &&
              t->state.load () == task_state::cancelled)
            events_.task_cancelled (id);

          break;
        }
      }
    }
    catch (const exception& e)
    {
      error = e.what ();
    }

    if (error)
    {
      // A transport error caused by the cancellation itself is not a
      // failure. Neither is one hit by a run that was retried meanwhile.
      //
      if (t->cancel_requested.load () ||
          t->state.load () == task_state::pending)
      {
        if (settle (*t, task_state::cancelled))
          spawn (t);
      }
      else
      {
        if (verb_ >= 1)
          cerr << "warning: download of " << id << " failed: " << *error
               << endl;

        // Lose to a cancel that landed after the check above.
        //
        bool f (t->fail (*error));
        settle (*t);

        if (f)
          events_.task_failed (id, *error);
      }
    }
  }

  bool batch_runner::
  settle (download_task& t, optional<task_state> s)
  {
    lock_guard<mutex> l (mutex_);

    task_state c (t.state.load ());

    // A resume or retry that lands while the coroutine is unwinding finds
    // the id live and leaves the task to us (see admit()). So the flags
    // seen here, under the lock, take precedence over the outcome: if the
    // request that produced it has since been withdrawn, run the task again.
    //
    if (s && !cancelled_.load ())
    {
      bool again (false);

      if (*s == task_state::paused)
        again = !t.pause_requested.load () &&
                !t.cancel_requested.load () &&
                !terminal (c);
      else if (*s == task_state::cancelled)
        again = c == task_state::pending && !t.cancel_requested.load ();

      if (again)
      {
        if (verb_ >= 3)
          cerr << "trace: readmitting " << t.id () << endl;

        t.state.store (task_state::pending);
        ++outstanding_;
        return true;
      }
    }

    live_.erase (t.id ());

    if (s && !terminal (c))
    {
      // A retried task caught by the batch cancel stays pending, like the
      // rest of the tasks that were never admitted.
      //
      if (!(*s == task_state::cancelled &&
            c == task_state::pending &&
            !t.cancel_requested.load ()))
        t.state.store (*s);
    }

    return false;
  }

  void batch_runner::
  pause (const download_task_ptr& t)
  {
    t->pause_requested.store (true);
  }

  bool batch_runner::
  resume (const download_task_ptr& t)
  {
    t->pause_requested.store (false);
    return admit (t);
  }

  bool batch_runner::
  admit (const download_task_ptr& t)
  {
    {
      lock_guard<mutex> l (mutex_);

      // A resume racing with the coroutine settling the task as paused.
      //
      if (!t->pause_requested.load ())
        t->transition (task_state::paused, task_state::pending);

      if (finished_)
        return false;

      // Still running (or waiting to run). Either it picks up the cleared
      // flags or settle() runs it again.
      //
      if (!live_.insert (t->id ()).second)
        return true;

      ++outstanding_;

      if (!started_)
      {
        queued_.push_back (t);
        return true;
      }
    }

    spawn (t);
    return true;
  }

  void batch_runner::
  cancel (const download_task_ptr& t)
  {
    t->cancel_requested.store (true);
  }

  void batch_runner::
  cancel ()
  {
    cancelled_.store (true);
  }

  bool batch_runner::
  finished () const
  {
    lock_guard<mutex> l (mutex_);
    return finished_;
  }
}
