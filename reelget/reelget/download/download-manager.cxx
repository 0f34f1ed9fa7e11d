#include <reelget/download/download-manager.hxx>

#include <utility>
#include <iostream>
#include <algorithm>
#include <exception>

#include <boost/asio/co_spawn.hpp>

using namespace std;

namespace reelget
{
  // relay
  //
  void download_manager::relay::
  attach (download_listener& l)
  {
    lock_guard<mutex> g (mutex_);

    if (std::find (listeners_.begin (), listeners_.end (), &l) == listeners_.end ())
      listeners_.push_back (&l);
  }

  void download_manager::relay::
  detach (download_listener& l)
  {
    lock_guard<mutex> g (mutex_);
    listeners_.erase (remove (listeners_.begin (), listeners_.end (), &l),
                      listeners_.end ());
  }

  template <typename F>
  void download_manager::relay::
  each (F&& f)
  {
    // Call without holding the lock so that a listener can (un)subscribe or
    // call back into the manager.
    //
    vector<download_listener*> ls;
    {
      lock_guard<mutex> g (mutex_);
      ls = listeners_;
    }

    for (download_listener* l: ls)
      f (*l);
  }

  void download_manager::relay::
  task_added (const download_task_ptr& t)
  {
    each ([&t] (download_listener& l) {l.task_added (t);});
  }

  void download_manager::relay::
  task_started (const string& id)
  {
    each ([&id] (download_listener& l) {l.task_started (id);});
  }

  void download_manager::relay::
  task_progress (const string& id,
                 double p,
                 uint64_t d,
                 uint64_t t,
                 double s)
  {
    each ([&] (download_listener& l) {l.task_progress (id, p, d, t, s);});
  }

  void download_manager::relay::
  task_completed (const string& id)
  {
    each ([&id] (download_listener& l) {l.task_completed (id);});
  }

  void download_manager::relay::
  task_failed (const string& id, const string& e)
  {
    each ([&id, &e] (download_listener& l) {l.task_failed (id, e);});
  }

  void download_manager::relay::
  task_paused (const string& id)
  {
    each ([&id] (download_listener& l) {l.task_paused (id);});
  }

  void download_manager::relay::
  task_cancelled (const string& id)
  {
    each ([&id] (download_listener& l) {l.task_cancelled (id);});
  }

  void download_manager::relay::
  all_completed ()
  {
    each ([] (download_listener& l) {l.all_completed ();});
  }

  // download_manager
  //
  download_manager::
  download_manager (url_resolver& r, download_settings s)
    : resolver_ (r),
      settings_ (move (s)),
      work_ (asio::make_work_guard (ioc_))
  {
    settings_.max_concurrent =
      download_settings::clamp_concurrent (
        static_cast<long long> (settings_.max_concurrent));

    worker_ = thread ([this] ()
    {
      for (;;)
      {
        try
        {
          ioc_.run ();
          break;
        }
        catch (const exception& e)
        {
          cerr << "error: download worker: " << e.what () << endl;
        }
      }
    });
  }

  download_manager::
  ~download_manager ()
  {
    cancel ();

    work_.reset ();
    ioc_.stop ();

    if (worker_.joinable ())
      worker_.join ();
  }

  download_task_ptr download_manager::
  add (const collection_item& c, const sub_item& i)
  {
    download_task_ptr t;
    {
      lock_guard<mutex> l (mutex_);

      if (download_task_ptr e = find (make_task_id (c.id, i.id)))
        return e;

      t = make_shared<download_task> (c, i);
      tasks_.push_back (t);
    }

    relay_.task_added (t);
    return t;
  }

  vector<download_task_ptr> download_manager::
  add (const collection_item& c, const vector<sub_item>& is)
  {
    vector<download_task_ptr> r;
    r.reserve (is.size ());

    for (const sub_item& i: is)
      r.push_back (add (c, i));

    return r;
  }

  void download_manager::
  start ()
  {
    lock_guard<mutex> l (mutex_);

    if (runner_ == nullptr)
      launch ();
  }

  void download_manager::
  launch ()
  {
    vector<download_task_ptr> ts;
    for (const download_task_ptr& t: tasks_)
    {
      if (t->state.load () == task_state::pending)
        ts.push_back (t);
    }

    if (ts.empty ())
      return;

    if (settings_.verbosity >= 2)
      cerr << "info: starting batch of " << ts.size () << " task(s), "
           << settings_.max_concurrent << " at a time" << endl;

    auto r (make_shared<batch_runner> (ioc_.get_executor (),
                                       resolver_,
                                       relay_,
                                       settings_));
    runner_ = r;

    asio::co_spawn (
      ioc_,
      r->run (move (ts), settings_.max_concurrent),
      [this, r] (exception_ptr e)
      {
        if (e)
        {
          try
          {
            rethrow_exception (e);
          }
          catch (const exception& x)
          {
            cerr << "error: batch runner: " << x.what () << endl;
          }
        }

        finish (r);
      });
  }

  void download_manager::
  finish (const shared_ptr<batch_runner>& r)
  {
    {
      lock_guard<mutex> l (mutex_);

      if (runner_ != r)
        return;
    }

    relay_.all_completed ();

    {
      lock_guard<mutex> l (mutex_);

      runner_.reset ();

      // Something was resumed or retried as this runner was winding down.
      //
      if (restart_)
      {
        restart_ = false;
        launch ();
      }
    }

    idle_.notify_all ();
  }

  void download_manager::
  enqueue (const download_task_ptr& t)
  {
    if (runner_ == nullptr)
      launch ();
    else if (!runner_->admit (t))
      restart_ = true;
  }

  void download_manager::
  pause (const string& id)
  {
    lock_guard<mutex> l (mutex_);

    if (runner_ == nullptr)
      return;

    if (download_task_ptr t = find (id))
    {
      if (!t->terminal () && t->state.load () != task_state::paused)
        runner_->pause (t);
    }
  }

  void download_manager::
  resume (const string& id)
  {
    lock_guard<mutex> l (mutex_);

    download_task_ptr t (find (id));
    if (t == nullptr)
      return;

    if (t->state.load () == task_state::paused)
    {
      t->pause_requested.store (false);
      t->transition (task_state::paused, task_state::pending);
    }
    else if (t->pause_requested.load ())
    {
      // Pause requested but not yet honored.
      //
      t->pause_requested.store (false);
    }
    else
      return;

    if (runner_ == nullptr)
      launch ();
    else if (!runner_->resume (t))
      restart_ = true;
  }

  void download_manager::
  retry (const string& id)
  {
    lock_guard<mutex> l (mutex_);

    download_task_ptr t (find (id));
    if (t == nullptr)
      return;

    task_state s (t->state.load ());
    if (s != task_state::failed && s != task_state::cancelled)
      return;

    t->reset ();

    if (!t->transition (s, task_state::pending))
      return;

    if (settings_.verbosity >= 2)
      cerr << "info: retrying " << id << endl;

    enqueue (t);
  }

  void download_manager::
  cancel (const string& id)
  {
    download_task_ptr t;
    {
      lock_guard<mutex> l (mutex_);

      t = find (id);
      if (t == nullptr || t->terminal ())
        return;

      t->cancel_requested.store (true);
      t->state.store (task_state::cancelled);

      if (runner_ != nullptr)
        runner_->cancel (t);
    }

    relay_.task_cancelled (id);
  }

  void download_manager::
  cancel ()
  {
    shared_ptr<batch_runner> r;
    {
      lock_guard<mutex> l (mutex_);

      restart_ = false;
      r = runner_;
    }

    if (r == nullptr)
      return;

    r->cancel ();

    // Waiting on the worker thread (say, from a listener) would deadlock.
    //
    if (this_thread::get_id () == worker_.get_id ())
      return;

    unique_lock<mutex> l (mutex_);
    if (!idle_.wait_for (l,
                         chrono::milliseconds (5000),
                         [this, &r] {return runner_ != r;}))
    {
      if (settings_.verbosity >= 1)
        cerr << "warning: batch did not stop in time" << endl;
    }
  }

  size_t download_manager::
  clear_completed ()
  {
    lock_guard<mutex> l (mutex_);

    auto i (remove_if (tasks_.begin (), tasks_.end (),
                       [] (const download_task_ptr& t)
                       {
                         return t->completed ();
                       }));

    size_t n (tasks_.end () - i);
    tasks_.erase (i, tasks_.end ());
    return n;
  }

  download_task_ptr download_manager::
  find (const string& id) const
  {
    for (const download_task_ptr& t: tasks_)
    {
      if (t->id () == id)
        return t;
    }

    return nullptr;
  }

  download_task_ptr download_manager::
  get (const string& id) const
  {
    lock_guard<mutex> l (mutex_);
    return find (id);
  }

  vector<download_task_ptr> download_manager::
  list () const
  {
    lock_guard<mutex> l (mutex_);
    return tasks_;
  }

  bool download_manager::
  running () const
  {
    lock_guard<mutex> l (mutex_);
    return runner_ != nullptr;
  }

  bool download_manager::
  wait (chrono::milliseconds timeout)
  {
    unique_lock<mutex> l (mutex_);
    return idle_.wait_for (l, timeout, [this] {return runner_ == nullptr;});
  }

  void download_manager::
  wait ()
  {
    unique_lock<mutex> l (mutex_);
    idle_.wait (l, [this] {return runner_ == nullptr;});
  }

  download_settings download_manager::
  settings () const
  {
    lock_guard<mutex> l (mutex_);
    return settings_;
  }

  void download_manager::
  max_concurrent (long long n)
  {
    lock_guard<mutex> l (mutex_);
    settings_.max_concurrent = download_settings::clamp_concurrent (n);
  }

  void download_manager::
  speed_limit (long long n)
  {
    lock_guard<mutex> l (mutex_);
    settings_.speed_limit = download_settings::clamp_speed_limit (n);
  }

  void download_manager::
  download_root (filesystem::path p)
  {
    lock_guard<mutex> l (mutex_);
    settings_.download_root = move (p);
  }

  void download_manager::
  quality (string q)
  {
    lock_guard<mutex> l (mutex_);
    settings_.quality = move (q);
  }

  void download_manager::
  subscribe (download_listener& l)
  {
    relay_.attach (l);
  }

  void download_manager::
  unsubscribe (download_listener& l)
  {
    relay_.detach (l);
  }
}
