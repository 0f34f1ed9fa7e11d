#include <reelget/download/download-task.hxx>

#include <utility>

using namespace std;

namespace reelget
{
  download_task::
  download_task (collection_item c, sub_item i)
    : id_ (make_task_id (c.id, i.id)),
      collection_ (move (c)),
      item_ (move (i))
  {
  }

  double download_task::
  progress () const
  {
    if (state.load () == task_state::completed)
      return 100.0;

    pair<uint64_t, uint64_t> b (bytes ());
    if (b.second == 0)
      return 0.0;

    return static_cast<double> (b.first) / b.second * 100.0;
  }

  void download_task::
  update_bytes (uint64_t d, uint64_t t)
  {
    // A server that sends more than it announced still must not break the
    // invariant, so grow the total along.
    //
    if (t != 0 && d > t)
      t = d;

    lock_guard<mutex> l (mutex_);
    total_bytes.store (t);
    downloaded_bytes.store (d);
  }

  pair<uint64_t, uint64_t> download_task::
  bytes () const
  {
    lock_guard<mutex> l (mutex_);
    return make_pair (downloaded_bytes.load (), total_bytes.load ());
  }

  bool download_task::
  fail (string e)
  {
    lock_guard<mutex> l (mutex_);

    task_state s (state.load ());
    do
    {
      if (reelget::terminal (s))
        return false;
    }
    while (!state.compare_exchange_weak (s, task_state::failed));

    error_ = move (e);
    return true;
  }

  void download_task::
  reset ()
  {
    {
      lock_guard<mutex> l (mutex_);
      error_.clear ();
    }

    pause_requested.store (false);
    cancel_requested.store (false);
    speed.store (0.0);
  }

  string download_task::
  transfer_url () const
  {
    lock_guard<mutex> l (mutex_);
    return url_;
  }

  void download_task::
  transfer_url (string u)
  {
    lock_guard<mutex> l (mutex_);
    url_ = move (u);
  }

  filesystem::path download_task::
  temp_path () const
  {
    lock_guard<mutex> l (mutex_);
    return temp_path_;
  }

  filesystem::path download_task::
  final_path () const
  {
    lock_guard<mutex> l (mutex_);
    return final_path_;
  }

  void download_task::
  paths (filesystem::path t, filesystem::path f)
  {
    lock_guard<mutex> l (mutex_);
    temp_path_ = move (t);
    final_path_ = move (f);
  }

  string download_task::
  error () const
  {
    lock_guard<mutex> l (mutex_);
    return error_;
  }
}
