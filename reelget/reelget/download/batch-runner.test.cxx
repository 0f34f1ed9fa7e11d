#include <reelget/download/batch-runner.hxx>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cassert>
#include <fstream>
#include <iterator>
#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <reelget/download/test-server.hxx>

using namespace std;
using namespace reelget;
using namespace reelget::test;

namespace fs = std::filesystem;

struct scratch
{
  fs::path path;

  explicit
  scratch (const string& n)
      : path (fs::temp_directory_path () / ("reelget-runner-" + n))
  {
    fs::remove_all (path);
  }

  ~scratch ()
  {
    error_code ec;
    fs::remove_all (path, ec);
  }
};

// Sample how many tasks are in the fetching/downloading phase on every
// event.
//
class active_sampler: public event_recorder
{
public:
  vector<download_task_ptr> tasks;
  size_t max_active {0};

  void
  sample ()
  {
    size_t n (count_if (tasks.begin (), tasks.end (),
                        [] (const download_task_ptr& t) {return t->active ();}));
    max_active = max (max_active, n);
  }

  void
  task_started (const string& id) override
  {
    event_recorder::task_started (id);
    sample ();
  }

  void
  task_progress (const string& id,
                 double p,
                 uint64_t d,
                 uint64_t t,
                 double s) override
  {
    event_recorder::task_progress (id, p, d, t, s);
    sample ();
  }
};

static vector<download_task_ptr>
make_tasks (size_t n)
{
  vector<download_task_ptr> r;
  for (size_t i (1); i <= n; ++i)
  {
    string id ("v" + std::to_string (i));
    r.push_back (make_shared<download_task> (
                   collection_item {"c1", "Collection"},
                   sub_item {id, "Episode " + std::to_string (i),
                             static_cast<uint32_t> (i)}));
  }
  return r;
}

static void
run (asio::io_context& ioc,
     const shared_ptr<batch_runner>& r,
     vector<download_task_ptr> ts,
     size_t n)
{
  exception_ptr ex;
  asio::co_spawn (ioc,
                  r->run (move (ts), n),
                  [&ex] (exception_ptr x) {ex = x;});
  ioc.run ();

  if (ex)
    rethrow_exception (ex);
}

static void
test_bound ()
{
  scratch d ("bound");

  test_server::options o;
  o.delay = chrono::milliseconds (5);

  test_server srv (o);
  server_resolver res (srv);

  active_sampler ev;
  ev.tasks = make_tasks (6);

  for (const download_task_ptr& t: ev.tasks)
    srv.add ("/" + t->item ().id, make_payload (128 * 1024));

  download_settings s;
  s.download_root = d.path;

  asio::io_context ioc;
  auto r (make_shared<batch_runner> (ioc.get_executor (), res, ev, s));

  run (ioc, r, ev.tasks, 2);

  assert (r->finished ());
  assert (ev.max_active >= 1 && ev.max_active <= 2);
  assert (ev.started.size () == 6);
  assert (ev.completed.size () == 6);
  assert (ev.failed.empty ());

  for (const download_task_ptr& t: ev.tasks)
  {
    assert (t->completed ());
    assert (fs::file_size (t->final_path ()) == 128 * 1024);
  }

  // Once done, nothing else gets in.
  //
  auto extra (make_tasks (1));
  assert (!r->admit (extra[0]));
}

// One task failing leaves the others alone.
//
static void
test_isolation ()
{
  scratch d ("isolation");

  test_server srv;
  server_resolver res (srv);
  event_recorder ev;

  auto ts (make_tasks (4));

  srv.add ("/v1", make_payload (64 * 1024));
  srv.add ("/v3", make_payload (64 * 1024));
  res.fail ("v2"); // v4 is not on the server.

  download_settings s;
  s.download_root = d.path;

  asio::io_context ioc;
  auto r (make_shared<batch_runner> (ioc.get_executor (), res, ev, s));

  run (ioc, r, ts, 3);

  assert (ev.completed.size () == 2);
  assert (ev.failed.size () == 2);

  assert (ts[0]->completed ());
  assert (ts[1]->failed ());
  assert (ts[2]->completed ());
  assert (ts[3]->failed ());

  assert (ts[1]->error () == "no playable URL for v2");
  assert (ts[3]->error () == "HTTP 404");

  auto i (find_if (ev.failed.begin (), ev.failed.end (),
                   [] (const pair<string, string>& f)
                   {
                     return f.first == "c1_v4";
                   }));

  assert (i != ev.failed.end () && i->second == "HTTP 404");
}

// A task paused before it is admitted is parked, not run.
//
static void
test_pause_pending ()
{
  scratch d ("pause");

  test_server srv;
  server_resolver res (srv);
  event_recorder ev;

  auto ts (make_tasks (2));
  srv.add ("/v1", make_payload (32 * 1024));
  srv.add ("/v2", make_payload (32 * 1024));

  download_settings s;
  s.download_root = d.path;

  asio::io_context ioc;
  auto r (make_shared<batch_runner> (ioc.get_executor (), res, ev, s));

  r->pause (ts[1]);
  run (ioc, r, ts, 1);

  assert (ts[0]->completed ());
  assert (ts[1]->state.load () == task_state::paused);
  assert (ev.paused == vector<string> {"c1_v2"});
  assert (ev.started == vector<string> {"c1_v1"});
  assert (res.calls () == 1);
}

// Admitted while running: picked up by the same batch.
//
static void
test_admit ()
{
  scratch d ("admit");

  test_server::options o;
  o.delay = chrono::milliseconds (5);

  test_server srv (o);
  server_resolver res (srv);
  event_recorder ev;

  auto ts (make_tasks (2));
  srv.add ("/v1", make_payload (128 * 1024));
  srv.add ("/v2", make_payload (16 * 1024));

  download_settings s;
  s.download_root = d.path;

  asio::io_context ioc;
  auto r (make_shared<batch_runner> (ioc.get_executor (), res, ev, s));

  // Admit the second one as soon as the first one starts.
  //
  ev.hook = [&r, &ts] (const string& e, const string& id)
  {
    if (e == "started" && id == "c1_v1")
      assert (r->admit (ts[1]));
  };

  run (ioc, r, {ts[0]}, 2);

  assert (ts[0]->completed ());
  assert (ts[1]->completed ());
  assert (ev.completed.size () == 2);

  assert (!r->admit (ts[0]));
}

// Batch-wide cancel: the in-flight task ends cancelled, the rest stay
// pending, and nobody is reported failed or completed.
//
static void
test_cancel ()
{
  scratch d ("cancel");

  test_server::options o;
  o.delay = chrono::milliseconds (10);

  test_server srv (o);
  server_resolver res (srv);
  event_recorder ev;

  auto ts (make_tasks (3));
  for (const download_task_ptr& t: ts)
    srv.add ("/" + t->item ().id, make_payload (512 * 1024));

  download_settings s;
  s.download_root = d.path;

  asio::io_context ioc;
  auto r (make_shared<batch_runner> (ioc.get_executor (), res, ev, s));

  ev.hook = [&r] (const string& e, const string&)
  {
    if (e == "started")
      r->cancel ();
  };

  run (ioc, r, ts, 1);

  assert (r->cancelled ());
  assert (ev.failed.empty ());
  assert (ev.completed.empty ());
  assert (ev.cancelled == vector<string> {"c1_v1"});

  assert (ts[0]->state.load () == task_state::cancelled);
  assert (ts[1]->state.load () == task_state::pending);
  assert (ts[2]->state.load () == task_state::pending);
}

// Cancel and retry a task from within its own progress report, the way a
// subscriber reacting to progress would do it through the manager. The run
// in flight carries on and its result counts.
//
class retrying_recorder: public event_recorder
{
public:
  shared_ptr<batch_runner> runner;
  download_task_ptr task;
  bool done {false};

  void
  task_progress (const string& id,
                 double p,
                 uint64_t d,
                 uint64_t t,
                 double s) override
  {
    event_recorder::task_progress (id, p, d, t, s);

    if (done || id != task->id ())
      return;

    done = true;

    task->cancel_requested.store (true);
    task->state.store (task_state::cancelled);
    runner->cancel (task);

    task->reset ();

    bool pending (task->transition (task_state::cancelled,
                                    task_state::pending));
    bool admitted (runner->admit (task));

    assert (pending && admitted);
  }
};

static void
test_retry_live ()
{
  scratch d ("retry-live");

  test_server::options o;
  o.delay = chrono::milliseconds (5);

  test_server srv (o);
  server_resolver res (srv);
  retrying_recorder ev;

  auto ts (make_tasks (1));
  string pl (make_payload (256 * 1024));
  srv.add ("/v1", pl);

  download_settings s;
  s.download_root = d.path;

  asio::io_context ioc;
  auto r (make_shared<batch_runner> (ioc.get_executor (), res, ev, s));

  ev.runner = r;
  ev.task = ts[0];

  run (ioc, r, ts, 1);

  assert (ev.done);
  assert (ts[0]->completed ());
  assert (ev.completed == vector<string> {"c1_v1"});
  assert (ev.cancelled.empty ());
  assert (ev.failed.empty ());

  ifstream ifs (ts[0]->final_path (), ios::binary);
  assert (string (istreambuf_iterator<char> (ifs),
                  istreambuf_iterator<char> ()) == pl);

  ev.runner.reset ();
}

int
main ()
{
  test_bound ();
  test_isolation ();
  test_pause_pending ();
  test_admit ();
  test_cancel ();
  test_retry_live ();
}
