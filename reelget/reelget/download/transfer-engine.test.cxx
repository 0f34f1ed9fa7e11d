#include <reelget/download/transfer-engine.hxx>

#include <atomic>
#include <chrono>
#include <cassert>
#include <fstream>
#include <iterator>
#include <optional>
#include <iostream>
#include <exception>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <reelget/http/http-types.hxx>
#include <reelget/download/test-server.hxx>

using namespace std;
using namespace reelget;
using namespace reelget::test;

namespace fs = std::filesystem;

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static void
write_file (const fs::path& p, const string& s)
{
  fs::create_directories (p.parent_path ());
  ofstream ofs (p, ios::binary | ios::trunc);
  ofs.write (s.data (), static_cast<streamsize> (s.size ()));
}

// Scratch directory, removed on both ends.
//
struct scratch
{
  fs::path path;

  explicit
  scratch (const string& n)
      : path (fs::temp_directory_path () / ("reelget-engine-" + n))
  {
    fs::remove_all (path);
  }

  ~scratch ()
  {
    error_code ec;
    fs::remove_all (path, ec);
  }
};

// Run the engine to completion on a private io_context, rethrowing whatever
// it threw.
//
static transfer_outcome
execute (transfer_engine& e,
         download_task& t,
         const atomic<bool>& cancelled = atomic<bool> (false))
{
  asio::io_context ioc;

  optional<transfer_outcome> r;
  exception_ptr ex;

  asio::co_spawn (ioc,
                  e.execute (t, cancelled),
                  [&r, &ex] (exception_ptr x, transfer_outcome o)
                  {
                    if (x)
                      ex = x;
                    else
                      r = o;
                  });

  ioc.run ();

  if (ex)
    rethrow_exception (ex);

  assert (r);
  return *r;
}

static download_settings
settings (const fs::path& root)
{
  download_settings s;
  s.download_root = root;
  return s;
}

// Listener that requests a pause (or cancel) once the task got far enough.
//
class stop_after: public event_recorder
{
public:
  stop_after (download_task& t, uint64_t at, atomic<bool>* cancel = nullptr)
      : task_ (t), at_ (at), cancel_ (cancel) {}

  void
  task_progress (const string& id,
                 double p,
                 uint64_t d,
                 uint64_t t,
                 double s) override
  {
    event_recorder::task_progress (id, p, d, t, s);

    if (d >= at_)
    {
      if (cancel_ != nullptr)
        cancel_->store (true);
      else
        task_.pause_requested.store (true);
    }
  }

private:
  download_task& task_;
  uint64_t at_;
  atomic<bool>* cancel_;
};

static void
check_monotonic (event_recorder& r, uint64_t total)
{
  assert (!r.progress.empty ());

  uint64_t prev (0);
  for (const auto& e: r.progress)
  {
    assert (e.downloaded >= prev);
    assert (e.downloaded <= e.total);
    prev = e.downloaded;
  }

  assert (prev == total);
}

static void
test_fresh ()
{
  scratch d ("fresh");
  string pl (make_payload (300 * 1024 + 17));

  test_server srv;
  srv.add ("/v1", pl);

  server_resolver res (srv);
  event_recorder ev;
  transfer_engine e (res, ev, settings (d.path));

  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  assert (execute (e, t) == transfer_outcome::completed);
  assert (t.completed ());
  assert (t.progress () == 100.0);

  assert (t.final_path () == d.path / "Collection" / "Episode 1.mp4");
  assert (read_file (t.final_path ()) == pl);
  assert (!fs::exists (t.temp_path ()));

  assert (t.downloaded_bytes.load () == pl.size ());
  assert (t.total_bytes.load () == pl.size ());
  assert (t.transfer_url () == srv.url ("/v1"));
  assert (srv.last_range ().empty ());

  check_monotonic (ev, pl.size ());
}

// Partial temp file plus a range-capable server: only the rest is fetched
// and the result is identical to a fresh download.
//
static void
test_resume ()
{
  scratch d ("resume");
  string pl (make_payload (256 * 1024));

  test_server srv;
  srv.add ("/v1", pl);

  server_resolver res (srv);
  event_recorder ev;
  download_settings s (settings (d.path));
  transfer_engine e (res, ev, s);

  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  task_files f (transfer_engine::files (s, t));
  write_file (f.temp, pl.substr (0, 100000));

  assert (execute (e, t) == transfer_outcome::completed);
  assert (srv.last_range () == "bytes=100000-");
  assert (read_file (f.final) == pl);
  assert (!fs::exists (f.temp));

  assert (ev.progress.front ().downloaded > 100000);
  check_monotonic (ev, pl.size ());
}

// The server ignores Range and sends everything with 200: the stale prefix
// must be discarded, not appended to.
//
static void
test_range_ignored ()
{
  scratch d ("ignored");
  string pl (make_payload (200 * 1024));

  test_server::options o;
  o.ranges = false;

  test_server srv (o);
  srv.add ("/v1", pl);

  server_resolver res (srv);
  event_recorder ev;
  download_settings s (settings (d.path));
  transfer_engine e (res, ev, s);

  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  task_files f (transfer_engine::files (s, t));
  write_file (f.temp, string (50000, 'x'));

  assert (execute (e, t) == transfer_outcome::completed);
  assert (srv.last_range () == "bytes=50000-");

  string r (read_file (f.final));
  assert (r.size () == pl.size ());
  assert (r == pl);
}

static void
test_http_error ()
{
  scratch d ("error");

  test_server srv;
  server_resolver res (srv);
  event_recorder ev;
  download_settings s (settings (d.path));
  transfer_engine e (res, ev, s);

  download_task t ({"c1", "Collection"}, {"missing", "Episode 1", 1});

  try
  {
    execute (e, t);
    assert (false);
  }
  catch (const http_error& x)
  {
    assert (x.status == 404);
    assert (string (x.what ()) == "HTTP 404");
  }

  // Nothing written.
  //
  task_files f (transfer_engine::files (s, t));
  assert (!fs::exists (f.temp));
  assert (!fs::exists (f.final));
  assert (ev.progress.empty ());
}

static void
test_resolve_error ()
{
  scratch d ("resolve");

  test_server srv;
  server_resolver res (srv);
  res.fail ("v1");

  event_recorder ev;
  transfer_engine e (res, ev, settings (d.path));

  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  try
  {
    execute (e, t);
    assert (false);
  }
  catch (const resolve_error&)
  {
  }

  assert (t.state.load () == task_state::fetching);
  assert (srv.requests () == 0);
}

// Pause mid-transfer, then resume: the partial file is kept and continued,
// and the result matches the content.
//
static void
test_pause_resume ()
{
  scratch d ("pause");
  string pl (make_payload (512 * 1024));

  test_server::options o;
  o.delay = chrono::milliseconds (10);

  test_server srv (o);
  srv.add ("/v1", pl);

  server_resolver res (srv);
  download_settings s (settings (d.path));
  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  uint64_t partial (0);
  {
    stop_after ev (t, 128 * 1024);
    transfer_engine e (res, ev, s);

    assert (execute (e, t) == transfer_outcome::paused);

    task_files f (transfer_engine::files (s, t));
    assert (fs::exists (f.temp));
    assert (!fs::exists (f.final));

    partial = fs::file_size (f.temp);
    assert (partial >= 128 * 1024 && partial < pl.size ());
    assert (t.downloaded_bytes.load () == partial);
  }

  t.pause_requested = false;
  t.state = task_state::pending;

  {
    event_recorder ev;
    transfer_engine e (res, ev, s);

    assert (execute (e, t) == transfer_outcome::completed);
    assert (srv.last_range () == "bytes=" + std::to_string (partial) + "-");
    assert (read_file (t.final_path ()) == pl);

    check_monotonic (ev, pl.size ());
  }
}

// A batch-wide cancel stops at the next chunk and keeps the partial file.
//
static void
test_cancel ()
{
  scratch d ("cancel");
  string pl (make_payload (512 * 1024));

  test_server::options o;
  o.delay = chrono::milliseconds (10);

  test_server srv (o);
  srv.add ("/v1", pl);

  server_resolver res (srv);
  download_settings s (settings (d.path));
  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  atomic<bool> cancelled (false);
  stop_after ev (t, 64 * 1024, &cancelled);
  transfer_engine e (res, ev, s);

  assert (execute (e, t, cancelled) == transfer_outcome::cancelled);

  task_files f (transfer_engine::files (s, t));
  assert (fs::exists (f.temp));
  assert (!fs::exists (f.final));

  // Cancelled before it even started.
  //
  download_task u ({"c1", "Collection"}, {"v2", "Episode 2", 2});
  u.state = task_state::cancelled;

  assert (execute (e, u) == transfer_outcome::cancelled);
  assert (u.state.load () == task_state::cancelled);
}

// 256 KiB at 256 KiB/s should take about a second.
//
static void
test_throttle ()
{
  scratch d ("throttle");
  string pl (make_payload (256 * 1024));

  test_server srv;
  srv.add ("/v1", pl);

  server_resolver res (srv);
  event_recorder ev;

  download_settings s (settings (d.path));
  s.speed_limit = 256 * 1024;

  transfer_engine e (res, ev, s);
  download_task t ({"c1", "Collection"}, {"v1", "Episode 1", 1});

  auto start (chrono::steady_clock::now ());
  assert (execute (e, t) == transfer_outcome::completed);
  auto el (chrono::steady_clock::now () - start);

  assert (el >= chrono::milliseconds (700));
  assert (read_file (t.final_path ()) == pl);
}

int
main ()
{
  test_fresh ();
  test_resume ();
  test_range_ignored ();
  test_http_error ();
  test_resolve_error ();
  test_pause_resume ();
  test_cancel ();
  test_throttle ();
}
