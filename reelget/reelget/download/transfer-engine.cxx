#include <reelget/download/transfer-engine.hxx>

#include <chrono>
#include <fstream>
#include <utility>
#include <optional>
#include <iostream>
#include <stdexcept>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <reelget/http/http-client.hxx>

using namespace std;

namespace reelget
{
  namespace fs = std::filesystem;

  // Stream handler that writes the response body into the temporary file.
  //
  namespace
  {
    using clock_type = chrono::steady_clock;

    struct file_sink
    {
      download_task& task;
      download_listener& events;
      const download_settings& settings;
      const atomic<bool>& cancelled;

      fs::path path;
      uint64_t offset; // Resume offset we asked for.

      ofstream ofs;
      uint64_t downloaded {0};
      uint64_t total {0};

      // Speed sampling window.
      //
      clock_type::time_point sample_time;
      uint64_t sample_bytes {0};

      optional<transfer_outcome> stopped;

      // Decide how to continue based on the status line.
      //
      void
      header (const http_response& r)
      {
        ios_base::openmode m (ios::binary | ios::out);

        switch (r.status_code ())
        {
        case 206:
          {
            auto cr (r.content_range ());

            if (cr && cr->first != offset)
              throw runtime_error ("HTTP 206 for unexpected range starting at " +
                                   std::to_string (cr->first));

            if (cr && cr->total)
              total = *cr->total;
            else if (auto n = r.content_length ())
              total = offset + *n;

            m |= offset != 0 ? ios::app : ios::trunc;
            break;
          }
        case 200:
          {
            // If we asked for a range and got the whole thing, the server
            // doesn't do ranges. Start over rather than append the full body
            // after the stale prefix.
            //
            if (offset != 0)
            {
              if (settings.verbosity >= 2)
                cerr << "info: server ignored range request for "
                     << task.id () << ", restarting from byte 0" << endl;

              offset = 0;
            }

            total = r.content_length ().value_or (0);
            m |= ios::trunc;
            break;
          }
        default:
          throw http_error (r.status_code ());
        }

        ofs.open (path, m);
        if (!ofs)
          throw runtime_error ("unable to open " + path.string () +
                               " for writing");

        downloaded = offset;
        task.update_bytes (downloaded, total);

        sample_time = clock_type::now ();
        sample_bytes = downloaded;
      }

      asio::awaitable<bool>
      data (const char* p, size_t n)
      {
        // Check for pause/cancel before touching the file. Cancellation
        // wins if both are requested.
        //
        if (cancelled.load () || task.cancel_requested.load ())
        {
          stopped = transfer_outcome::cancelled;
          co_return false;
        }

        if (task.pause_requested.load ())
        {
          stopped = transfer_outcome::paused;
          co_return false;
        }

        ofs.write (p, static_cast<streamsize> (n));
        if (!ofs)
          throw runtime_error ("unable to write " + path.string ());

        downloaded += n;

        // Only move the sample baseline once the window has elapsed so that
        // the rate doesn't jump around with every chunk.
        //
        clock_type::time_point now (clock_type::now ());
        double el (chrono::duration<double> (now - sample_time).count ());

        if (el >= 0.5)
        {
          task.speed.store ((downloaded - sample_bytes) / el);
          sample_time = now;
          sample_bytes = downloaded;
        }

        task.update_bytes (downloaded, total);

        if (total != 0)
        {
          uint64_t t (task.total_bytes.load ());

          events.task_progress (task.id (),
                                static_cast<double> (downloaded) / t * 100.0,
                                downloaded,
                                t,
                                task.speed.load ());
        }

        // Throttle: a chunk of n bytes should take n/limit seconds, minus a
        // nominal millisecond for the write itself.
        //
        if (uint64_t lim = settings.speed_limit)
        {
          double d (static_cast<double> (n) / lim - 0.001);

          if (d > 0)
          {
            asio::steady_timer t (co_await asio::this_coro::executor,
                                  chrono::duration_cast<clock_type::duration> (
                                    chrono::duration<double> (d)));
            co_await t.async_wait (asio::use_awaitable);
          }
        }

        co_return true;
      }
    };
  }

  transfer_engine::
  transfer_engine (url_resolver& r, download_listener& e, download_settings s)
    : resolver_ (r), events_ (e), settings_ (move (s))
  {
  }

  task_files transfer_engine::
  files (const download_settings& s, const download_task& t)
  {
    string d (sanitize_filename (t.collection ().name));
    if (d.empty ())
      d = sanitize_filename (t.collection ().id);

    string f (sanitize_filename (t.item ().title + s.file_extension));
    if (f.empty () || f == sanitize_filename (s.file_extension))
      f = sanitize_filename (t.item ().id + s.file_extension);

    fs::path dir (s.download_root / d);

    return task_files {dir / (f + ".tmp"), dir / f};
  }

  asio::awaitable<transfer_outcome> transfer_engine::
  execute (download_task& t, const atomic<bool>& cancelled)
  {
    auto stop = [&t, &cancelled] () -> optional<transfer_outcome>
    {
      if (cancelled.load () || t.cancel_requested.load ())
        return transfer_outcome::cancelled;

      if (t.pause_requested.load ())
        return transfer_outcome::paused;

      return nullopt;
    };

    // If the task is no longer pending, it was cancelled before we got to
    // it.
    //
    if (!t.transition (task_state::pending, task_state::fetching))
      co_return transfer_outcome::cancelled;

    resolved_url r (co_await resolver_.resolve (t.item ().id,
                                                settings_.quality));

    if (r.url.empty ())
      throw resolve_error ("no playable URL for " + t.item ().id);

    t.transfer_url (r.url);

    if (auto s = stop ())
      co_return *s;

    if (!t.transition (task_state::fetching, task_state::downloading))
      co_return transfer_outcome::cancelled;

    task_files f (files (settings_, t));
    t.paths (f.temp, f.final);

    fs::create_directories (f.temp.parent_path ());

    // Whatever is already in the temporary file is assumed to be a prefix
    // of the content.
    //
    uint64_t offset (fs::exists (f.temp) ? fs::file_size (f.temp) : 0);
    t.update_bytes (offset, 0);

    http_request req (http_method::get, r.url);

    if (offset != 0)
    {
      req.set_range (offset);

      if (settings_.verbosity >= 2)
        cerr << "info: resuming " << t.id () << " from byte " << offset
             << endl;
    }

    http_client_traits<> tr;
    tr.connect_timeout = settings_.connect_timeout * 1000;
    tr.request_timeout = settings_.read_timeout * 1000;
    tr.user_agent = settings_.user_agent;

    http_client c (co_await asio::this_coro::executor, tr);

    file_sink s {t, events_, settings_, cancelled, f.temp, offset};

    bool done (co_await c.stream (move (req), s, settings_.chunk_size));

    s.ofs.close ();

    if (!done)
    {
      // The only way for the handler to stop early is a pause or cancel
      // request.
      //
      co_return s.stopped ? *s.stopped : transfer_outcome::cancelled;
    }

    if (s.ofs.fail ())
      throw runtime_error ("unable to write " + f.temp.string ());

    fs::rename (f.temp, f.final);

    t.update_bytes (s.downloaded, s.total != 0 ? s.total : s.downloaded);

    // The manager may have cancelled the task after the last chunk. The file
    // is complete either way, but we keep the state it was given. A task
    // that was cancelled and then retried while we were still running is
    // back to pending with its flags cleared: that run is this one.
    //
    if (!t.transition (task_state::downloading, task_state::completed))
    {
      if (t.cancel_requested.load () ||
          !t.transition (task_state::pending, task_state::completed))
        co_return transfer_outcome::cancelled;
    }

    co_return transfer_outcome::completed;
  }
}
