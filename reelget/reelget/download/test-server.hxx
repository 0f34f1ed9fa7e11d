#pragma once

// Test support: an in-process HTTP server, a fake resolver, and an event
// recorder. Only included by the test drivers.

#include <map>
#include <set>
#include <algorithm>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>
#include <utility>
#include <functional>
#include <condition_variable>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <reelget/download/download-events.hxx>
#include <reelget/resolve/url-resolver.hxx>

namespace reelget
{
  namespace test
  {
    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;
    using tcp = asio::ip::tcp;

    // Deterministic content that is not periodic over a chunk.
    //
    inline std::string
    make_payload (std::size_t n)
    {
      std::string r (n, '\0');
      for (std::size_t i (0); i != n; ++i)
        r[i] = static_cast<char> ((i * 31 + i / 7) & 0xff);
      return r;
    }

    // HTTP server on 127.0.0.1 with an ephemeral port. One thread per
    // connection, one request per connection.
    //
    class test_server
    {
    public:
      struct options
      {
        // Honor "Range: bytes=N-" with 206.
        //
        bool ranges = true;

        // Write the body in pieces of this size, sleeping in between.
        //
        std::size_t piece = 16 * 1024;
        std::chrono::milliseconds delay {0};
      };

      test_server ()
          : test_server (options ()) {}

      explicit
      test_server (options o)
          : opts_ (o),
            acceptor_ (ioc_, tcp::endpoint (asio::ip::address_v4::loopback (), 0))
      {
        port_ = acceptor_.local_endpoint ().port ();
        accept_thread_ = std::thread ([this] {accept_loop ();});
      }

      ~test_server ()
      {
        stop_ = true;

        // Unblock accept().
        //
        {
          boost::system::error_code ec;
          tcp::socket s (ioc_);
          s.connect (tcp::endpoint (asio::ip::address_v4::loopback (), port_),
                     ec);
        }

        accept_thread_.join ();

        std::vector<std::thread> ts;
        {
          std::lock_guard<std::mutex> l (mutex_);
          ts.swap (threads_);
        }

        for (std::thread& t: ts)
          t.join ();
      }

      test_server (const test_server&) = delete;
      test_server& operator= (const test_server&) = delete;

      void
      add (const std::string& path, std::string content)
      {
        std::lock_guard<std::mutex> l (mutex_);
        files_[path] = std::move (content);
      }

      void
      set_options (options o)
      {
        std::lock_guard<std::mutex> l (mutex_);
        opts_ = o;
      }

      std::string
      url (const std::string& path) const
      {
        return "http://127.0.0.1:" + std::to_string (port_) + path;
      }

      // Range header of the last request (empty if none).
      //
      std::string
      last_range () const
      {
        std::lock_guard<std::mutex> l (mutex_);
        return last_range_;
      }

      std::size_t
      requests () const
      {
        std::lock_guard<std::mutex> l (mutex_);
        return requests_;
      }

    private:
      void
      accept_loop ()
      {
        for (;;)
        {
          boost::system::error_code ec;
          tcp::socket s (ioc_);
          acceptor_.accept (s, ec);

          if (stop_)
            break;

          if (ec)
            continue;

          std::lock_guard<std::mutex> l (mutex_);
          threads_.emplace_back (
            [this, s = std::move (s)] () mutable {serve (std::move (s));});
        }
      }

      void
      serve (tcp::socket s)
      {
        boost::system::error_code ec;

        beast::flat_buffer b;
        http::request<http::string_body> req;
        http::read (s, b, req, ec);

        if (ec)
          return;

        auto tv (req.target ());
        auto rv (req[http::field::range]);

        std::string path (tv.data (), tv.size ());
        std::string range (rv.data (), rv.size ());

        options o;
        std::string body;
        bool found (false);
        {
          std::lock_guard<std::mutex> l (mutex_);

          ++requests_;
          last_range_ = range;
          o = opts_;

          auto i (files_.find (path));
          if (i != files_.end ())
          {
            body = i->second;
            found = true;
          }
        }

        std::string head;

        if (!found)
        {
          body = "not found\n";
          head = "HTTP/1.1 404 Not Found\r\n";
        }
        else if (o.ranges && range.compare (0, 6, "bytes=") == 0)
        {
          std::uint64_t n (std::stoull (range.substr (6)));
          std::uint64_t t (body.size ());

          if (n >= t)
          {
            head = "HTTP/1.1 416 Range Not Satisfiable\r\n"
                   "Content-Range: bytes */" + std::to_string (t) + "\r\n";
            body.clear ();
          }
          else
          {
            head = "HTTP/1.1 206 Partial Content\r\n"
                   "Content-Range: bytes " + std::to_string (n) + '-' +
                   std::to_string (t - 1) + '/' + std::to_string (t) + "\r\n";
            body.erase (0, n);
          }
        }
        else
          head = "HTTP/1.1 200 OK\r\n";

        head += "Content-Type: application/octet-stream\r\n";
        head += "Content-Length: " + std::to_string (body.size ()) + "\r\n";
        head += "Connection: close\r\n\r\n";

        asio::write (s, asio::buffer (head), ec);
        if (ec)
          return;

        for (std::size_t p (0); p < body.size () && !stop_; p += o.piece)
        {
          std::size_t n (std::min (o.piece, body.size () - p));

          asio::write (s, asio::buffer (body.data () + p, n), ec);
          if (ec)
            return; // Client went away (paused or cancelled).

          if (o.delay.count () != 0)
            std::this_thread::sleep_for (o.delay);
        }

        s.shutdown (tcp::socket::shutdown_send, ec);
      }

    private:
      options opts_;

      asio::io_context ioc_;
      tcp::acceptor acceptor_;
      std::uint16_t port_ {0};
      std::atomic<bool> stop_ {false};

      std::thread accept_thread_;

      mutable std::mutex mutex_;
      std::vector<std::thread> threads_;
      std::map<std::string, std::string> files_;
      std::string last_range_;
      std::size_t requests_ {0};
    };

    // Resolve item ids to paths on the test server. Ids in the failing set
    // throw resolve_error.
    //
    class server_resolver: public url_resolver
    {
    public:
      explicit
      server_resolver (const test_server& s)
          : server_ (s) {}

      void
      fail (const std::string& id)
      {
        std::lock_guard<std::mutex> l (mutex_);
        failing_.insert (id);
      }

      void
      heal (const std::string& id)
      {
        std::lock_guard<std::mutex> l (mutex_);
        failing_.erase (id);
      }

      std::size_t
      calls () const
      {
        std::lock_guard<std::mutex> l (mutex_);
        return calls_;
      }

      asio::awaitable<resolved_url>
      resolve (const std::string& id, const std::string& q) override
      {
        {
          std::lock_guard<std::mutex> l (mutex_);

          ++calls_;

          if (failing_.count (id) != 0)
            throw resolve_error ("no playable URL for " + id);
        }

        co_return resolved_url {server_.url ("/" + id), q};
      }

    private:
      const test_server& server_;

      mutable std::mutex mutex_;
      std::set<std::string> failing_;
      std::size_t calls_ {0};
    };

    // Record every event.
    //
    class event_recorder: public download_listener
    {
    public:
      struct progress_event
      {
        std::string id;
        std::uint64_t downloaded;
        std::uint64_t total;
      };

      std::vector<std::string> added;
      std::vector<std::string> started;
      std::vector<std::string> completed;
      std::vector<std::pair<std::string, std::string>> failed;
      std::vector<std::string> paused;
      std::vector<std::string> cancelled;
      std::vector<progress_event> progress;
      std::size_t all_completed_count {0};

      // Called with the lock held after recording each event.
      //
      std::function<void (const std::string& event, const std::string& id)>
      hook;

      void
      task_added (const download_task_ptr& t) override
      {
        record ("added", t->id (), added);
      }

      void
      task_started (const std::string& id) override
      {
        record ("started", id, started);
      }

      void
      task_progress (const std::string& id,
                     double,
                     std::uint64_t d,
                     std::uint64_t t,
                     double) override
      {
        std::lock_guard<std::mutex> l (mutex_);
        progress.push_back (progress_event {id, d, t});
        changed_.notify_all ();
      }

      void
      task_completed (const std::string& id) override
      {
        record ("completed", id, completed);
      }

      void
      task_failed (const std::string& id, const std::string& e) override
      {
        std::lock_guard<std::mutex> l (mutex_);
        failed.emplace_back (id, e);
        if (hook)
          hook ("failed", id);
        changed_.notify_all ();
      }

      void
      task_paused (const std::string& id) override
      {
        record ("paused", id, paused);
      }

      void
      task_cancelled (const std::string& id) override
      {
        record ("cancelled", id, cancelled);
      }

      void
      all_completed () override
      {
        std::lock_guard<std::mutex> l (mutex_);
        ++all_completed_count;
        changed_.notify_all ();
      }

      // Wait until the predicate (called with the lock held) is true.
      //
      template <typename P>
      bool
      wait_for (P p,
                std::chrono::milliseconds t = std::chrono::milliseconds (10000))
      {
        std::unique_lock<std::mutex> l (mutex_);
        return changed_.wait_for (l, t, [this, &p] {return p (*this);});
      }

      // Run f with the lock held.
      //
      template <typename F>
      auto
      locked (F f) -> decltype (f (*this))
      {
        std::lock_guard<std::mutex> l (mutex_);
        return f (*this);
      }

    private:
      void
      record (const char* e, const std::string& id, std::vector<std::string>& v)
      {
        std::lock_guard<std::mutex> l (mutex_);
        v.push_back (id);
        if (hook)
          hook (e, id);
        changed_.notify_all ();
      }

      std::mutex mutex_;
      std::condition_variable changed_;
    };
  }
}
