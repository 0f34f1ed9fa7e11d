#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <filesystem>
#include <utility>

#include <boost/asio.hpp>

#include <reelget/download/download.hxx>
#include <reelget/resolve/rate-limiter.hxx>
#include <reelget/resolve/json-resolver.hxx>
#include <reelget/reelget-options.hxx>

#include <reelget/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace reelget
{
  static string
  format_bytes (uint64_t n)
  {
    ostringstream o;

    if (n < 1024)
      o << n << " B";
    else if (n < 1024 * 1024)
      o << fixed << setprecision (1) << (n / 1024.0) << " KiB";
    else if (n < 1024 * 1024 * 1024)
      o << fixed << setprecision (1) << (n / (1024.0 * 1024.0)) << " MiB";
    else
      o << fixed << setprecision (1)
        << (n / (1024.0 * 1024.0 * 1024.0)) << " GiB";

    return o.str ();
  }

  static string
  format_speed (double bps)
  {
    ostringstream o;

    if (bps < 1024)
      o << fixed << setprecision (0) << bps << " B/s";
    else if (bps < 1024 * 1024)
      o << fixed << setprecision (1) << (bps / 1024.0) << " KiB/s";
    else
      o << fixed << setprecision (1) << (bps / (1024.0 * 1024.0)) << " MiB/s";

    return o.str ();
  }

  // Parse <id>[:<title>].
  //
  static sub_item
  parse_episode (const string& s, uint32_t n)
  {
    sub_item r;
    r.number = n;

    size_t p (s.find (':'));
    r.id = string (s, 0, p);

    if (p != string::npos)
      r.title = string (s, p + 1);

    if (r.id.empty ())
      throw invalid_argument ("invalid episode '" + s + "': empty id");

    return r;
  }

  // Print the download events to stdout and retry failed tasks.
  //
  class console_listener: public download_listener
  {
  public:
    console_listener (download_manager& m, size_t retries)
        : manager_ (m), retries_ (retries) {}

    void
    task_started (const string& id) override
    {
      lock_guard<mutex> l (mutex_);
      cout << "started " << id << endl;
    }

    void
    task_progress (const string& id,
                   double p,
                   uint64_t d,
                   uint64_t t,
                   double s) override
    {
      lock_guard<mutex> l (mutex_);

      // Only report every 10%; per-chunk output would swamp the terminal.
      //
      int dec (static_cast<int> (p / 10));
      auto i (deciles_.find (id));

      if (i != deciles_.end () && i->second >= dec)
        return;

      deciles_[id] = dec;

      cout << id << ": " << fixed << setprecision (0) << p << "% "
           << format_bytes (d) << " / " << format_bytes (t)
           << " @ " << format_speed (s) << endl;
    }

    void
    task_completed (const string& id) override
    {
      lock_guard<mutex> l (mutex_);
      cout << "completed " << id << endl;
    }

    void
    task_failed (const string& id, const string& e) override
    {
      bool retry (false);
      {
        lock_guard<mutex> l (mutex_);

        size_t& n (attempts_[id]);
        if (n < retries_)
        {
          ++n;
          retry = true;
        }

        cout << "failed " << id << ": " << e;
        if (retry)
          cout << " (retry " << n << " of " << retries_ << ")";
        cout << endl;

        deciles_.erase (id);
      }

      if (retry)
        manager_.retry (id);
    }

    void
    task_paused (const string& id) override
    {
      lock_guard<mutex> l (mutex_);
      cout << "paused " << id << endl;
    }

    void
    task_cancelled (const string& id) override
    {
      lock_guard<mutex> l (mutex_);
      cout << "cancelled " << id << endl;
    }

  private:
    download_manager& manager_;
    size_t retries_;

    mutex mutex_;
    map<string, int> deciles_;
    map<string, size_t> attempts_;
  };
}

int
main (int argc, char* argv[])
{
  using namespace reelget;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "reelget " << REELGET_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: reelget [options] --collection-id <id> --episode <id>..."
        << "\n"
        << "options:" << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (!opt.collection_id_specified () || opt.collection_id ().empty ())
    {
      cerr << "error: collection id expected" << endl
           << "  info: run 'reelget --help' for more information" << endl;
      return 1;
    }

    if (!opt.episode_specified ())
    {
      cerr << "error: at least one episode expected" << endl
           << "  info: run 'reelget --help' for more information" << endl;
      return 1;
    }

    collection_item c {opt.collection_id (),
                       opt.collection_name_specified ()
                       ? opt.collection_name ()
                       : opt.collection_id ()};

    vector<sub_item> es;
    for (const string& e: opt.episode ())
      es.push_back (parse_episode (e, static_cast<uint32_t> (es.size () + 1)));

    // Map the command line options to the download settings.
    //
    download_settings s;
    s.download_root = fs::path (opt.output ());
    s.quality = opt.quality ();
    s.max_concurrent = download_settings::clamp_concurrent (
      static_cast<long long> (opt.jobs ()));
    s.speed_limit = opt.limit ();
    s.verbosity = opt.verbose ();

    if (s.max_concurrent != opt.jobs () && s.verbosity >= 1)
      cerr << "warning: --jobs clamped to " << s.max_concurrent << endl;

    http_client_traits<> ht;
    ht.connect_timeout = s.connect_timeout * 1000;
    ht.request_timeout = s.read_timeout * 1000;
    ht.user_agent = s.user_agent;

    json_resolver jr (opt.endpoint (), ht, s.verbosity);
    rate_limited_resolver rr (jr,
                              opt.rate_calls (),
                              chrono::seconds (opt.rate_window ()),
                              s.verbosity);

    download_manager m (rr, s);
    console_listener cl (m, opt.retries ());
    m.subscribe (cl);

    m.add (c, es);
    m.start ();

    // Cancel the batch on SIGINT/SIGTERM. The signals are dispatched on our
    // own context which we poll while waiting for the manager.
    //
    asio::io_context ioc;
    asio::signal_set ss (ioc, SIGINT, SIGTERM);

    bool interrupted (false);
    ss.async_wait (
      [&m, &interrupted] (const boost::system::error_code& ec, int)
      {
        if (ec)
          return;

        cerr << "info: interrupted, stopping downloads" << endl;

        interrupted = true;
        m.cancel ();
      });

    while (!m.wait (chrono::milliseconds (100)))
      ioc.poll ();

    m.unsubscribe (cl);

    // Summarize.
    //
    size_t done (0), failed (0), other (0);
    for (const download_task_ptr& t: m.list ())
    {
      if (t->completed ())
        ++done;
      else if (t->failed ())
        ++failed;
      else
        ++other;
    }

    cout << done << " completed, " << failed << " failed";
    if (other != 0)
      cout << ", " << other << " not finished";
    cout << endl;

    return interrupted || failed != 0 || other != 0 ? 1 : 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
