#include <reelget/download/download-types.hxx>

#include <cstring>

using namespace std;

namespace reelget
{
  string
  to_string (task_state s)
  {
    switch (s)
    {
    case task_state::pending:     return "pending";
    case task_state::fetching:    return "fetching";
    case task_state::downloading: return "downloading";
    case task_state::paused:      return "paused";
    case task_state::completed:   return "completed";
    case task_state::failed:      return "failed";
    case task_state::cancelled:   return "cancelled";
    }
    return "unknown";
  }

  ostream&
  operator<< (ostream& os, transfer_outcome o)
  {
    switch (o)
    {
    case transfer_outcome::completed: return os << "completed";
    case transfer_outcome::paused:    return os << "paused";
    case transfer_outcome::cancelled: return os << "cancelled";
    }
    return os;
  }

  string
  make_task_id (const string& c, const string& i)
  {
    return c + '_' + i;
  }

  string
  sanitize_filename (const string& n)
  {
    string r (n);

    for (char& c: r)
    {
      if (strchr ("<>:\"/\\|?*", c) != nullptr && c != '\0')
        c = '_';
    }

    const char* ws (" \t\r\n\f\v");

    size_t b (r.find_first_not_of (ws));
    if (b == string::npos)
      return string ();

    size_t e (r.find_last_not_of (ws));
    return r.substr (b, e - b + 1);
  }
}
