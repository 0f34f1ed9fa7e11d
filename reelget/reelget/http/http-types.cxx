#include <reelget/http/http-types.hxx>

#include <cctype>
#include <charconv>
#include <sstream>
#include <iomanip>

using namespace std;

namespace reelget
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
      case http_method::post: return "POST";
    }
    return "GET";
  }

  // http_status
  //
  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::no_content:            return "No Content";
      case http_status::partial_content:       return "Partial Content";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::not_modified:          return "Not Modified";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::unauthorized:          return "Unauthorized";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::gone:                  return "Gone";
      case http_status::range_not_satisfiable: return "Range Not Satisfiable";
      case http_status::too_many_requests:     return "Too Many Requests";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    // Codes we have no name for still go over the wire; print the number.
    //
    return std::to_string (static_cast<uint16_t> (s));
  }

  // http_version
  //
  string http_version::
  string () const
  {
    ostringstream o;
    o << "HTTP/" << static_cast<int> (major) << '.' << static_cast<int> (minor);
    return o.str ();
  }

  // URL helpers.
  //
  // Note that this is deliberately simple: scheme://host:port/path is all
  // the CDNs we fetch from ever hand out. IPv6 literals and user info are
  // not supported.
  //
  url_parts
  parse_url (const std::string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != std::string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    size_t end (url.find_first_of ("/?", pos));
    if (end == std::string::npos)
      end = url.size ();

    std::string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != std::string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = (r.scheme == "https") ? "443" : "80";
    }

    if (end < url.size ())
    {
      r.target = url.substr (end);

      // A bare query ("host?x=1") still needs a path in the request line.
      //
      if (r.target.front () == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  std::string
  url_encode (const std::string& s)
  {
    ostringstream o;
    o << hex << uppercase << setfill ('0');

    for (unsigned char c: s)
    {
      if (isalnum (c) || c == '-' || c == '_' || c == '.' || c == '~')
        o << c;
      else
        o << '%' << setw (2) << static_cast<int> (c);
    }

    return o.str ();
  }

  std::string
  resolve_location (const std::string& base, const std::string& loc)
  {
    if (loc.find ("://") != std::string::npos)
      return loc;

    url_parts p (parse_url (base));
    std::string r (p.scheme + "://" + p.host + ':' + p.port);

    // Protocol-relative ("//host/path").
    //
    if (loc.compare (0, 2, "//") == 0)
      return p.scheme + ':' + loc;

    if (!loc.empty () && loc.front () == '/')
      return r + loc;

    // Relative to the directory of the current target.
    //
    std::string t (p.target.substr (0, p.target.find ('?')));
    return r + t.substr (0, t.rfind ('/') + 1) + loc;
  }

  // Parse "bytes <first>-<last>/<total>" where total may be "*".
  //
  optional<content_range>
  parse_content_range (const std::string& v)
  {
    auto num = [] (const char* b, const char* e, uint64_t& n)
    {
      auto r (from_chars (b, e, n));
      return r.ec == errc () && r.ptr == e;
    };

    size_t i (v.find_first_not_of (' '));
    if (i == std::string::npos || v.compare (i, 6, "bytes ") != 0)
      return nullopt;

    i += 6;

    size_t dash (v.find ('-', i));
    size_t slash (v.find ('/', i));

    if (dash == std::string::npos || slash == std::string::npos || dash > slash)
      return nullopt;

    content_range r;
    const char* d (v.data ());

    if (!num (d + i, d + dash, r.first) ||
        !num (d + dash + 1, d + slash, r.last) ||
        r.last < r.first)
      return nullopt;

    size_t e (v.find_last_not_of (' '));
    std::string t (v.substr (slash + 1, e - slash));

    if (t != "*")
    {
      uint64_t n (0);
      if (!num (t.data (), t.data () + t.size (), n) || n <= r.last)
        return nullopt;

      r.total = n;
    }

    return r;
  }
}
