#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>

namespace reelget
{
  // HTTP method (verb).
  //
  // We only ever talk to CDNs and to the playback API, so this is limited to
  // what those need.
  //
  enum class http_method
  {
    get,
    head,
    post
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    gone                  = 410,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection.
  //
  // Lookups are case-insensitive as per RFC 7230. Duplicates are allowed on
  // add() but set() enforces a single value.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value);

    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using iterator       = typename fields_type::iterator;
    using const_iterator = typename fields_type::const_iterator;

    iterator       begin ()       noexcept { return fields.begin (); }
    const_iterator begin () const noexcept { return fields.begin (); }
    iterator       end ()         noexcept { return fields.end (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x, const basic_http_headers<S>& y) noexcept
  {
    return x.fields == y.fields;
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // URL components.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Split a scheme://host[:port][/target] URL. The scheme defaults to http,
  // the port to the scheme's default, and the target to "/".
  //
  url_parts
  parse_url (const std::string&);

  // Percent-encode everything outside of the RFC 3986 unreserved set.
  //
  std::string
  url_encode (const std::string&);

  // Resolve a redirect Location against the URL that produced it. Absolute
  // locations are returned as is.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);

  // Parsed Content-Range header value (bytes first-last/total).
  //
  struct content_range
  {
    std::uint64_t first {0};
    std::uint64_t last {0};
    std::optional<std::uint64_t> total; // Absent for "*".
  };

  std::optional<content_range>
  parse_content_range (const std::string&);

  // Unexpected HTTP status.
  //
  // The message is kept short ("HTTP 404") since it ends up verbatim in the
  // task's error field.
  //
  class http_error: public std::runtime_error
  {
  public:
    explicit
    http_error (std::uint16_t s)
      : std::runtime_error ("HTTP " + std::to_string (s)),
        status (s) {}

    std::uint16_t status;
  };
}

#include <reelget/http/http-types.ixx>
