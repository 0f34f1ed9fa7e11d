#pragma once

#include <string>
#include <utility>
#include <optional>

#include <reelget/http/http-types.hxx>

namespace reelget
{
  // HTTP request.
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method               method {http_method::get};
    string_type               url;
    http_version              version;
    headers_type              headers;
    std::optional<body_type>  body;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    // Request target (path and query) as it goes on the request line.
    //
    string_type
    target () const
    {
      return parse_url (url).target;
    }

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Ask for everything from the specified offset onwards.
    //
    void
    set_range (std::uint64_t offset)
    {
      set_header (string_type ("Range"),
                  string_type ("bytes=") + std::to_string (offset) +
                  string_type ("-"));
    }

    // Fill in the Host, User-Agent and Content-Length headers unless they
    // are already there.
    //
    void
    normalize (const string_type& user_agent);

    bool
    valid () const noexcept
    {
      return !url.empty ();
    }
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S, B>& r) -> decltype (o)
  {
    return o << to_string (r.method) << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string, std::string>;
}

#include <reelget/http/http-request.ixx>
