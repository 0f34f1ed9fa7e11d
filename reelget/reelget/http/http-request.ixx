#include <type_traits>

namespace reelget
{
  template <typename S, typename B>
  inline void basic_http_request<S, B>::
  normalize (const string_type& user_agent)
  {
    if (body &&
        !has_header (string_type ("Content-Length")) &&
        !has_header (string_type ("Transfer-Encoding")))
    {
      if constexpr (std::is_same<body_type, string_type>::value)
        set_header (string_type ("Content-Length"),
                    std::to_string (body->size ()));
    }

    // Required by HTTP/1.1. Note that the port is only part of the value if
    // it is not the scheme's default, otherwise some CDNs refuse to match
    // the virtual host.
    //
    if (!has_header (string_type ("Host")))
    {
      url_parts p (parse_url (url));
      bool def ((p.scheme == "https" && p.port == "443") ||
                (p.scheme == "http"  && p.port == "80"));

      set_header (string_type ("Host"),
                  def ? p.host : p.host + string_type (":") + p.port);
    }

    if (!has_header (string_type ("User-Agent")) && !user_agent.empty ())
      set_header (string_type ("User-Agent"), user_agent);
  }
}
