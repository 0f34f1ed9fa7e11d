#include <limits>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace reelget
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return http::verb::get;
      case http_method::head: return http::verb::head;
      case http_method::post: return http::verb::post;
    }
    return http::verb::get;
  }

  // Arm the stream's timer. Zero means no timeout at all rather than an
  // immediate one.
  //
  template <typename L>
  inline void
  arm_timeout (L& layer, std::uint32_t ms)
  {
    if (ms != 0)
      layer.expires_after (std::chrono::milliseconds (ms));
    else
      layer.expires_never ();
  }

  // Convert the Beast status line and header fields.
  //
  template <typename R, typename M>
  inline R
  make_response (const M& m)
  {
    using string_type = typename R::string_type;

    R r;
    r.status  = static_cast<http_status> (m.result_int ());
    r.version = http_version (m.version () / 10, m.version () % 10);
    r.reason  = string_type (m.reason ());

    for (const auto& h: m)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    return r;
  }

  template <typename R, typename Q>
  inline R
  make_beast_request (const Q& req, const url_parts& parts)
  {
    R br;
    br.method (to_beast_verb (req.method));
    br.target (parts.target);
    br.version (req.version.major * 10 + req.version.minor);

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    return br;
  }

  template <typename T>
  template <typename R, typename F>
  asio::awaitable<R> basic_http_client<T>::
  with_connection (const url_parts& parts, F f)
  {
    const auto& tr (session_->traits ());
    const auto& ex (session_->executor ());

    tcp::resolver rslv (ex);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    if (parts.scheme == "https")
    {
      beast::ssl_stream<beast::tcp_stream> s (ex, session_->ssl_context ());

      // Most CDNs refuse the handshake without SNI. Beast doesn't wrap it so
      // we have to go through the OpenSSL handle.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      auto& layer (beast::get_lowest_layer (s));

      arm_timeout (layer, tr.connect_timeout);
      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      R r (co_await f (s));

      // Skip the TLS close_notify exchange: plenty of servers just drop the
      // connection and waiting for them would block until the timeout.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
    else
    {
      beast::tcp_stream s (ex);

      arm_timeout (s, tr.connect_timeout);
      co_await s.async_connect (addrs, asio::use_awaitable);

      R r (co_await f (s));

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
      co_return r;
    }
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    if (redirect_count >= tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    req.normalize (tr.user_agent);
    url_parts parts (parse_url (req.url));

    response_type r (co_await with_connection<response_type> (
      parts,
      [&req, &parts, &tr] (auto& s) -> asio::awaitable<response_type>
      {
        auto br (make_beast_request<http::request<http::string_body>> (
                   req, parts));

        if (req.body)
        {
          br.body () = *req.body;
          br.prepare_payload ();
        }

        auto& layer (beast::get_lowest_layer (s));

        arm_timeout (layer, tr.request_timeout);
        co_await http::async_write (s, br, asio::use_awaitable);

        beast::flat_buffer b;
        http::response<http::string_body> bres;
        co_await http::async_read (s, b, bres, asio::use_awaitable);

        response_type res (make_response<response_type> (bres));

        if (!bres.body ().empty ())
          res.body = std::move (bres.body ());

        co_return res;
      }));

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto l = r.location ())
      {
        request_type n (req.method, resolve_location (req.url, *l), req.version);
        n.headers = req.headers;
        n.headers.remove (string_type ("Host"));

        // RFC 7231: 303 turns whatever we sent into a body-less GET.
        //
        if (r.status == http_status::see_other)
          n.method = http_method::get;
        else
          n.body = req.body;

        co_return co_await request_impl (std::move (n), redirect_count + 1);
      }
    }

    co_return r;
  }

  template <typename T>
  template <typename H>
  asio::awaitable<bool> basic_http_client<T>::
  stream_impl (request_type req,
               H& handler,
               std::size_t chunk_size,
               std::uint8_t redirect_count)
  {
    using parser_type = http::response_parser<http::buffer_body>;

    const auto& tr (session_->traits ());

    if (redirect_count >= tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    req.normalize (tr.user_agent);
    url_parts parts (parse_url (req.url));

    std::optional<string_type> redirect;

    bool r (co_await with_connection<bool> (
      parts,
      [&req, &parts, &tr, &handler, &redirect, chunk_size] (auto& s)
        -> asio::awaitable<bool>
      {
        auto br (make_beast_request<http::request<http::empty_body>> (
                   req, parts));

        auto& layer (beast::get_lowest_layer (s));

        arm_timeout (layer, tr.request_timeout);
        co_await http::async_write (s, br, asio::use_awaitable);

        beast::flat_buffer b;
        parser_type p;
        p.body_limit (std::numeric_limits<std::uint64_t>::max ());

        co_await http::async_read_header (s, b, p, asio::use_awaitable);

        response_type h (make_response<response_type> (p.get ()));

        // Let the caller deal with the redirect on a fresh connection.
        //
        if (tr.follow_redirects && h.is_redirection ())
        {
          if (auto l = h.location ())
          {
            redirect = resolve_location (req.url, *l);
            co_return false;
          }
        }

        handler.header (h);

        std::vector<char> buf (chunk_size);

        while (!p.is_done ())
        {
          p.get ().body ().data = buf.data ();
          p.get ().body ().size = buf.size ();

          // Re-arm for every read so that only a stalled transfer times out.
          //
          arm_timeout (layer, tr.request_timeout);

          beast::error_code ec;
          co_await http::async_read_some (
            s, b, p, asio::redirect_error (asio::use_awaitable, ec));

          // need_buffer just means our chunk buffer is full.
          //
          if (ec == http::error::need_buffer)
            ec = {};

          if (ec)
            throw beast::system_error (ec);

          std::size_t n (buf.size () - p.get ().body ().size);

          if (n != 0 && !(co_await handler.data (buf.data (), n)))
            co_return false;
        }

        co_return true;
      }));

    if (redirect)
    {
      request_type n (req.method, std::move (*redirect), req.version);
      n.headers = req.headers;
      n.headers.remove (string_type ("Host"));

      co_return co_await stream_impl (std::move (n),
                                      handler,
                                      chunk_size,
                                      redirect_count + 1);
    }

    co_return r;
  }
}
