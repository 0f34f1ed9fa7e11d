#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <reelget/http/http-types.hxx>
#include <reelget/http/http-request.hxx>
#include <reelget/http/http-response.hxx>

namespace reelget
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout for each individual write or read in milliseconds (0 = no
    // timeout). It is re-armed for every body chunk so that a long but
    // healthy transfer never trips it.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    bool follow_redirects = true;

    // Whether to verify server certificates and where to load them from
    // (empty = system defaults).
    //
    bool verify_ssl = false;
    string_type ssl_cert_file;

    string_type user_agent = string_type ("reelget");
  };

  // HTTP client session context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::any_io_executor ex, const traits_type& traits)
      : ex_ (std::move (ex)),
        traits_ (traits),
        ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    const asio::any_io_executor&
    executor () const noexcept
    {
      return ex_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::any_io_executor ex_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Coroutine-based HTTP/1.1 over Boost.Beast. Every call opens its own
  // connection; we never pipeline or keep connections alive.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    explicit
    basic_http_client (asio::any_io_executor ex)
      : session_ (std::make_unique<session_type> (std::move (ex),
                                                  traits_type ())) {}

    basic_http_client (asio::any_io_executor ex, const traits_type& traits)
      : session_ (std::make_unique<session_type> (std::move (ex), traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a request and buffer the whole response body.
    //
    asio::awaitable<response_type>
    request (request_type req);

    asio::awaitable<response_type>
    get (const string_type& url);

    // Perform a request and stream the response body.
    //
    // Once the final (non-redirect) status line and headers are in, they are
    // passed to handler.header(const response_type&), which may throw to
    // abandon the transfer. Then each piece of the body, at most chunk_size
    // bytes, is passed to handler.data(const char*, std::size_t), which is
    // awaited and returns false to stop reading.
    //
    // Return true if the body was consumed to the end and false if the
    // handler stopped early.
    //
    template <typename H>
    asio::awaitable<bool>
    stream (request_type req, H& handler, std::size_t chunk_size = 65536);

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirect_count);

    template <typename H>
    asio::awaitable<bool>
    stream_impl (request_type req,
                 H& handler,
                 std::size_t chunk_size,
                 std::uint8_t redirect_count);

    // Resolve and connect (plus TLS handshake for https), then run f on the
    // connected stream.
    //
    template <typename R, typename F>
    asio::awaitable<R>
    with_connection (const url_parts& parts, F f);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <reelget/http/http-client.ixx>
#include <reelget/http/http-client.txx>
