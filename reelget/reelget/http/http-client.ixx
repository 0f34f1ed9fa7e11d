#include <openssl/ssl.h>

namespace reelget
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl ? ssl::verify_peer
                                                 : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req)
  {
    return request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    return request_impl (request_type (http_method::get, url), 0);
  }

  template <typename T>
  template <typename H>
  inline asio::awaitable<bool> basic_http_client<T>::
  stream (request_type req, H& handler, std::size_t chunk_size)
  {
    return stream_impl (std::move (req),
                        handler,
                        chunk_size != 0 ? chunk_size : 65536,
                        0);
  }
}
