#pragma once

#include <string>
#include <cstdint>
#include <utility>

#include <boost/asio.hpp>

#include <reelget/http/http-client.hxx>
#include <reelget/resolve/url-resolver.hxx>

namespace reelget
{
  // Resolver for the JSON playback API.
  //
  // GET <endpoint>?video_id=<id>&level=<quality>&type=json
  //
  // The response looks like this:
  //
  // {
  //   "code": 200,
  //   "data": {
  //     "url": "https://...",
  //     "title": "...",
  //     "info": {"quality": "1080p", "duration": "...", "size_str": "..."}
  //   }
  // }
  //
  class json_resolver: public url_resolver
  {
  public:
    static constexpr const char* default_endpoint =
      "https://api.cenguigui.cn/api/duanju/api.php";

    explicit
    json_resolver (std::string endpoint = default_endpoint,
                   http_client_traits<> traits = http_client_traits<> (),
                   std::uint16_t verbosity = 0);

    asio::awaitable<resolved_url>
    resolve (const std::string& item_id, const std::string& quality) override;

    // Request URL for the item.
    //
    std::string
    request_url (const std::string& item_id, const std::string& quality) const;

    // Extract the playable URL from the response body. Throw resolve_error
    // if the body is not what we expect or there is no URL.
    //
    static resolved_url
    parse_resolution (const std::string& body);

  private:
    std::string endpoint_;
    http_client_traits<> traits_;
    std::uint16_t verb_;
  };
}
