#pragma once

#include <string>
#include <stdexcept>
#include <utility>

#include <boost/asio.hpp>

namespace reelget
{
  namespace asio = boost::asio;

  // Playable URL for a sub-item at a given quality.
  //
  struct resolved_url
  {
    std::string url;
    std::string quality; // As reported by the provider, may be empty.
  };

  // Unable to resolve a sub-item to something playable.
  //
  class resolve_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // URL resolution collaborator.
  //
  // Owned by the provider layer and handed to the download manager. The
  // implementation is called from the manager's worker thread, possibly by
  // several tasks at once (interleaved on the same executor).
  //
  class url_resolver
  {
  public:
    virtual
    ~url_resolver () = default;

    // Throw resolve_error (or anything derived from std::exception) on
    // failure.
    //
    virtual asio::awaitable<resolved_url>
    resolve (const std::string& item_id, const std::string& quality) = 0;
  };
}
