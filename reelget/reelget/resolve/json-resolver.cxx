#include <reelget/resolve/json-resolver.hxx>

#include <utility>
#include <iostream>

#include <boost/json.hpp>

using namespace std;

namespace reelget
{
  namespace json = boost::json;

  json_resolver::
  json_resolver (string e, http_client_traits<> t, uint16_t v)
    : endpoint_ (move (e)), traits_ (move (t)), verb_ (v)
  {
  }

  string json_resolver::
  request_url (const string& id, const string& q) const
  {
    string r (endpoint_);

    r += endpoint_.find ('?') == string::npos ? '?' : '&';
    r += "video_id=";
    r += url_encode (id);
    r += "&level=";
    r += url_encode (q);
    r += "&type=json";

    return r;
  }

  asio::awaitable<resolved_url> json_resolver::
  resolve (const string& id, const string& q)
  {
    string u (request_url (id, q));

    if (verb_ >= 3)
      cerr << "trace: resolving " << id << " via " << u << endl;

    http_client c (co_await asio::this_coro::executor, traits_);
    http_response r (co_await c.get (u));

    if (!r.is_success ())
      throw resolve_error ("unable to resolve " + id + ": HTTP " +
                           std::to_string (r.status_code ()));

    resolved_url ru (parse_resolution (r.body ? *r.body : string ()));

    if (verb_ >= 3)
      cerr << "trace: resolved " << id << " to " << ru.url << endl;

    co_return ru;
  }

  resolved_url json_resolver::
  parse_resolution (const string& body)
  {
    boost::system::error_code ec;
    json::value v (json::parse (body, ec));

    if (ec)
      throw resolve_error ("invalid response: " + ec.message ());

    const json::object* o (v.if_object ());
    if (o == nullptr)
      throw resolve_error ("invalid response: expected object");

    // Note that the code is advisory: some mirrors return a URL with a
    // non-200 code. What matters is whether there is something to play.
    //
    auto str = [] (const json::object* o, const char* k) -> string
    {
      if (o != nullptr)
      {
        if (const json::value* v = o->if_contains (k))
        {
          if (const json::string* s = v->if_string ())
            return string (s->data (), s->size ());
        }
      }

      return string ();
    };

    const json::object* d (nullptr);
    if (const json::value* dv = o->if_contains ("data"))
      d = dv->if_object ();

    resolved_url r;
    r.url = str (d, "url");

    if (r.url.empty ())
    {
      string m (str (o, "msg"));
      throw resolve_error (m.empty ()
                           ? "no playable URL"
                           : "no playable URL: " + m);
    }

    const json::object* i (nullptr);
    if (d != nullptr)
    {
      if (const json::value* iv = d->if_contains ("info"))
        i = iv->if_object ();
    }

    r.quality = str (i, "quality");
    return r;
  }
}
