#include <reelget/http/http-types.hxx>

#include <cassert>
#include <iostream>
#include <string>

#include <reelget/http/http-request.hxx>
#include <reelget/http/http-response.hxx>

using namespace std;
using namespace reelget;

// URL splitting. Defaults fill in whatever the URL leaves out.
//
static void
test_parse_url ()
{
  {
    url_parts p (parse_url ("https://cdn.example.com/v/1.mp4?sig=abc"));

    assert (p.scheme == "https");
    assert (p.host == "cdn.example.com");
    assert (p.port == "443");
    assert (p.target == "/v/1.mp4?sig=abc");
  }

  {
    url_parts p (parse_url ("127.0.0.1:8080"));

    assert (p.scheme == "http");
    assert (p.host == "127.0.0.1");
    assert (p.port == "8080");
    assert (p.target == "/");
  }

  // Bare query.
  //
  {
    url_parts p (parse_url ("http://api.example.com?video_id=1"));

    assert (p.port == "80");
    assert (p.target == "/?video_id=1");
  }
}

static void
test_url_encode ()
{
  assert (url_encode ("abc-XYZ_0.9~") == "abc-XYZ_0.9~");
  assert (url_encode ("a b&c=d") == "a%20b%26c%3Dd");
  assert (url_encode ("/") == "%2F");
  assert (url_encode ("") == "");
}

static void
test_resolve_location ()
{
  string b ("https://a.example.com/x/y/file?q=1");

  assert (resolve_location (b, "http://b.example.com/z") ==
          "http://b.example.com/z");
  assert (resolve_location (b, "//c.example.com/z") ==
          "https://c.example.com/z");
  assert (resolve_location (b, "/root") ==
          "https://a.example.com:443/root");
  assert (resolve_location (b, "other") ==
          "https://a.example.com:443/x/y/other");
}

// Content-Range is what resume correctness hinges on, so be picky.
//
static void
test_content_range ()
{
  {
    auto r (parse_content_range ("bytes 100-199/200"));

    assert (r);
    assert (r->first == 100);
    assert (r->last == 199);
    assert (r->total && *r->total == 200);
  }

  // Unknown total.
  //
  {
    auto r (parse_content_range ("bytes 0-9/*"));

    assert (r);
    assert (r->first == 0 && r->last == 9);
    assert (!r->total);
  }

  // Garbage.
  //
  assert (!parse_content_range (""));
  assert (!parse_content_range ("bytes"));
  assert (!parse_content_range ("items 0-9/10"));
  assert (!parse_content_range ("bytes 9-0/10"));
  assert (!parse_content_range ("bytes 0-9/9"));
  assert (!parse_content_range ("bytes 0-x/10"));
  assert (!parse_content_range ("bytes */10"));
}

static void
test_headers ()
{
  http_headers h;

  h.set ("Content-Type", "video/mp4");
  h.add ("X-Tag", "a");
  h.add ("x-tag", "b");

  assert (h.get ("content-type") == optional<string> ("video/mp4"));
  assert (h.contains ("CONTENT-TYPE"));
  assert (h.size () == 3);

  h.set ("X-TAG", "c");
  assert (h.size () == 2);
  assert (*h.get ("x-tag") == "c");

  h.remove ("x-tag");
  assert (!h.contains ("X-Tag"));
}

static void
test_request_response ()
{
  {
    http_request r;
    r.url = "http://127.0.0.1:8080/f.bin";
    r.set_range (1024);
    r.normalize ("reelget-test");

    assert (r.target () == "/f.bin");
    assert (*r.get_header ("Range") == "bytes=1024-");
    assert (*r.get_header ("Host") == "127.0.0.1:8080");
    assert (*r.get_header ("User-Agent") == "reelget-test");
  }

  // Default port is left out of Host.
  //
  {
    http_request r;
    r.url = "https://cdn.example.com/f.bin";
    r.normalize ("reelget-test");

    assert (*r.get_header ("Host") == "cdn.example.com");
  }

  {
    http_response r;
    r.status = http_status::partial_content;
    r.headers.set ("Content-Length", "100");
    r.headers.set ("Content-Range", "bytes 100-199/200");

    assert (r.is_success ());
    assert (!r.is_error ());
    assert (r.content_length () && *r.content_length () == 100);
    assert (r.content_range () && r.content_range ()->first == 100);
  }

  {
    http_response r;
    r.status = http_status::not_found;
    r.headers.set ("Content-Length", "12abc");

    assert (r.is_error ());
    assert (!r.content_length ());
  }
}

static void
test_error ()
{
  http_error e (404);

  assert (e.status == 404);
  assert (string (e.what ()) == "HTTP 404");

  assert (to_string (http_status::not_found) == "Not Found");
  assert (to_string (static_cast<http_status> (418)) == "418");
}

int
main ()
{
  test_parse_url ();
  test_url_encode ();
  test_resolve_location ();
  test_content_range ();
  test_headers ();
  test_request_response ();
  test_error ();
}
