#include <reelget/resolve/json-resolver.hxx>

#include <cassert>
#include <string>

using namespace std;
using namespace reelget;

static bool
rejects (const string& body, const string& what = string ())
{
  try
  {
    json_resolver::parse_resolution (body);
    return false;
  }
  catch (const resolve_error& e)
  {
    return what.empty () || string (e.what ()) == what;
  }
}

static void
test_parse ()
{
  {
    resolved_url r (json_resolver::parse_resolution (R"({
      "code": 200,
      "data": {
        "url": "https://cdn.example.com/v.mp4",
        "pic": "https://cdn.example.com/v.jpg",
        "title": "Episode 1",
        "info": {"quality": "1080p", "duration": "01:30", "size_str": "12MB"}
      }
    })"));

    assert (r.url == "https://cdn.example.com/v.mp4");
    assert (r.quality == "1080p");
  }

  // No info is fine.
  //
  {
    resolved_url r (json_resolver::parse_resolution (
      R"({"code": 200, "data": {"url": "http://x/y"}})"));

    assert (r.url == "http://x/y");
    assert (r.quality.empty ());
  }
}

static void
test_reject ()
{
  assert (rejects ("not json"));
  assert (rejects ("[1, 2]"));
  assert (rejects (R"({"code": 200})", "no playable URL"));
  assert (rejects (R"({"code": 200, "data": {"url": ""}})", "no playable URL"));
  assert (rejects (R"({"code": 200, "data": {"url": 42}})", "no playable URL"));
  assert (rejects (R"({"code": 404, "msg": "video not found"})",
                   "no playable URL: video not found"));
}

static void
test_request_url ()
{
  json_resolver r ("https://api.example.com/api.php");

  assert (r.request_url ("7 8", "1080p") ==
          "https://api.example.com/api.php?video_id=7%208&level=1080p&type=json");

  json_resolver q ("https://api.example.com/api.php?key=k");

  assert (q.request_url ("1", "720p") ==
          "https://api.example.com/api.php?key=k&video_id=1&level=720p&type=json");
}

int
main ()
{
  test_parse ();
  test_reject ();
  test_request_url ();
}
