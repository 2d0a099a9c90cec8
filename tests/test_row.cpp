#include "row.hpp"
#include "config.hpp"
#include <cassert>
#include <initializer_list>
#include <string>
#include <vector>

static void test_length_counts_graphemes() {
  Row ascii("hello");
  assert(ascii.len() == 5);
  Row accented("e\xCC\x81t\xC3\xA9");  // e + combining acute, t, precomposed é
  assert(accented.len() == 3);
  assert(accented.unit(0) == "e\xCC\x81");
  Row empty;
  assert(empty.is_empty());
  assert(empty.len() == 0);
  Row crlf("a\r\n");
  assert(crlf.len() == 2);
}

static void test_invalid_utf8() {
  Row bytes("a\xFF\xFE" "b");
  assert(bytes.len() == 4);
  assert(bytes.unit(1) == "\xFF");
  assert(bytes.unit(3) == "b");
  bytes.remove(3);
  assert(bytes.string() == "a\xFF\xFE");

  // Latin-1 text: the lone byte does not swallow the space after it
  Row latin1("caf\xE9 let");
  assert(latin1.len() == 8);
  assert(latin1.unit(3) == "\xE9");
  assert(latin1.unit(4) == " ");

  // truncated, overlong and surrogate sequences split byte by byte
  assert(Row("x\xE2\x82").len() == 3);
  assert(Row("\xC0\xAF").len() == 2);
  assert(Row("\xED\xA0\x80").len() == 3);
  // valid text on both sides keeps its clusters
  Row mixed("e\xCC\x81\xFF\xC3\xA9");
  assert(mixed.len() == 3);
  assert(mixed.unit(0) == "e\xCC\x81");
  assert(mixed.unit(2) == "\xC3\xA9");
  assert(mixed.find("\xC3\xA9", 0, SearchDirection::Forward) == 2u);
}

static void test_insert_and_remove() {
  Row r("ac");
  r.insert(1, "b");
  assert(r.string() == "abc");
  r.insert(99, "d");
  assert(r.string() == "abcd");
  r.insert(0, "\xC3\xA9");
  assert(r.string() == "\xC3\xA9" "abcd");
  assert(r.len() == 5);
  r.remove(0);
  assert(r.string() == "abcd");
  r.remove(4);  // past end: no-op
  assert(r.string() == "abcd");
  r.remove(3);
  assert(r.string() == "abc");

  // a combining mark typed after a letter merges into one grapheme
  Row m("e");
  m.insert(1, "\xCC\x81");
  assert(m.len() == 1);
  m.remove(0);
  assert(m.is_empty());
}

static void test_insert_remove_inverse() {
  const std::string text = "fn main() {}";
  for (size_t at = 0; at <= text.size(); ++at) {
    Row r(text);
    r.insert(at, "x");
    assert(r.len() == text.size() + 1);
    r.remove(at);
    assert(r.string() == text);
  }
}

static void test_split_append_round_trip() {
  const std::string text = "let s = \"h\xC3\xA9llo\";";
  Row whole(text);
  for (size_t at = 0; at <= whole.len() + 1; ++at) {
    Row head(text);
    Row tail = head.split(at);
    assert(head.len() + tail.len() == whole.len());
    head.append(tail);
    assert(head.string() == text);
    assert(head.len() == whole.len());
  }
}

static void test_find() {
  Row r("abcabc");
  assert(r.find("bc", 0, SearchDirection::Forward) == 1u);
  assert(r.find("bc", 2, SearchDirection::Forward) == 4u);
  assert(!r.find("bc", 5, SearchDirection::Forward));
  assert(r.find("bc", 6, SearchDirection::Backward) == 4u);
  assert(r.find("bc", 4, SearchDirection::Backward) == 1u);
  assert(!r.find("bc", 1, SearchDirection::Backward));
  assert(!r.find("", 0, SearchDirection::Forward));
  assert(!r.find("a", 7, SearchDirection::Forward));

  // results are grapheme indexes
  Row u("\xC3\xA9\xC3\xA9x");
  assert(u.find("x", 0, SearchDirection::Forward) == 2u);

  // a byte match that splits a cluster is skipped
  Row c("e\xCC\x81" "e");
  assert(c.find("e", 0, SearchDirection::Forward) == 1u);
  assert(c.find("e", 2, SearchDirection::Backward) == 1u);
}

static void test_search_symmetry() {
  // a single occurrence is found from either end
  for (const char* text : {"one two three", "two", "x\xC3\xA9 two \xC3\xA9"}) {
    Row one(text);
    auto from_start = one.find("two", 0, SearchDirection::Forward);
    assert(from_start);
    assert(one.find("two", one.len(), SearchDirection::Backward) == from_start);
  }

  Row r("one two one two");
  auto fwd = r.find("two", 0, SearchDirection::Forward);
  assert(fwd);
  auto back = r.find("two", *fwd + 3, SearchDirection::Backward);
  assert(back == fwd);
}

static void test_render() {
  Row r("a\tb");
  auto runs = r.render(0, 10);
  assert(runs.size() == 1);
  assert(runs[0].text == std::string("a") + SCRIBE_TAB_RENDER + "b");
  assert(runs[0].type == HighlightType::None);

  Row u("x\xC3\xA9y");
  runs = u.render(1, 2);
  assert(runs.size() == 1);
  assert(runs[0].text == "\xC3\xA9");
  assert(u.render(5, 9).empty());
}

static void test_highlight_state() {
  HighlightingOptions opts;
  opts.numbers = true;
  opts.multiline_comments = true;
  Row r("x 42");
  assert(r.highlight_state() == HighlightState::Stale);
  assert(!r.highlight(opts, "", false));
  assert(r.highlight_state() == HighlightState::Fresh);
  assert(r.highlighting()[2] == HighlightType::Number);
  r.insert(0, "y");
  assert(!r.is_highlighted());

  Row open("a /* b");
  assert(open.highlight(opts, "", false));
  assert(open.highlight_state() == HighlightState::FreshPending);

  // a fresh row still reapplies the match overlay
  Row w("abc abc");
  w.highlight(opts, "bc", false);
  assert(w.highlighting()[1] == HighlightType::Match);
  assert(w.highlighting()[5] == HighlightType::Match);
  w.highlight(opts, "", false);
  assert(w.highlighting()[1] == HighlightType::None);

  auto runs = w.render(0, w.len());
  assert(runs.size() == 1);
}

int main() {
  test_length_counts_graphemes();
  test_invalid_utf8();
  test_insert_and_remove();
  test_insert_remove_inverse();
  test_split_append_round_trip();
  test_find();
  test_search_symmetry();
  test_render();
  test_highlight_state();
  return 0;
}
