#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace xmliter;
using xmliter::test::collectEvents;
using xmliter::test::TempFile;

namespace
{
using Pairs = std::vector<std::pair<EventKind, std::string>>;

std::string largeDocument(int items)
{
  std::string xml = "<?xml version=\"1.0\"?>\n<catalog>\n";
  for (int i = 0; i < items; ++i)
  {
    xml += "  <book id=\"" + std::to_string(i) + "\"><title>Title " + std::to_string(i) +
           "</title><price>9.99</price></book>\n";
  }
  xml += "</catalog>\n";
  return xml;
}
} // namespace

TEST_CASE("Event stream - Basic events", "[stream][basic]")
{
  SECTION("Start, text and end")
  {
    TempFile file("<a>x</a>");
    auto c = collectEvents(file.path());
    REQUIRE_FALSE(c.error);
    REQUIRE(c.pairs() ==
            Pairs{{EventKind::Start, "a"}, {EventKind::Text, "x"}, {EventKind::End, "a"}});
    REQUIRE(c.events[0].index == 0);
    REQUIRE(c.events[1].index == 1);
    REQUIRE(c.events[2].index == 2);
  }

  SECTION("Self-closing root")
  {
    TempFile file("<a/>");
    auto c = collectEvents(file.path());
    REQUIRE_FALSE(c.error);
    REQUIRE(c.pairs() == Pairs{{EventKind::Empty, "a"}});
  }

  SECTION("Explicit empty element has no text event")
  {
    TempFile file("<a></a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"}, {EventKind::End, "a"}});
  }

  SECTION("Whitespace text is reported untrimmed")
  {
    TempFile file("<a>\n  <b/>\n</a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"},
                               {EventKind::Text, "\n  "},
                               {EventKind::Empty, "b"},
                               {EventKind::Text, "\n"},
                               {EventKind::End, "a"}});
  }

  SECTION("Prolog, comments and processing instructions never surface")
  {
    TempFile file("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<!DOCTYPE a>\n<!-- top -->\n"
                  "<a><?target x?><!-- inner --></a>\n<!-- trailing -->\n");
    auto c = collectEvents(file.path());
    REQUIRE_FALSE(c.error);
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"}, {EventKind::End, "a"}});
  }

  SECTION("Attributes are not reported")
  {
    TempFile file("<a x=\"1\"><b y='2'/></a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() ==
            Pairs{{EventKind::Start, "a"}, {EventKind::Empty, "b"}, {EventKind::End, "a"}});
  }
}

TEST_CASE("Event stream - Text coalescing", "[stream][text]")
{
  SECTION("Entities and character references are decoded")
  {
    TempFile file("<a>&lt;x&gt; &amp; &#65;&#x42;</a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.events.size() == 3);
    REQUIRE(c.events[1].value == "<x> & AB");
  }

  SECTION("CDATA joins surrounding text")
  {
    TempFile file("<a>one <![CDATA[<two>]]> three</a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"},
                               {EventKind::Text, "one <two> three"},
                               {EventKind::End, "a"}});
  }

  SECTION("A comment does not split a text run")
  {
    TempFile file("<a>left<!-- c -->right</a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.events.size() == 3);
    REQUIRE(c.events[1].value == "leftright");
  }

  SECTION("Text longer than the read buffer stays one event")
  {
    std::string body(10000, 'x');
    TempFile file("<a>" + body + "</a>");
    ReaderOptions opt;
    opt.bufferSize = 512;
    auto c = collectEvents(file.path(), opt);
    REQUIRE(c.events.size() == 3);
    REQUIRE(c.events[1].value == body);
  }

  SECTION("trimText drops whitespace-only runs")
  {
    TempFile file("<a>\n  <b> x </b>\n</a>");
    ReaderOptions opt;
    opt.trimText = true;
    auto c = collectEvents(file.path(), opt);
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"},
                               {EventKind::Start, "b"},
                               {EventKind::Text, "x"},
                               {EventKind::End, "b"},
                               {EventKind::End, "a"}});
    REQUIRE(c.events[4].index == 4);
  }

  SECTION("Line breaks are normalized before entities are decoded")
  {
    TempFile file("<a>one\r\ntwo\rthree&#13;<![CDATA[\r\nfour]]></a>");
    auto c = collectEvents(file.path());
    REQUIRE_FALSE(c.error);
    REQUIRE(c.events.size() == 3);
    REQUIRE(c.events[1].value == "one\ntwo\nthree\r\nfour");
  }

  SECTION("Undefined entity fails the stream")
  {
    TempFile file("<a>&bogus;</a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.error);
    REQUIRE(c.error->kind == ErrorKind::Malformed);
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"}});
  }
}

TEST_CASE("Event stream - Names", "[stream][names]")
{
  TempFile file("<ns:a xmlns:ns=\"urn:x\"><ns:b/></ns:a>");

  SECTION("Qualified names are kept")
  {
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() ==
            Pairs{{EventKind::Start, "ns:a"}, {EventKind::Empty, "ns:b"}, {EventKind::End, "ns:a"}});
  }

  SECTION("Prefixes can be stripped")
  {
    ReaderOptions opt;
    opt.stripNamespacePrefix = true;
    auto c = collectEvents(file.path(), opt);
    REQUIRE(c.pairs() ==
            Pairs{{EventKind::Start, "a"}, {EventKind::Empty, "b"}, {EventKind::End, "a"}});
  }
}

TEST_CASE("Event stream - Failures", "[stream][errors]")
{
  SECTION("Mismatched end tag")
  {
    TempFile file("<a><b></a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"}, {EventKind::Start, "b"}});
    REQUIRE(c.error);
    REQUIRE(c.error->kind == ErrorKind::MismatchedTag);
    REQUIRE(c.error->message == "mismatched end tag - expected </b> but got </a>");
    REQUIRE(c.error->offset == 6);
  }

  SECTION("Unclosed element at end of input")
  {
    TempFile file("<a><b>text");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() ==
            Pairs{{EventKind::Start, "a"}, {EventKind::Start, "b"}, {EventKind::Text, "text"}});
    REQUIRE(c.error);
    REQUIRE(c.error->kind == ErrorKind::UnclosedElement);
  }

  SECTION("Empty file")
  {
    TempFile file("");
    auto c = collectEvents(file.path());
    REQUIRE(c.events.empty());
    REQUIRE(c.error);
    REQUIRE(c.error->kind == ErrorKind::Malformed);
  }

  SECTION("Stream stays failed")
  {
    TempFile file("<a></b>");
    EventStream stream(file.path());
    Event ev;
    REQUIRE(stream.next(ev));
    REQUIRE_FALSE(stream.next(ev));
    REQUIRE(stream.error() != nullptr);
    REQUIRE_FALSE(stream.next(ev));
    REQUIRE(stream.error()->kind == ErrorKind::MismatchedTag);
  }

  SECTION("Events before a decode error are delivered")
  {
    TempFile file("<a><b>ok</b>\xC3\x28</a>");
    auto c = collectEvents(file.path());
    REQUIRE(c.pairs() == Pairs{{EventKind::Start, "a"},
                               {EventKind::Start, "b"},
                               {EventKind::Text, "ok"},
                               {EventKind::End, "b"}});
    REQUIRE(c.error);
    REQUIRE(c.error->kind == ErrorKind::Decode);
  }

  SECTION("Missing file throws")
  {
    REQUIRE_THROWS_AS(EventStream("/nonexistent/file.xml"), IoError);
    REQUIRE_THROWS_AS(forEachEvent("/nonexistent/file.xml", [](const Event &) { return true; }),
                      IoError);
  }
}

TEST_CASE("Event stream - Properties", "[stream][properties]")
{
  TempFile file(largeDocument(500));

  SECTION("Start and end events nest properly")
  {
    EventStream stream(file.path());
    std::vector<std::string> stack;
    Event ev;
    std::uint64_t expected = 0;
    while (stream.next(ev))
    {
      REQUIRE(ev.index == expected++);
      if (ev.kind == EventKind::Start)
      {
        stack.push_back(ev.value);
      }
      else if (ev.kind == EventKind::End)
      {
        REQUIRE_FALSE(stack.empty());
        REQUIRE(stack.back() == ev.value);
        stack.pop_back();
      }
      REQUIRE(stream.depth() == stack.size());
    }
    REQUIRE(stream.error() == nullptr);
    REQUIRE(stream.finished());
    REQUIRE(stack.empty());
  }

  SECTION("Two runs yield identical sequences")
  {
    auto first = collectEvents(file.path());
    auto second = collectEvents(file.path());
    REQUIRE(first.events == second.events);
  }

  SECTION("Stopping early reads only part of the file")
  {
    ReaderOptions opt;
    opt.bufferSize = 1024;
    EventStream stream(file.path(), opt);
    Event ev;
    for (int i = 0; i < 10; ++i)
    {
      REQUIRE(stream.next(ev));
    }
    REQUIRE(stream.tokenizer().bytesRead() <= 2 * opt.bufferSize);

    stream.close();
    REQUIRE_FALSE(stream.next(ev));
    REQUIRE_FALSE(stream.finished());
    REQUIRE(stream.error() == nullptr);
    REQUIRE(stream.eventsProduced() == 10);
  }

  SECTION("Visitor can stop the stream")
  {
    std::uint64_t seen = 0;
    auto summary = forEachEvent(file.path(),
                                [&](const Event &ev)
                                {
                                  ++seen;
                                  return ev.index < 4;
                                });
    REQUIRE(summary.stoppedEarly);
    REQUIRE(summary.events == 5);
    REQUIRE(seen == 5);
    REQUIRE_FALSE(summary.error);
  }
}
