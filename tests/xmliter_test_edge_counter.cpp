#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include <string>

using namespace xmliter;
using xmliter::test::TempFile;

TEST_CASE("Edge counter - Counts", "[reduce][edges]")
{
  SECTION("Siblings under one parent")
  {
    TempFile file("<a><b/><b/><c/></a>");
    EdgeCountResult r = countEdges(file.path());
    REQUIRE_FALSE(r.error);
    REQUIRE(r.counts.size() == 2);
    REQUIRE(r.counts.at({"a", "b"}) == 2);
    REQUIRE(r.counts.at({"a", "c"}) == 1);
    REQUIRE(r.eventsConsumed == 5);
  }

  SECTION("Root has no parent edge")
  {
    TempFile file("<a/>");
    EdgeCountResult r = countEdges(file.path());
    REQUIRE_FALSE(r.error);
    REQUIRE(r.counts.empty());
  }

  SECTION("Nested elements count against the innermost parent")
  {
    TempFile file("<r><x><y>1</y><y>2</y></x><x><z/></x><y/></r>");
    EdgeCountResult r = countEdges(file.path());
    EdgeCounts expected{{{"r", "x"}, 2}, {{"x", "y"}, 2}, {{"x", "z"}, 1}, {{"r", "y"}, 1}};
    REQUIRE(r.counts == expected);
  }

  SECTION("Namespace prefixes follow the reader options")
  {
    TempFile file("<ns:a xmlns:ns=\"urn:x\"><ns:b/></ns:a>");
    ReaderOptions opt;
    opt.stripNamespacePrefix = true;
    REQUIRE(countEdges(file.path()).counts.count({"ns:a", "ns:b"}) == 1);
    REQUIRE(countEdges(file.path(), opt).counts.count({"a", "b"}) == 1);
  }
}

TEST_CASE("Edge counter - Partial results", "[reduce][edges][errors]")
{
  SECTION("Failure keeps the counts so far")
  {
    xmliter::test::LogCapture capture;
    TempFile file("<a><b/><c></a>");
    EdgeCountResult r = countEdges(file.path());
    REQUIRE(r.error);
    REQUIRE(r.error->kind == ErrorKind::MismatchedTag);
    REQUIRE(r.counts.at({"a", "b"}) == 1);
    REQUIRE(r.counts.at({"a", "c"}) == 1);
    REQUIRE(capture.contains(core::Logger::Level::Warning, "countEdges"));
  }

  SECTION("maxEvents stops early")
  {
    TempFile file("<a><b/><b/><b/><c/></a>");
    EdgeCountResult r = countEdges(file.path(), {}, 3);
    REQUIRE_FALSE(r.error);
    REQUIRE(r.eventsConsumed == 3);
    REQUIRE(r.counts.at({"a", "b"}) == 2);
    REQUIRE(r.counts.count({"a", "c"}) == 0);
  }

  SECTION("Missing file throws")
  {
    REQUIRE_THROWS_AS(countEdges("/nonexistent/file.xml"), IoError);
  }
}

TEST_CASE("Edge counter - Fed directly", "[reduce][edges][feed]")
{
  EdgeCounter counter;
  counter.feed({0, EventKind::Start, "a"});
  counter.feed({1, EventKind::Text, "ignored"});
  counter.feed({2, EventKind::Empty, "b"});
  counter.feed({3, EventKind::End, "a"});
  // Unbalanced End is tolerated
  counter.feed({4, EventKind::End, "a"});
  counter.feed({5, EventKind::Empty, "c"});
  REQUIRE(counter.counts().size() == 1);
  REQUIRE(counter.counts().at({"a", "b"}) == 1);
}

TEST_CASE("Path counter", "[reduce][paths]")
{
  TempFile file("<r><x><y/><y/></x><x><y/></x><y/></r>");

  SECTION("Counts full element paths")
  {
    PathCountResult r = countPaths(file.path());
    REQUIRE_FALSE(r.error);
    PathCounts expected{{{"r"}, 1}, {{"r", "x"}, 2}, {{"r", "x", "y"}, 3}, {{"r", "y"}, 1}};
    REQUIRE(r.counts == expected);
  }

  SECTION("Joined for display")
  {
    REQUIRE(joinPath({"r", "x", "y"}) == "r/x/y");
    REQUIRE(joinPath({"r"}) == "r");
    REQUIRE(joinPath({}) == "");
  }

  SECTION("Partial counts on failure")
  {
    TempFile broken("<r><x><y/>");
    PathCountResult r = countPaths(broken.path());
    REQUIRE(r.error);
    REQUIRE(r.error->kind == ErrorKind::UnclosedElement);
    REQUIRE(r.counts.at({"r", "x", "y"}) == 1);
  }
}
