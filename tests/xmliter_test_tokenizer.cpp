#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "xmliter/parsers/xml.hpp"
#include <string>

using namespace xmliter::parsers::xml;
using xmliter::ErrorKind;
using xmliter::test::TempFile;

TEST_CASE("XML Tokenizer - Basic Parsing", "[xml][tokenizer][basic]")
{
  SECTION("Simple element parsing")
  {
    TempFile file("<root>hello</root>");
    Tokenizer tok(file.path());

    REQUIRE(tok.next());
    const auto &tok1 = tok.current();
    REQUIRE(tok1.kind == TokenKind::StartElement);
    REQUIRE(tok1.name == "root");
    REQUIRE(tok1.depth == 1);

    REQUIRE(tok.next());
    const auto &tok2 = tok.current();
    REQUIRE(tok2.kind == TokenKind::Text);
    REQUIRE(tok2.text == "hello");
    REQUIRE(tok2.depth == 1);

    REQUIRE(tok.next());
    const auto &tok3 = tok.current();
    REQUIRE(tok3.kind == TokenKind::EndElement);
    REQUIRE(tok3.name == "root");
    REQUIRE(tok3.depth == 1);

    REQUIRE_FALSE(tok.next());
    REQUIRE(tok.error() == nullptr);
    REQUIRE(tok.current().kind == TokenKind::Eof);
  }

  SECTION("Empty element parsing")
  {
    TempFile file("<empty/>");
    Tokenizer tok(file.path());

    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::EmptyElement);
    REQUIRE(tok.current().name == "empty");
    REQUIRE(tok.current().depth == 1);
    REQUIRE(tok.depth() == 0);

    REQUIRE_FALSE(tok.next());
    REQUIRE(tok.error() == nullptr);
  }

  SECTION("Attributes are checked and skipped")
  {
    TempFile file("<elem attr1=\"value1\" attr2='value2'>content</elem>");
    Tokenizer tok(file.path());

    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::StartElement);
    REQUIRE(tok.current().name == "elem");
    REQUIRE(tok.next());
    REQUIRE(tok.current().text == "content");
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::EndElement);
    REQUIRE_FALSE(tok.next());
    REQUIRE(tok.error() == nullptr);
  }

  SECTION("Prolog tokens")
  {
    TempFile file("<?xml version=\"1.0\"?>\n<!DOCTYPE note [<!ELEMENT note (#PCDATA)>]>\n"
                  "<!-- c --><?pi data?><note/>");
    Tokenizer tok(file.path());

    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::XmlDecl);
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::Doctype);
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::Comment);
    REQUIRE(tok.current().text == " c ");
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::ProcessingInstruction);
    REQUIRE(tok.current().name == "pi");
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::EmptyElement);
    REQUIRE_FALSE(tok.next());
    REQUIRE(tok.error() == nullptr);
  }

  SECTION("CDATA is reported raw")
  {
    TempFile file("<a><![CDATA[<b>&amp;</b>]]></a>");
    Tokenizer tok(file.path());

    REQUIRE(tok.next());
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::CData);
    REQUIRE(tok.current().text == "<b>&amp;</b>");
  }
}

TEST_CASE("XML Tokenizer - Positions", "[xml][tokenizer][position]")
{
  TempFile file("<a>\n  <b/>\n</a>");
  Tokenizer tok(file.path());

  REQUIRE(tok.next());
  REQUIRE(tok.current().line == 1);
  REQUIRE(tok.current().column == 1);
  REQUIRE(tok.next()); // whitespace text
  REQUIRE(tok.next());
  REQUIRE(tok.current().kind == TokenKind::EmptyElement);
  REQUIRE(tok.current().line == 2);
  REQUIRE(tok.current().column == 3);
  REQUIRE(tok.current().offset == 6);
}

TEST_CASE("XML Tokenizer - Entity decoding", "[xml][tokenizer][entities]")
{
  std::string out;
  REQUIRE(Tokenizer::decodeEntities("a &lt;&gt;&amp;&apos;&quot; b", out));
  REQUIRE(out == "a <>&'\" b");

  out.clear();
  REQUIRE(Tokenizer::decodeEntities("&#65;&#x42;&#x20AC;", out));
  REQUIRE(out == "AB\xE2\x82\xAC");

  xmliter::Error err;
  out.clear();
  REQUIRE_FALSE(Tokenizer::decodeEntities("x &nbsp; y", out, &err));
  REQUIRE(err.kind == ErrorKind::Malformed);
  REQUIRE(err.offset == 2);

  out.clear();
  REQUIRE_FALSE(Tokenizer::decodeEntities("&amp", out, &err));
  REQUIRE_FALSE(Tokenizer::decodeEntities("&#0;", out, &err));
}

TEST_CASE("XML Tokenizer - Errors", "[xml][tokenizer][errors]")
{
  auto failure = [](const std::string &xml, xmliter::ReaderOptions opt = {})
  {
    TempFile file(xml);
    Tokenizer tok(file.path(), opt);
    while (tok.next())
    {
    }
    REQUIRE(tok.error() != nullptr);
    return *tok.error();
  };

  SECTION("Empty document")
  {
    auto e = failure("");
    REQUIRE(e.kind == ErrorKind::Malformed);
    REQUIRE(e.message == "no element found");
  }

  SECTION("Text outside the root element")
  {
    REQUIRE(failure("hello<a/>").message == "text outside root element");
    REQUIRE(failure("<a/>junk").message == "junk after document element");
    REQUIRE(failure("<a/><b/>").message == "junk after document element");
  }

  SECTION("Unterminated constructs")
  {
    REQUIRE(failure("<a><!-- never closed").message == "unterminated comment");
    REQUIRE(failure("<a><![CDATA[x").message == "unterminated CDATA");
    REQUIRE(failure("<a b=\"1>").kind == ErrorKind::Malformed);
  }

  SECTION("XML declaration must come first")
  {
    REQUIRE(failure(" <?xml version=\"1.0\"?><a/>").kind == ErrorKind::Malformed);
  }

  SECTION("Depth limit")
  {
    xmliter::ReaderOptions opt;
    opt.maxDepth = 2;
    auto e = failure("<a><b><c/></b></a>", opt);
    REQUIRE(e.kind == ErrorKind::Limit);
  }

  SECTION("Name length limit")
  {
    xmliter::ReaderOptions opt;
    opt.maxNameLength = 4;
    REQUIRE(failure("<abcdef/>", opt).kind == ErrorKind::Limit);
  }

  SECTION("Token limit")
  {
    xmliter::ReaderOptions opt;
    opt.maxTotalTokens = 2;
    REQUIRE(failure("<a><b/><c/></a>", opt).kind == ErrorKind::Limit);
  }

  SECTION("Invalid bytes are reported when reached")
  {
    TempFile file("<a>ok\xFF</a>");
    Tokenizer tok(file.path());
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::StartElement);
    while (tok.next())
    {
    }
    REQUIRE(tok.error() != nullptr);
    REQUIRE(tok.error()->kind == ErrorKind::Decode);
    REQUIRE(tok.error()->offset == 5);
  }
}

TEST_CASE("XML Tokenizer - Encodings", "[xml][tokenizer][encoding]")
{
  SECTION("Latin-1 declaration")
  {
    TempFile file("<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><a>caf\xE9</a>");
    Tokenizer tok(file.path());
    REQUIRE(tok.encoding() == xmliter::encoding::Encoding::Latin1);
    REQUIRE(tok.next());
    REQUIRE(tok.next());
    REQUIRE(tok.next());
    REQUIRE(tok.current().text == "caf\xC3\xA9");
  }

  SECTION("Declaration longer than the read buffer")
  {
    std::string decl = "<?xml version=\"1.0\"" + std::string(200, ' ') +
                       "encoding=\"ISO-8859-1\" standalone=\"yes\"?>";
    TempFile file(decl + "<a>caf\xE9</a>");
    xmliter::ReaderOptions opt;
    opt.bufferSize = 16;
    Tokenizer tok(file.path(), opt);
    REQUIRE(tok.encoding() == xmliter::encoding::Encoding::Latin1);
    REQUIRE(tok.next());
    REQUIRE(tok.current().kind == TokenKind::XmlDecl);
    REQUIRE(tok.next());
    REQUIRE(tok.next());
    REQUIRE(tok.current().text == "caf\xC3\xA9");
  }

  SECTION("UTF-16LE with BOM")
  {
    std::string ascii = "<a>hi</a>";
    std::string bytes = "\xFF\xFE";
    for (char c : ascii)
    {
      bytes.push_back(c);
      bytes.push_back('\0');
    }
    TempFile file(bytes);
    Tokenizer tok(file.path());
    REQUIRE(tok.encoding() == xmliter::encoding::Encoding::Utf16LE);
    REQUIRE(tok.next());
    REQUIRE(tok.current().name == "a");
    REQUIRE(tok.next());
    REQUIRE(tok.current().text == "hi");
  }

  SECTION("Forced encoding overrides detection")
  {
    xmliter::ReaderOptions opt;
    opt.encoding = "latin1";
    TempFile file("<a>\xE9</a>");
    Tokenizer tok(file.path(), opt);
    REQUIRE(tok.encoding() == xmliter::encoding::Encoding::Latin1);
    REQUIRE(tok.next());
    REQUIRE(tok.next());
    REQUIRE(tok.current().text == "\xC3\xA9");
  }

  SECTION("Unsupported declaration logs a warning")
  {
    xmliter::test::LogCapture capture;
    TempFile file("<?xml version=\"1.0\" encoding=\"KOI8-R\"?><a/>");
    Tokenizer tok(file.path());
    REQUIRE(tok.encoding() == xmliter::encoding::Encoding::Utf8);
    REQUIRE(capture.contains(xmliter::core::Logger::Level::Warning, "KOI8-R"));
  }
}

TEST_CASE("XML Tokenizer - Bounded window", "[xml][tokenizer][memory]")
{
  std::string xml = "<root>";
  for (int i = 0; i < 20000; ++i)
  {
    xml += "<item>value " + std::to_string(i) + "</item>";
  }
  xml += "</root>";
  TempFile file(xml);

  xmliter::ReaderOptions opt;
  opt.bufferSize = 4096;
  Tokenizer tok(file.path(), opt);
  std::size_t maxBuffered = 0;
  std::size_t tokens = 0;
  while (tok.next())
  {
    ++tokens;
    maxBuffered = std::max(maxBuffered, tok.bufferedBytes());
  }
  REQUIRE(tok.error() == nullptr);
  REQUIRE(tokens == 2 + 3 * 20000);
  REQUIRE(maxBuffered <= 3 * opt.bufferSize);
}

TEST_CASE("XML Tokenizer - Missing file", "[xml][tokenizer][io]")
{
  REQUIRE_THROWS_AS(Tokenizer("/nonexistent/dir/file.xml"), xmliter::IoError);
}

TEST_CASE("FileSource - Chunked reads", "[io][source]")
{
  TempFile file("<root>0123456789</root>");
  xmliter::io::FileSource source(file.path());
  REQUIRE(source.isOpen());

  char buf[8];
  std::string content;
  std::size_t n;
  while ((n = source.read(buf, sizeof(buf))) > 0)
  {
    REQUIRE(n <= sizeof(buf));
    content.append(buf, n);
  }
  REQUIRE(source.eof());
  REQUIRE_FALSE(source.failed());
  REQUIRE(content == "<root>0123456789</root>");
  REQUIRE(source.bytesRead() == content.size());

  xmliter::io::FileSource moved(std::move(source));
  REQUIRE(moved.isOpen());
  REQUIRE_FALSE(source.isOpen());
  moved.close();
  REQUIRE_FALSE(moved.isOpen());
  REQUIRE(moved.read(buf, sizeof(buf)) == 0);
}
