#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE layout
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "layout.h"

using namespace beautifier;

struct layout_fixture {
  buffer_sink_t sink;
  layout_t      layout;

  layout_fixture() : layout(sink) {}
};

BOOST_FIXTURE_TEST_SUITE(cursor, layout_fixture)

BOOST_AUTO_TEST_CASE(testPrint)
{
  layout.print("abc");
  BOOST_CHECK_EQUAL(3U, layout.col);
  BOOST_CHECK_EQUAL(0U, layout.row);

  // columns are counted in code points, not bytes
  layout.print("€é");
  BOOST_CHECK_EQUAL(5U, layout.col);

  layout.print("");
  BOOST_CHECK_EQUAL(5U, layout.col);
  BOOST_CHECK_EQUAL(string("abc€é"), sink.str());
}

BOOST_AUTO_TEST_CASE(testPrintln)
{
  layout.println("first");
  BOOST_CHECK_EQUAL(0U, layout.col);
  BOOST_CHECK_EQUAL(1U, layout.row);

  layout.println();
  BOOST_CHECK_EQUAL(2U, layout.row);
  BOOST_CHECK_EQUAL(string("first\n\n"), sink.str());
}

BOOST_AUTO_TEST_CASE(testMultiLinePrint)
{
  layout.print("comment\nbody\nend co");
  BOOST_CHECK_EQUAL(2U, layout.row);
  BOOST_CHECK_EQUAL(6U, layout.col);

  layout.println("mment");
  BOOST_CHECK_EQUAL(3U, layout.row);
  BOOST_CHECK_EQUAL(0U, layout.col);
}

BOOST_AUTO_TEST_CASE(testIndent)
{
  layout.indent();
  BOOST_CHECK_EQUAL(0U, layout.col);

  {
    indented_t outer(layout);
    indented_t inner(layout);
    BOOST_CHECK_EQUAL(2U, layout.level);

    layout.indent();
    BOOST_CHECK_EQUAL(4U, layout.col);
    layout.println("x");
  }
  BOOST_CHECK_EQUAL(0U, layout.level);

  layout.extra_indentation = 1;
  layout.indent();
  BOOST_CHECK_EQUAL(1U, layout.col);

  BOOST_CHECK_EQUAL(string("    x\n "), sink.str());
}

BOOST_AUTO_TEST_CASE(testIndentWidth)
{
  buffer_sink_t other;
  layout_t      wide(other, 4);
  indented_t    nested(wide);

  wide.indent();
  BOOST_CHECK_EQUAL(4U, wide.col);
}

BOOST_AUTO_TEST_CASE(testPadTo)
{
  layout.print("Assets");
  layout.pad_to(10);
  BOOST_CHECK_EQUAL(10U, layout.col);

  // never fewer than the minimum
  layout.pad_to(4, 2);
  BOOST_CHECK_EQUAL(12U, layout.col);

  layout.pad_to(12);
  BOOST_CHECK_EQUAL(12U, layout.col);
  BOOST_CHECK_EQUAL(string("Assets      "), sink.str());
}

BOOST_AUTO_TEST_CASE(testStreamSink)
{
  std::ostringstream out;
  stream_sink_t      stream(out);
  layout_t           direct(stream);

  direct.print("2024/01/01");
  direct.println(" Payee");
  direct.flush();

  BOOST_CHECK_EQUAL(string("2024/01/01 Payee\n"), out.str());
  BOOST_CHECK_EQUAL(1U, direct.row);
}

BOOST_AUTO_TEST_CASE(testStreamSinkFailure)
{
  std::ostringstream out;
  stream_sink_t      stream(out);

  out.setstate(std::ios::badbit);
  stream.write("lost");
  BOOST_CHECK_THROW(stream.flush(), std::runtime_error);

  // the cursor hands its flush to the sink
  layout_t direct(stream);
  direct.println("also lost");
  BOOST_CHECK_THROW(direct.flush(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
