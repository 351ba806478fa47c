#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE option
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "global.h"

using namespace beautifier;

struct option_fixture {
  global_scope_t scope;
  strings_list   args;

  option_fixture() : scope(NULL) {}

  strings_list process(const char * first, const char * second = NULL,
                       const char * third = NULL, const char * fourth = NULL) {
    args.clear();
    for (const char * arg : { first, second, third, fourth })
      if (arg)
        args.push_back(arg);
    return scope.read_command_arguments(args);
  }
};

struct file_fixture : public option_fixture {
  path dir;

  file_fixture()
    : dir(boost::filesystem::temp_directory_path() /
          boost::filesystem::unique_path("beautifier-%%%%-%%%%")) {
    boost::filesystem::create_directories(dir);
  }
  ~file_fixture() {
    boost::filesystem::remove_all(dir);
  }

  string create(const string& name, const string& contents) {
    path pathname(dir / name);
    write_file(pathname, contents);
    return pathname.string();
  }
};

BOOST_FIXTURE_TEST_SUITE(options, option_fixture)

BOOST_AUTO_TEST_CASE(testShortOptions)
{
  BOOST_CHECK(! scope.HANDLED(inplace));

  strings_list remaining(process("-i", "a.ledger", "-"));
  BOOST_CHECK(scope.HANDLED(inplace));
  BOOST_CHECK(scope.config().inplace);

  BOOST_REQUIRE_EQUAL(2U, remaining.size());
  BOOST_CHECK_EQUAL(string("a.ledger"), remaining.front());
  BOOST_CHECK_EQUAL(string("-"), remaining.back());

  BOOST_CHECK_THROW(process("-q"), option_error);
}

BOOST_AUTO_TEST_CASE(testLongOptions)
{
  strings_list remaining(process("--inplace", "--", "-i", "--verbose"));
  BOOST_CHECK(scope.HANDLED(inplace));
  BOOST_CHECK(! scope.HANDLED(verbose));

  BOOST_REQUIRE_EQUAL(2U, remaining.size());
  BOOST_CHECK_EQUAL(string("-i"), remaining.front());
  BOOST_CHECK_EQUAL(string("--verbose"), remaining.back());

  BOOST_CHECK_THROW(process("--bogus"), option_error);
}

BOOST_AUTO_TEST_CASE(testOptionArguments)
{
  strings_list remaining(process("--debug=textual", "x.ledger"));
  BOOST_CHECK(scope.HANDLED(debug_));
  BOOST_CHECK_EQUAL(string("textual"), scope.HANDLER(debug_).str());
  BOOST_CHECK_EQUAL(1U, remaining.size());

  remaining = process("--trace", "3");
  BOOST_CHECK_EQUAL(string("3"), scope.HANDLER(trace_).value);
  BOOST_CHECK(remaining.empty());

  BOOST_CHECK_THROW(process("--debug"), option_error);
  error_context();
}

BOOST_AUTO_TEST_CASE(testOptionNames)
{
  BOOST_CHECK_EQUAL(string("--inplace"), scope.HANDLER(inplace).desc());
  BOOST_CHECK_EQUAL(string("--debug"), scope.HANDLER(debug_).desc());
  BOOST_CHECK(! scope.HANDLER(inplace).wants_arg);
  BOOST_CHECK(scope.HANDLER(trace_).wants_arg);

  BOOST_CHECK(is_eq("debug", "debug_"));
  BOOST_CHECK(is_eq("no-pager", "no_pager"));
  BOOST_CHECK(! is_eq("inplace", "inplac"));
  BOOST_CHECK(! is_eq("inplac", "inplace"));

  BOOST_CHECK(scope.lookup_option("v") == &scope.HANDLER(version));
  BOOST_CHECK(scope.lookup_option("verbose") == &scope.HANDLER(verbose));
  BOOST_CHECK(scope.lookup_option("nothing") == NULL);
}

BOOST_AUTO_TEST_CASE(testQuickExit)
{
  BOOST_CHECK_THROW(process("--version"), error_count);
  BOOST_CHECK_THROW(process("-h"), error_count);
}

BOOST_AUTO_TEST_CASE(testEnvironment)
{
  char * envp[] = {
    const_cast<char *>("LEDGER_BEAUTIFIER_INPLACE=1"),
    const_cast<char *>("LEDGER_BEAUTIFIER_DEBUG=beautify"),
    const_cast<char *>("LEDGER_BEAUTIFIER_NO_SUCH_OPTION=1"),
    const_cast<char *>("OTHER=2"),
    NULL
  };

  global_scope_t configured(envp);
  BOOST_CHECK(configured.HANDLED(inplace));
  BOOST_CHECK_EQUAL(string("beautify"), configured.HANDLER(debug_).str());
  BOOST_CHECK(! configured.HANDLED(verbose));

  std::ostringstream out;
  configured.HANDLER(inplace).report(out);
  BOOST_CHECK(out.str().find("$LEDGER_BEAUTIFIER_INPLACE") != string::npos);
}

BOOST_AUTO_TEST_CASE(testInplaceStandardInput)
{
  process("-i");
  BOOST_CHECK_THROW(scope.execute(strings_list()), option_error);

  strings_list names;
  names.push_back("-");
  BOOST_CHECK_THROW(scope.execute(names), option_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(files, file_fixture)

BOOST_AUTO_TEST_CASE(testRewriteInPlace)
{
  const string messy("2024/01/01 Payee\n"
                     "      Assets:Cash  $1\n"
                     "\n\n\n"
                     "include    other.ledger\n");
  const string clean("include other.ledger\n");

  string first  = create("messy.ledger", messy);
  string second = create("clean.ledger", clean);

  process("--inplace");

  strings_list names;
  names.push_back(first);
  names.push_back(second);
  BOOST_CHECK_EQUAL(0, scope.execute(names));

  config_t inplace;
  inplace.inplace = true;
  BOOST_CHECK_EQUAL(beautify(messy, inplace), read_file(first));
  BOOST_CHECK_EQUAL(clean, read_file(second));
}

BOOST_AUTO_TEST_CASE(testWriteFileReplacesWhole)
{
  string journal = create("journal.ledger", "; a much longer original text\n");
  write_file(journal, "; short\n");
  BOOST_CHECK_EQUAL(string("; short\n"), read_file(journal));

  // a target that cannot be replaced is reported, and nothing is left behind
  boost::filesystem::create_directory(dir / "subdir.ledger");
  BOOST_CHECK_THROW(write_file(dir / "subdir.ledger", "; lost\n"),
                    std::runtime_error);
  BOOST_CHECK(boost::filesystem::is_directory(dir / "subdir.ledger"));

  std::size_t entries = 0;
  for (boost::filesystem::directory_iterator it(dir), end; it != end; ++it)
    entries++;
  BOOST_CHECK_EQUAL(2U, entries);
}

BOOST_AUTO_TEST_CASE(testFailureContinues)
{
  const string broken("; fine\nbogus directive\n");

  string first  = create("broken.ledger", broken);
  string second = create("messy.ledger", "include    other.ledger\n");

  process("-i");

  strings_list names;
  names.push_back(first);
  names.push_back(second);
  names.push_back((dir / "missing.ledger").string());
  BOOST_CHECK_EQUAL(1, scope.execute(names));

  BOOST_CHECK_EQUAL(broken, read_file(first));
  BOOST_CHECK_EQUAL(string("include other.ledger\n"), read_file(second));

  // every error was reported and its context consumed
  BOOST_CHECK_EQUAL(string(""), error_context());
}

BOOST_AUTO_TEST_SUITE_END()
