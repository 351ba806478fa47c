#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE textual
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "textual.h"

using namespace beautifier;

struct textual_fixture {
  unique_ptr<syntax_tree_t> tree;

  const node_t& parse(const string& text) {
    tree = parse_journal(text);
    return tree->root();
  }

  string item(const string& text, std::size_t index = 0) {
    const node_t * node = parse(text).named_child(index);
    BOOST_REQUIRE(node != NULL);
    return node->sexp();
  }

  // The postings of the first transaction in the journal
  node_t::children_list postings() {
    node_t::children_list result;
    const node_t& xact(*tree->root().child(0)->child(0)->child(0));
    for (const node_t * node : xact.named_children())
      if (node->kind() == SYMBOL_POSTING)
        result.push_back(node);
    return result;
  }
};

BOOST_FIXTURE_TEST_SUITE(textual, textual_fixture)

BOOST_AUTO_TEST_CASE(testBlankLines)
{
  const node_t& root(parse("; one\n\n   \n; two\n"));

  BOOST_CHECK_EQUAL(4U, root.child_count());
  BOOST_CHECK_EQUAL(SYMBOL_BLANK_LINE, root.child(1)->kind());
  BOOST_CHECK_EQUAL(SYMBOL_BLANK_LINE, root.child(2)->kind());
  BOOST_CHECK(! root.child(1)->is_named());
  BOOST_CHECK_EQUAL(2U, root.named_children().size());
  BOOST_CHECK(! root.has_error());
}

BOOST_AUTO_TEST_CASE(testComments)
{
  const char * chars = ";#%|*";
  for (const char * p = chars; *p; p++) {
    string line = string(1, *p) + " a comment";
    BOOST_CHECK_EQUAL(string("(journal_item (comment))"), item(line + "\n"));
    BOOST_CHECK_EQUAL(line, tree->root().child(0)->child(0)->text());
  }
}

BOOST_AUTO_TEST_CASE(testBlockComment)
{
  BOOST_CHECK_EQUAL(string("(journal_item (block_comment))"),
                    item("comment\nanything  at all\nend comment\n; after\n"));

  const node_t& block(*tree->root().child(0)->child(0));
  BOOST_CHECK_EQUAL(string("comment\nanything  at all\nend comment"),
                    block.text());
  BOOST_CHECK_EQUAL(2U, tree->root().named_children().size());

  BOOST_CHECK_EQUAL(string("(journal_item (block_test))"),
                    item("test reg\n2024/01/01 x\nend test\n"));
}

BOOST_AUTO_TEST_CASE(testUnterminatedBlock)
{
  const node_t& root(parse("; before\ncomment\nnever closed\n"));

  BOOST_CHECK(root.has_error());
  BOOST_CHECK(root.child(1)->is_error());
  BOOST_CHECK_EQUAL(1U, root.child(1)->start_point().row);
}

BOOST_AUTO_TEST_CASE(testOption)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (option)))"),
                    item("--input-date-format %Y/%m/%d\n"));
}

BOOST_AUTO_TEST_CASE(testAccountDirective)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (account_directive "
                           "(account) (account_subdirective "
                           "(note_subdirective (value))))))"),
                    item("account Assets:Checking\n    note Primary account\n"));

  BOOST_CHECK_EQUAL(string("(journal_item (directive (account_directive "
                           "(account) "
                           "(account_subdirective (alias_subdirective (value))) "
                           "(account_subdirective (payee_subdirective (value))) "
                           "(account_subdirective (check_subdirective (value))) "
                           "(account_subdirective (assert_subdirective (value))) "
                           "(account_subdirective (eval_subdirective (value))) "
                           "(account_subdirective (default_subdirective)))))"),
                    item("account Expenses:Food\n"
                         "  alias food\n"
                         "\tpayee ^Grocer\n"
                         "  check commodity == \"$\"\n"
                         "  assert amount > 0\n"
                         "  expr true\n"
                         "  default\n"));
}

BOOST_AUTO_TEST_CASE(testAccountDirectiveErrors)
{
  BOOST_CHECK(parse("account\n").has_error());
  BOOST_CHECK(parse("account Foo\n  note\n").has_error());
  BOOST_CHECK(parse("account Foo\n  default now\n").has_error());

}

BOOST_AUTO_TEST_CASE(testUnknownSubdirectives)
{
  const node_t& root(parse("account Foo\n  bogus x\n  ; a comment\n"));
  BOOST_CHECK(! root.has_error());

  const node_t& directive(*root.child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(SYMBOL_ACCOUNT_DIRECTIVE, directive.kind());
  BOOST_CHECK_EQUAL(SYMBOL_UNKNOWN_SUBDIRECTIVE, directive.named_child(1)->kind());
  BOOST_CHECK_EQUAL(1U, directive.named_child(1)->start_point().row);
  BOOST_CHECK_EQUAL(2U, directive.named_child(1)->start_point().column);
  BOOST_CHECK_EQUAL(SYMBOL_UNKNOWN_SUBDIRECTIVE, directive.named_child(2)->kind());
  BOOST_CHECK_EQUAL(2U, directive.named_child(2)->start_point().row);

  BOOST_CHECK(! parse("commodity $\n  precision 2\n").has_error());
  BOOST_CHECK(! parse("tag receipt\n  note not allowed\n").has_error());
}

BOOST_AUTO_TEST_CASE(testCommodityDirective)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (commodity_directive "
                           "(commodity) "
                           "(commodity_subdirective (format_subdirective "
                           "(amount (commodity) (quantity)))) "
                           "(commodity_subdirective (nomarket_subdirective)) "
                           "(commodity_subdirective (note_subdirective (value))))))"),
                    item("commodity $\n"
                         "  format $1,000.00\n"
                         "  nomarket\n"
                         "  note US dollars\n"));

  BOOST_CHECK(parse("commodity $\n  format $1,000.00 extra\n").has_error());
}

BOOST_AUTO_TEST_CASE(testTagDirective)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (tag_directive (tag) "
                           "(check_subdirective (value)))))"),
                    item("tag receipt\n    check value =~ /pdf$/\n"));
}

BOOST_AUTO_TEST_CASE(testPayeeDirective)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (payee_directive (payee) "
                           "(alias_subdirective (value)) "
                           "(uuid_subdirective (value)))))"),
                    item("payee Grocery Store\n"
                         "  alias ^Grocer\n"
                         "  uuid 2a2e21d434356f886c84371eb2b87eb2a8e3d8ee\n"));

  const node_t& payee(*tree->root().child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(string("Grocery Store"), payee.named_child(0)->text());

  BOOST_CHECK(parse("payee\n").has_error());
  BOOST_CHECK(parse("payee Grocer\n  alias\n").has_error());
  BOOST_CHECK(! parse("payee Grocer\n  bogus x\n").has_error());
}

BOOST_AUTO_TEST_CASE(testWordDirective)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (word_directive (value))))"),
                    item("include other.ledger\n"));

  BOOST_CHECK_EQUAL(string("(journal_item (directive (word_directive (value))))"),
                    item("apply account Expenses\n"));
  const node_t& apply(*tree->root().child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(5U, apply.child_count());
  BOOST_CHECK_EQUAL(string("account"), apply.child(2)->type());
  BOOST_CHECK_EQUAL(string("Expenses"), apply.child(4)->text());

  BOOST_CHECK_EQUAL(string("(journal_item (directive (word_directive)))"),
                    item("end apply account\n"));

  BOOST_CHECK_EQUAL(string("(journal_item (directive (word_directive (value))))"),
                    item("@alias Checking=Assets:Checking\n"));
  const node_t& alias(*tree->root().child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(string("@alias"), alias.child(0)->type());
}

BOOST_AUTO_TEST_CASE(testCharDirective)
{
  BOOST_CHECK_EQUAL(string("(journal_item (directive (char_directive "
                           "(value) (value) (value))))"),
                    item("P 2024/01/01 EUR $1.10\n"));

  BOOST_CHECK_EQUAL(string("(journal_item (directive (char_directive "
                           "(value) (value) (value))))"),
                    item("i 2024/01/01 09:00:00 Client:Project  Meeting notes\n"));
  const node_t& timelog(*tree->root().child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(string("Client:Project  Meeting notes"),
                    timelog.named_child(2)->text());

  BOOST_CHECK_EQUAL(string("(journal_item (directive (char_directive (value))))"),
                    item("Y2024\n"));
  BOOST_CHECK_EQUAL(string("(journal_item (directive (char_directive (value))))"),
                    item("D \"1,000.00 Euro\"\n"));
}

BOOST_AUTO_TEST_CASE(testUnknownDirective)
{
  const node_t& root(parse("; fine\nbogus directive here\n"));

  BOOST_CHECK(root.has_error());
  BOOST_CHECK(root.child(1)->is_error());
  BOOST_CHECK_EQUAL(1U, root.child(1)->start_point().row);
}

BOOST_AUTO_TEST_CASE(testPlainXact)
{
  BOOST_CHECK_EQUAL(string("(journal_item (xact (plain_xact "
                           "(date) (status) (code) (payee) (note) "
                           "(posting (account) (amount (commodity) (quantity))) "
                           "(posting (account)))))"),
                    item("2024/01/15 * (42) Grocery Store  ; weekly\n"
                         "    Expenses:Food    $45.00\n"
                         "    Assets:Checking\n"));

  const node_t& xact(*tree->root().child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(string("2024/01/15"), xact.find(SYMBOL_DATE)->text());
  BOOST_CHECK_EQUAL(string("(42)"), xact.find(SYMBOL_CODE)->text());
  BOOST_CHECK_EQUAL(string("Grocery Store"), xact.find(SYMBOL_PAYEE)->text());
  BOOST_CHECK_EQUAL(string("; weekly"), xact.find(SYMBOL_NOTE)->text());

  const node_t& post(*xact.find(SYMBOL_POSTING));
  BOOST_CHECK_EQUAL(1U, post.start_point().row);
  BOOST_CHECK_EQUAL(4U, post.start_point().column);
  BOOST_CHECK_EQUAL(string("Expenses:Food"), post.find(SYMBOL_ACCOUNT)->text());
}

BOOST_AUTO_TEST_CASE(testXactHeaderFields)
{
  BOOST_CHECK_EQUAL(string("(journal_item (xact (plain_xact "
                           "(date) (effective_date) (payee))))"),
                    item("2024/01/15=2024/01/20 Payee ; not a note\n"));
  BOOST_CHECK_EQUAL(string("Payee ; not a note"),
                    tree->root().child(0)->child(0)->child(0)
                    ->find(SYMBOL_PAYEE)->text());

  BOOST_CHECK_EQUAL(string("(journal_item (xact (plain_xact (date) (status) "
                           "(payee))))"),
                    item("2024/01/15 ! (unclosed code\n"));

  BOOST_CHECK_EQUAL(string("(journal_item (xact (plain_xact (date) (note) "
                           "(note))))"),
                    item("2024-01-15 ; header note\n  ; body note\n"));

  BOOST_CHECK(parse("2024/01/15x Payee\n").has_error());
  BOOST_CHECK(parse("2024/01/15= Payee\n").has_error());
}

BOOST_AUTO_TEST_CASE(testPeriodicXact)
{
  BOOST_CHECK_EQUAL(string("(journal_item (xact (periodic_xact (interval) "
                           "(note) "
                           "(posting (account) (amount (commodity) (quantity))))))"),
                    item("~ Monthly  ; rent\n    Expenses:Rent  $500\n"));

  const node_t& xact(*tree->root().child(0)->child(0)->child(0));
  BOOST_CHECK_EQUAL(string("Monthly"), xact.find(SYMBOL_INTERVAL)->text());
  BOOST_CHECK_EQUAL(string("~"), xact.child(0)->type());

  BOOST_CHECK(parse("~\n  Expenses  $1\n").has_error());
}

BOOST_AUTO_TEST_CASE(testAutomatedXact)
{
  BOOST_CHECK_EQUAL(string("(journal_item (xact (automated_xact (query) "
                           "(posting (account) (amount (negative_quantity))))))"),
                    item("= /Food/\n    (Budget:Food)  -1\n"));

  BOOST_CHECK(parse("=   \n").has_error());
}

BOOST_AUTO_TEST_CASE(testPostings)
{
  const node_t& root(parse("2024/01/01 Payee\n"
                           "  * Assets:Cash  -$10\n"
                           "  Assets:Stock  10 AAPL @ $2\n"
                           "  Assets:Stock  10 AAPL @@ $20\n"
                           "  Assets:Checking  = $100\n"
                           "  Assets:Savings  10 USD = 20 USD ; memo\n"
                           "  Equity  ; just a note\n"));
  BOOST_CHECK(! root.has_error());

  const node_t::children_list posts(postings());
  BOOST_REQUIRE_EQUAL(6U, posts.size());

  BOOST_CHECK_EQUAL(string("(posting (status) (account) (amount (commodity) "
                           "(quantity)))"), posts[0]->sexp());
  const node_t& amount(*posts[0]->find(SYMBOL_AMOUNT));
  BOOST_CHECK_EQUAL(string("-"), amount.child(0)->type());
  BOOST_CHECK_EQUAL(string("-$10"), amount.text());

  BOOST_CHECK_EQUAL(string("(posting (account) (amount (quantity) (commodity)) "
                           "(price (amount (commodity) (quantity))))"),
                    posts[1]->sexp());
  BOOST_CHECK_EQUAL(string("@"), posts[1]->find(SYMBOL_PRICE)->child(0)->type());
  BOOST_CHECK_EQUAL(string("@@"), posts[2]->find(SYMBOL_PRICE)->child(0)->type());

  BOOST_CHECK_EQUAL(string("(posting (account) (balance_assertion (amount "
                           "(commodity) (quantity))))"), posts[3]->sexp());

  BOOST_CHECK_EQUAL(string("(posting (account) (amount (quantity) (commodity)) "
                           "(balance_assertion (amount (quantity) (commodity))) "
                           "(note))"), posts[4]->sexp());

  BOOST_CHECK_EQUAL(string("(posting (account) (note))"), posts[5]->sexp());
}

BOOST_AUTO_TEST_CASE(testAmountForms)
{
  const node_t& root(parse("2024/01/01 Payee\n"
                           "  A  1,000.50\n"
                           "  B  -5 \"ACME Corp\"\n"
                           "  C  EUR -3\n"
                           "  D  10€\n"));
  BOOST_CHECK(! root.has_error());

  const node_t::children_list posts(postings());
  BOOST_REQUIRE_EQUAL(4U, posts.size());

  BOOST_CHECK_EQUAL(string("(amount (quantity))"),
                    posts[0]->find(SYMBOL_AMOUNT)->sexp());
  BOOST_CHECK_EQUAL(string("\"ACME Corp\""),
                    posts[1]->find(SYMBOL_AMOUNT)->find(SYMBOL_COMMODITY)->text());
  BOOST_CHECK_EQUAL(string("(amount (commodity) (negative_quantity))"),
                    posts[2]->find(SYMBOL_AMOUNT)->sexp());
  BOOST_CHECK_EQUAL(string("€"),
                    posts[3]->find(SYMBOL_AMOUNT)->find(SYMBOL_COMMODITY)->text());
}

BOOST_AUTO_TEST_CASE(testPostingErrors)
{
  BOOST_CHECK(parse("2024/01/01 Payee\n  Assets:Stock  10 AAPL {$50}\n")
              .has_error());
  BOOST_CHECK(parse("2024/01/01 Payee\n  Assets  (10 * 2)\n").has_error());
  BOOST_CHECK(parse("2024/01/01 Payee\n  Assets  10 @\n").has_error());

  const node_t& root(parse("2024/01/01 Payee\n  Assets  $10 junk\n"));
  const node_t * error = root.child(0)->child(0)->child(0)->named_child(2);
  BOOST_REQUIRE(error != NULL);
  BOOST_CHECK(error->is_error());
  BOOST_CHECK_EQUAL(1U, error->start_point().row);
}

BOOST_AUTO_TEST_CASE(testIndentedLineAtTopLevel)
{
  const node_t& root(parse("    Expenses  $10\n"));
  BOOST_CHECK(root.has_error());
  BOOST_CHECK(root.child(0)->is_error());
}

BOOST_AUTO_TEST_CASE(testLineEndings)
{
  const node_t& root(parse("\xEF\xBB\xBF; comment\r\n2024/01/01 Payee\r\n"
                           "  Assets  $1\r\n"));
  BOOST_CHECK(! root.has_error());
  BOOST_CHECK_EQUAL(string("; comment"), root.child(0)->child(0)->text());

  const node_t& xact(*root.child(1)->child(0)->child(0));
  BOOST_CHECK_EQUAL(string("Payee"), xact.find(SYMBOL_PAYEE)->text());
  BOOST_CHECK_EQUAL(string("$1"),
                    xact.find(SYMBOL_POSTING)->find(SYMBOL_AMOUNT)->text());
}

BOOST_AUTO_TEST_CASE(testParseFailure)
{
  BOOST_CHECK_THROW(parse_journal("; bad \xff byte\n"), parse_error);
  BOOST_CHECK_THROW(parse_journal(string("; nul\0byte\n", 11)), parse_error);

  unique_ptr<syntax_tree_t> empty(parse_journal(""));
  BOOST_CHECK_EQUAL(0U, empty->root().child_count());
}

BOOST_AUTO_TEST_SUITE_END()
