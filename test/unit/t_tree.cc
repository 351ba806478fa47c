#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE tree
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "tree.h"

using namespace beautifier;

struct tree_fixture {
  syntax_tree_t tree;
  node_t *      root;
  node_t *      item;
  node_t *      comment;

  //           0123456789
  tree_fixture()
    : tree("; hello\n\n") {
    root    = tree.create_node(SYMBOL_SOURCE_FILE, true, 0, 9, point_t(0, 0));
    item    = tree.create_node(SYMBOL_JOURNAL_ITEM, true, 0, 7, point_t(0, 0));
    comment = tree.create_node(SYMBOL_COMMENT, true, 0, 7, point_t(0, 0));

    item->add_child(comment);
    root->add_child(item);
    root->add_child(tree.create_node(SYMBOL_BLANK_LINE, false, 8, 8,
                                     point_t(1, 0)));
    tree.set_root(root);
  }
};

BOOST_FIXTURE_TEST_SUITE(syntax_tree, tree_fixture)

BOOST_AUTO_TEST_CASE(testSymbolNames)
{
  BOOST_CHECK_EQUAL(string("source_file"), symbol_name(SYMBOL_SOURCE_FILE));
  BOOST_CHECK_EQUAL(string("plain_xact"), symbol_name(SYMBOL_PLAIN_XACT));
  BOOST_CHECK_EQUAL(string("negative_quantity"),
                    symbol_name(SYMBOL_NEGATIVE_QUANTITY));
  BOOST_CHECK_EQUAL(string("ERROR"), symbol_name(SYMBOL_ERROR));

  for (int i = 0; i < SYMBOL_LAST; i++) {
    symbol_t kind = static_cast<symbol_t>(i);
    optional<symbol_t> found = find_symbol(symbol_name(kind));
    BOOST_CHECK(found);
    BOOST_CHECK_EQUAL(kind, *found);
  }

  BOOST_CHECK(! find_symbol("no_such_symbol"));
}

BOOST_AUTO_TEST_CASE(testNodeText)
{
  BOOST_CHECK_EQUAL(string("; hello"), comment->text());
  BOOST_CHECK_EQUAL(string("; hello\n\n"), root->text());
  BOOST_CHECK_EQUAL(string(""), root->child(1)->text());
  BOOST_CHECK_EQUAL(4U, tree.size());
  BOOST_CHECK_EQUAL(root, &tree.root());
}

BOOST_AUTO_TEST_CASE(testChildren)
{
  BOOST_CHECK_EQUAL(2U, root->child_count());
  BOOST_CHECK_EQUAL(item, root->child(0));
  BOOST_CHECK(root->child(2) == NULL);

  node_t::children_list named(root->named_children());
  BOOST_CHECK_EQUAL(1U, named.size());
  BOOST_CHECK_EQUAL(item, named.front());

  BOOST_CHECK_EQUAL(item, root->named_child(0));
  BOOST_CHECK(root->named_child(1) == NULL);

  BOOST_CHECK_EQUAL(comment, item->find(SYMBOL_COMMENT));
  BOOST_CHECK(item->find(SYMBOL_BLOCK_COMMENT) == NULL);
  BOOST_CHECK(root->find(SYMBOL_BLANK_LINE) == NULL);
}

BOOST_AUTO_TEST_CASE(testNodeType)
{
  node_t * dash = tree.create_node(SYMBOL_TOKEN, false, 0, 1, point_t(0, 0));

  BOOST_CHECK_EQUAL(string("journal_item"), item->type());
  BOOST_CHECK_EQUAL(string(";"), dash->type());
  BOOST_CHECK(item->is_named());
  BOOST_CHECK(! dash->is_named());
}

BOOST_AUTO_TEST_CASE(testHasError)
{
  BOOST_CHECK(! root->has_error());

  node_t * error = tree.create_node(SYMBOL_ERROR, true, 2, 7, point_t(0, 2));
  comment->add_child(error);

  BOOST_CHECK(error->is_error());
  BOOST_CHECK(! comment->is_error());
  BOOST_CHECK(comment->has_error());
  BOOST_CHECK(root->has_error());
  BOOST_CHECK_EQUAL(2U, error->start_point().column);
}

BOOST_AUTO_TEST_CASE(testSexp)
{
  BOOST_CHECK_EQUAL(string("(source_file (journal_item (comment)))"),
                    root->sexp());

  std::ostringstream out;
  out << *item;
  BOOST_CHECK_EQUAL(string("(journal_item (comment))"), out.str());
}

BOOST_AUTO_TEST_CASE(testEndPos)
{
  item->set_end_pos(9);
  BOOST_CHECK_EQUAL(9U, item->end_pos());
  BOOST_CHECK_EQUAL(0U, item->beg_pos());
  BOOST_CHECK_EQUAL(string("; hello\n\n"), item->text());
}

BOOST_AUTO_TEST_SUITE_END()
