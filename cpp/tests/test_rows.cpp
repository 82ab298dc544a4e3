#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include "session.hpp"
#include "tree_rows.hpp"
#include "tempdir.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

static compare_options options_for(const TemporaryDirectory& left, const TemporaryDirectory& right) {
	compare_options opts;
	opts.left = left.path();
	opts.right = right.path();
	opts.threads = 2;
	return opts;
}

static std::vector<std::string> paths_of(const std::vector<tree_row>& rows) {
	std::vector<std::string> paths;
	for(const auto& row : rows)
		paths.push_back(row.node->rel_path);
	return paths;
}

struct ChangedTrees {
	TemporaryDirectory left;
	TemporaryDirectory right;

	ChangedTrees() {
		left.write("d/a.txt", "a\n");
		left.write("d/b.txt", "b\n");
		left.write("same.txt", "same\n");
		right.write("d/a.txt", "a\n");
		right.write("d/b.txt", "b\nmore\n");
		right.write("same.txt", "same\n");
	}
};

BOOST_FIXTURE_TEST_SUITE(TreeRows, ChangedTrees)

BOOST_AUTO_TEST_CASE(collapsed_and_expanded)
{
	diff_session session(options_for(left, right));
	auto tree = session.refresh();
	auto rows = flatten_rows(tree->root, {}, false);
	BOOST_CHECK((paths_of(rows) == std::vector<std::string>{ "d", "same.txt" }));

	rows = flatten_rows(tree->root, { "d" }, false);
	BOOST_CHECK((paths_of(rows)
		== std::vector<std::string>{ "d", "d/a.txt", "d/b.txt", "same.txt" }));
	BOOST_CHECK_EQUAL(rows[0].depth, 0);
	BOOST_CHECK_EQUAL(rows[2].depth, 1);
	BOOST_CHECK_EQUAL(find_row(rows, "d/b.txt"), 2);
	BOOST_CHECK_EQUAL(find_row(rows, "nowhere"), 0);
}

BOOST_AUTO_TEST_CASE(hide_unchanged)
{
	diff_session session(options_for(left, right));
	auto tree = session.refresh();
	BOOST_CHECK(has_changes(tree->root));
	BOOST_CHECK(!has_changes(*tree->find("same.txt")));
	BOOST_CHECK(has_changes(*tree->find("d")));
	auto rows = flatten_rows(tree->root, { "d" }, true);
	BOOST_CHECK((paths_of(rows) == std::vector<std::string>{ "d", "d/b.txt" }));
}

BOOST_AUTO_TEST_CASE(selection_survives_rescan)
{
	diff_session session(options_for(left, right));
	std::set<std::string> expanded = { "d" };
	std::shared_ptr<const diff_tree> tree = session.refresh();
	std::weak_ptr<const diff_tree> old_tree = tree;
	auto rows = flatten_rows(tree->root, expanded, false);
	int index = find_row(rows, "d/b.txt");

	// the selection is read before the old tree is released
	std::string path = rows[index].node->rel_path;
	rows.clear();
	right.write("d/0.txt", "new\n");
	tree = session.refresh();
	BOOST_CHECK(old_tree.expired());

	rows = flatten_rows(tree->root, expanded, false);
	index = find_row(rows, path);
	BOOST_CHECK_EQUAL(index, 3);
	BOOST_CHECK_EQUAL(rows[index].node->rel_path, "d/b.txt");
	BOOST_CHECK(rows[index].node->status == diff_status::modified);
}

BOOST_AUTO_TEST_CASE(file_view_messages)
{
	right.write("img.bin", std::string("\0\1\2", 3));
	left.write("img.bin", std::string("\0\1\3", 3));
	diff_session session(options_for(left, right));
	session.refresh();

	auto ok = load_file_view(session, "d/b.txt");
	BOOST_REQUIRE(ok.diff != nullptr);
	BOOST_CHECK(ok.message.empty());
	BOOST_CHECK_EQUAL(ok.diff->hunks.size(), 2u);

	auto binary = load_file_view(session, "img.bin");
	BOOST_CHECK(binary.diff == nullptr);
	BOOST_CHECK_EQUAL(binary.message, "binary files differ");

	auto missing = load_file_view(session, "nowhere");
	BOOST_CHECK(missing.diff == nullptr);
	BOOST_CHECK(!missing.message.empty());

	auto directory = load_file_view(session, "d");
	BOOST_CHECK(directory.diff == nullptr);
	BOOST_CHECK(!directory.message.empty());
}

BOOST_AUTO_TEST_CASE(file_root)
{
	TemporaryDirectory l, r;
	auto lf = l.write("one.txt", "x\n");
	auto rf = r.write("two.txt", "y\n");
	compare_options opts;
	opts.left = lf;
	opts.right = rf;
	opts.threads = 1;
	diff_session session(opts);
	auto tree = session.refresh();
	auto rows = flatten_rows(tree->root, {}, true);
	BOOST_REQUIRE_EQUAL(rows.size(), 1u);
	BOOST_CHECK_EQUAL(rows[0].node->rel_path, "");
}

BOOST_AUTO_TEST_SUITE_END()
