#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include "linediff.hpp"
#include "errors.hpp"

#include <string>
#include <vector>

static diff_hunk hunk(hunk_op op,
	std::optional<line_range> left, std::optional<line_range> right
) {
	return diff_hunk{ .op = op, .left = left, .right = right };
}

static std::size_t changed_lines(const std::vector<diff_hunk>& hunks) {
	std::size_t count = 0;
	for(const auto& h : hunks) {
		if(h.op == hunk_op::equal)
			continue;
		if(h.left) count += h.left->count();
		if(h.right) count += h.right->count();
	}
	return count;
}

// every line of both sides covered once, in order
static void check_coverage(const file_diff& diff) {
	std::size_t next_left = 1, next_right = 1;
	for(const auto& h : diff.hunks) {
		BOOST_CHECK(h.left.has_value() || h.right.has_value());
		if(h.left) {
			BOOST_CHECK_EQUAL(h.left->first, next_left);
			BOOST_CHECK(h.left->last >= h.left->first);
			next_left = h.left->last + 1;
		}
		if(h.right) {
			BOOST_CHECK_EQUAL(h.right->first, next_right);
			BOOST_CHECK(h.right->last >= h.right->first);
			next_right = h.right->last + 1;
		}
		switch(h.op) {
			case hunk_op::equal:
				BOOST_REQUIRE(h.left && h.right);
				BOOST_CHECK_EQUAL(h.left->count(), h.right->count());
				for(std::size_t i = 0; i < h.left->count(); ++i)
					BOOST_CHECK_EQUAL(diff.left_lines[h.left->first - 1 + i],
						diff.right_lines[h.right->first - 1 + i]);
				break;
			case hunk_op::insert:  BOOST_CHECK(!h.left && h.right); break;
			case hunk_op::remove:  BOOST_CHECK(h.left && !h.right); break;
			case hunk_op::replace: BOOST_CHECK(h.left && h.right); break;
		}
	}
	BOOST_CHECK_EQUAL(next_left, diff.left_lines.size() + 1);
	BOOST_CHECK_EQUAL(next_right, diff.right_lines.size() + 1);
}

static void check_round_trip(const std::string& left, const std::string& right) {
	auto diff = diff_text(left, right);
	check_coverage(diff);
	BOOST_CHECK_EQUAL(reconstruct(diff, diff_side::left), left);
	BOOST_CHECK_EQUAL(reconstruct(diff, diff_side::right), right);
	for(std::size_t i = 1; i < diff.hunks.size(); ++i)
		BOOST_CHECK(diff.hunks[i - 1].op == hunk_op::equal || diff.hunks[i].op == hunk_op::equal);
}

BOOST_AUTO_TEST_SUITE(SplitLines)

BOOST_AUTO_TEST_CASE(keeps_terminators)
{
	std::vector<std::string> expected = { "a\n", "b\r\n", "c" };
	BOOST_CHECK(split_lines("a\nb\r\nc") == expected);
	BOOST_CHECK(split_lines("").empty());
	BOOST_CHECK(split_lines("\n") == std::vector<std::string>{ "\n" });
}

BOOST_AUTO_TEST_CASE(line_text_strips_terminator)
{
	BOOST_CHECK_EQUAL(line_text("abc\n"), "abc");
	BOOST_CHECK_EQUAL(line_text("abc\r\n"), "abc");
	BOOST_CHECK_EQUAL(line_text("abc"), "abc");
	BOOST_CHECK(has_newline("x\n"));
	BOOST_CHECK(!has_newline("x"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DiffLines)

BOOST_AUTO_TEST_CASE(appended_line)
{
	auto diff = diff_text("hello\n", "hello\nworld\n");
	std::vector<diff_hunk> expected =
		{ hunk(hunk_op::equal, line_range{ 1, 1 }, line_range{ 1, 1 })
		, hunk(hunk_op::insert, std::nullopt, line_range{ 2, 2 })
		};
	BOOST_CHECK(diff.hunks == expected);
	BOOST_CHECK_EQUAL(diff.right_lines.at(1), "world\n");
}

BOOST_AUTO_TEST_CASE(empty_sides)
{
	auto inserted = diff_text("", "a\nb\n");
	BOOST_REQUIRE_EQUAL(inserted.hunks.size(), 1u);
	BOOST_CHECK(inserted.hunks[0] == hunk(hunk_op::insert, std::nullopt, line_range{ 1, 2 }));

	auto removed = diff_text("a\nb\n", "");
	BOOST_REQUIRE_EQUAL(removed.hunks.size(), 1u);
	BOOST_CHECK(removed.hunks[0] == hunk(hunk_op::remove, line_range{ 1, 2 }, std::nullopt));

	BOOST_CHECK(diff_text("", "").hunks.empty());
}

BOOST_AUTO_TEST_CASE(identical)
{
	auto diff = diff_text("a\nb\nc\n", "a\nb\nc\n");
	BOOST_REQUIRE_EQUAL(diff.hunks.size(), 1u);
	BOOST_CHECK(diff.hunks[0] == hunk(hunk_op::equal, line_range{ 1, 3 }, line_range{ 1, 3 }));
}

BOOST_AUTO_TEST_CASE(trailing_newline_differs)
{
	auto diff = diff_text("a\nb", "a\nb\n");
	std::vector<diff_hunk> expected =
		{ hunk(hunk_op::equal, line_range{ 1, 1 }, line_range{ 1, 1 })
		, hunk(hunk_op::replace, line_range{ 2, 2 }, line_range{ 2, 2 })
		};
	BOOST_CHECK(diff.hunks == expected);
	check_round_trip("a\nb", "a\nb\n");
}

BOOST_AUTO_TEST_CASE(changed_line_is_replace)
{
	auto diff = diff_text("a\nb\nc\n", "a\nx\nc\n");
	std::vector<diff_hunk> expected =
		{ hunk(hunk_op::equal, line_range{ 1, 1 }, line_range{ 1, 1 })
		, hunk(hunk_op::replace, line_range{ 2, 2 }, line_range{ 2, 2 })
		, hunk(hunk_op::equal, line_range{ 3, 3 }, line_range{ 3, 3 })
		};
	BOOST_CHECK(diff.hunks == expected);
}

BOOST_AUTO_TEST_CASE(removed_middle_line)
{
	auto diff = diff_text("a\nb\nc\n", "a\nc\n");
	std::vector<diff_hunk> expected =
		{ hunk(hunk_op::equal, line_range{ 1, 1 }, line_range{ 1, 1 })
		, hunk(hunk_op::remove, line_range{ 2, 2 }, std::nullopt)
		, hunk(hunk_op::equal, line_range{ 3, 3 }, line_range{ 2, 2 })
		};
	BOOST_CHECK(diff.hunks == expected);
}

BOOST_AUTO_TEST_CASE(minimal_edit_script)
{
	// the example from Myers' paper: D = 5
	std::vector<std::string> a = { "A", "B", "C", "A", "B", "B", "A" };
	std::vector<std::string> b = { "C", "B", "A", "B", "A", "C" };
	BOOST_CHECK_EQUAL(changed_lines(diff_lines(a, b)), 5u);
	BOOST_CHECK_EQUAL(changed_lines(diff_lines(b, a)), 5u);

	std::vector<std::string> c = { "x", "a", "b", "c", "y" };
	std::vector<std::string> d = { "a", "b", "c" };
	BOOST_CHECK_EQUAL(changed_lines(diff_lines(c, d)), 2u);
	BOOST_CHECK_EQUAL(changed_lines(diff_lines(d, c)), 2u);
}

BOOST_AUTO_TEST_CASE(deterministic)
{
	std::string left = "a\nb\nc\nd\ne\nf\n", right = "b\nx\nd\ne\ny\nf\ng\n";
	auto first = diff_text(left, right);
	auto second = diff_text(left, right);
	BOOST_CHECK(first.hunks == second.hunks);
}

BOOST_AUTO_TEST_CASE(round_trip)
{
	check_round_trip("a\nb\nc\n", "c\nb\na\n");
	check_round_trip("one\ntwo\nthree", "zero\none\nthree\nfour");
	check_round_trip("\n\n\n", "\n");
	check_round_trip("x\r\ny\r\n", "x\ny\n");

	// pseudo-random lines over a small alphabet so many lines repeat
	unsigned seed = 12345;
	auto next = [&] () { seed = seed * 1103515245u + 12345u; return (seed >> 16) % 4; };
	for(int round = 0; round < 50; ++round) {
		std::string left, right;
		int left_lines = next() * 5 + next(), right_lines = next() * 5 + next();
		for(int i = 0; i < left_lines; ++i)
			left += std::string(1, static_cast<char>('a' + next())) + "\n";
		for(int i = 0; i < right_lines; ++i)
			right += std::string(1, static_cast<char>('a' + next())) + "\n";
		check_round_trip(left, right);
	}
}

BOOST_AUTO_TEST_CASE(binary_content_throws)
{
	std::string binary("a\0b\n", 4);
	try {
		diff_text("text\n", binary);
		BOOST_FAIL("expected binary_content");
	} catch(const std::system_error& err) {
		BOOST_CHECK(err.code() == diff_errc::binary_content);
	}
	BOOST_CHECK_THROW(diff_text(binary, "text\n"), std::system_error);
}

BOOST_AUTO_TEST_SUITE_END()
