#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include "json.hpp"
#include "session.hpp"
#include "tempdir.hpp"

namespace json = boost::json;

struct ComparedTrees {
	TemporaryDirectory left;
	TemporaryDirectory right;

	std::shared_ptr<const diff_tree> compare() {
		boost::asio::thread_pool pool(2);
		compare_options opts;
		opts.left = left.path();
		opts.right = right.path();
		return compare_roots(opts, pool, cancel_token());
	}
};

BOOST_FIXTURE_TEST_SUITE(JsonShapes, ComparedTrees)

BOOST_AUTO_TEST_CASE(tree_shape)
{
	left.write("a.txt", "hello\n");
	right.write("a.txt", "hello\nworld\n");
	right.write("dir/new.txt", "n\n");
	auto tree = compare();
	auto value = to_json(*tree);
	const auto& obj = value.as_object();
	BOOST_CHECK_EQUAL(obj.at("left_root").as_string(), left.path().string());
	BOOST_CHECK(obj.at("left_scanned").is_int64());
	const auto& summary = obj.at("summary").as_object();
	BOOST_CHECK_EQUAL(summary.at("added").to_number<std::int64_t>(), 2);
	BOOST_CHECK_EQUAL(summary.at("modified").to_number<std::int64_t>(), 1);

	const auto& root = obj.at("root").as_object();
	BOOST_CHECK_EQUAL(root.at("path").as_string(), "");
	BOOST_CHECK(root.at("is_directory").as_bool());
	const auto& children = root.at("children").as_array();
	BOOST_REQUIRE_EQUAL(children.size(), 2u);
	const auto& file = children.at(0).as_object();
	BOOST_CHECK_EQUAL(file.at("name").as_string(), "a.txt");
	BOOST_CHECK_EQUAL(file.at("status").as_string(), "modified");
	BOOST_CHECK(file.at("reason").is_null());
	const auto& dir = children.at(1).as_object();
	BOOST_CHECK_EQUAL(dir.at("status").as_string(), "added");
	BOOST_CHECK(dir.at("left").is_null());
	BOOST_CHECK_EQUAL(dir.at("children").as_array().size(), 1u);
}

BOOST_AUTO_TEST_CASE(entry_shape)
{
	left.write("a.txt", "abc\n");
	right.write("a.txt", "abc\n");
	auto tree = compare();
	auto value = to_json(*tree->find("a.txt"), false);
	const auto& node = value.as_object();
	BOOST_CHECK(!node.contains("children"));
	const auto& entry = node.at("left").as_object();
	BOOST_CHECK_EQUAL(entry.at("path").as_string(), "a.txt");
	BOOST_CHECK_EQUAL(entry.at("kind").as_string(), "file");
	BOOST_CHECK_EQUAL(entry.at("size").to_number<std::int64_t>(), 4);
	BOOST_CHECK(entry.at("mtime").as_object().contains("nsec"));
	BOOST_CHECK(entry.at("error").is_null());
	BOOST_CHECK_EQUAL(entry.at("symlink").as_bool(), false);
	for(const char* key : { "fingerprint", "encoding", "error_detail" })
		BOOST_CHECK(entry.contains(key));
}

BOOST_AUTO_TEST_CASE(file_diff_shape)
{
	file_diff diff = diff_text("a\nb", "a\nc\n");
	diff.rel_path = "x.txt";
	auto value = to_json(diff);
	const auto& obj = value.as_object();
	BOOST_CHECK_EQUAL(obj.at("path").as_string(), "x.txt");
	BOOST_CHECK_EQUAL(obj.at("left_newline_at_eof").as_bool(), false);
	BOOST_CHECK_EQUAL(obj.at("right_newline_at_eof").as_bool(), true);
	const auto& hunks = obj.at("hunks").as_array();
	BOOST_REQUIRE_EQUAL(hunks.size(), 2u);
	const auto& replace = hunks.at(1).as_object();
	BOOST_CHECK_EQUAL(replace.at("op").as_string(), "replace");
	BOOST_CHECK_EQUAL(replace.at("left").as_object().at("first").to_number<std::int64_t>(), 2);
	BOOST_CHECK_EQUAL(replace.at("left_lines").as_array().at(0).as_string(), "b");
	BOOST_CHECK_EQUAL(replace.at("right_lines").as_array().at(0).as_string(), "c");

	auto inserted = to_json(diff_text("", "x\n"));
	const auto& insert = inserted.as_object().at("hunks").as_array().at(0).as_object();
	BOOST_CHECK_EQUAL(insert.at("op").as_string(), "insert");
	BOOST_CHECK(insert.at("left").is_null());
	BOOST_CHECK(insert.at("left_lines").as_array().empty());
}

BOOST_AUTO_TEST_CASE(api_envelopes)
{
	auto ok = api_response(json::value(42));
	BOOST_CHECK(ok.as_object().at("success").as_bool());
	BOOST_CHECK_EQUAL(ok.as_object().at("data").as_int64(), 42);
	BOOST_CHECK(ok.as_object().at("error").is_null());

	auto err = api_error(std::system_error(make_error_code(diff_errc::binary_content), "img.png"));
	const auto& obj = err.as_object();
	BOOST_CHECK(!obj.at("success").as_bool());
	BOOST_CHECK(obj.at("data").is_null());
	BOOST_CHECK_EQUAL(obj.at("code").as_string(), "binary_content");
	BOOST_CHECK(std::string(obj.at("error").as_string()).find("img.png") != std::string::npos);

	auto io = api_error(std::system_error(std::make_error_code(std::errc::permission_denied)));
	BOOST_CHECK_EQUAL(io.as_object().at("code").as_string(), "io_error");
}

BOOST_AUTO_TEST_CASE(serializes)
{
	left.write("q\"uote.txt", "x\n");
	auto tree = compare();
	auto text = json::serialize(api_response(to_json(*tree)));
	auto parsed = json::parse(text);
	BOOST_CHECK(parsed.as_object().at("success").as_bool());
	BOOST_CHECK_EQUAL(parsed.as_object().at("data").as_object().at("root")
		.as_object().at("children").as_array().at(0).as_object().at("name").as_string(), "q\"uote.txt");
}

BOOST_AUTO_TEST_SUITE_END()
