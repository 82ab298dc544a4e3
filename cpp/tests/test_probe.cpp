#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include "fileio.hpp"
#include "tempdir.hpp"

#include <string>

BOOST_AUTO_TEST_SUITE(ProbeEncoding)

BOOST_AUTO_TEST_CASE(empty_is_text)
{
	BOOST_CHECK(probe_encoding("", false) == content_encoding::text);
	BOOST_CHECK(probe_content("") == content_encoding::text);
}

BOOST_AUTO_TEST_CASE(nul_is_binary)
{
	std::string sample("plain text\0more", 15);
	BOOST_CHECK(probe_encoding(sample, false) == content_encoding::binary);
}

BOOST_AUTO_TEST_CASE(utf8_text)
{
	BOOST_CHECK(probe_content("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\n") == content_encoding::text);
	BOOST_CHECK(probe_content("tabs\tand\r\nescapes \x1b[0m\b\f\v") == content_encoding::text);
}

BOOST_AUTO_TEST_CASE(invalid_utf8_is_binary)
{
	BOOST_CHECK(probe_content("bad \xff byte") == content_encoding::binary);
	BOOST_CHECK(probe_content("overlong \xc0\xaf") == content_encoding::binary);
	BOOST_CHECK(probe_content("surrogate \xed\xa0\x80") == content_encoding::binary);
	// cut off at the end of the whole content
	BOOST_CHECK(probe_content("cut \xe2\x82") == content_encoding::binary);
}

BOOST_AUTO_TEST_CASE(sequence_cut_by_sample_boundary)
{
	// a 3-byte sequence starts two bytes before the end of the sample
	std::string content(probe_size - 2, 'a');
	content += "\xe2\x82\xac tail\n";
	BOOST_CHECK(probe_content(content) == content_encoding::text);
	BOOST_CHECK(probe_encoding(std::string_view(content).substr(0, probe_size), true)
		== content_encoding::text);
	BOOST_CHECK(probe_encoding(std::string_view(content).substr(0, probe_size), false)
		== content_encoding::binary);
}

BOOST_AUTO_TEST_CASE(control_byte_ratio)
{
	// 3 of 10 bytes are controls: exactly 30% is still text
	std::string thirty = "abcdefg\x01\x02\x03";
	BOOST_CHECK(probe_content(thirty) == content_encoding::text);
	// 4 of 10 is over the limit
	std::string forty = "abcdef\x01\x02\x03\x7f";
	BOOST_CHECK(probe_content(forty) == content_encoding::binary);
}

BOOST_AUTO_TEST_CASE(only_leading_block_counts)
{
	std::string content(probe_size, 'a');
	content += std::string("\0\0\0", 3);
	BOOST_CHECK(probe_content(content) == content_encoding::text);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FileDigest)

BOOST_AUTO_TEST_CASE(same_content_same_fingerprint)
{
	TemporaryDirectory dir;
	std::string big(3 * probe_size + 17, 'x');
	auto a = dir.write("a", big);
	auto b = dir.write("b", big);
	std::string changed = big;
	changed.back() = 'y';
	auto c = dir.write("c", changed);

	auto da = digest_file(a), db = digest_file(b), dc = digest_file(c);
	BOOST_CHECK(da.print == db.print);
	BOOST_CHECK(da.print.head == dc.print.head);
	BOOST_CHECK(da.print.whole != dc.print.whole);
	BOOST_CHECK(da.encoding == content_encoding::text);
}

BOOST_AUTO_TEST_CASE(probe_file_matches_probe_content)
{
	TemporaryDirectory dir;
	std::string content(probe_size - 1, 'a');
	content += "\xc3\xa9 and more\n";
	auto file = dir.write("f", content);
	BOOST_CHECK(probe_file(file) == probe_content(content));
	BOOST_CHECK(digest_file(file).encoding == probe_content(content));
	BOOST_CHECK_EQUAL(read_file(file), content);
}

BOOST_AUTO_TEST_CASE(read_across_blocks)
{
	TemporaryDirectory dir;
	std::string content;
	for(int i = 0; content.size() < 2 * probe_size + 100; ++i)
		content += "line " + std::to_string(i) + "\n";
	auto file = dir.write("long.txt", content);
	BOOST_CHECK_EQUAL(read_file(file), content);
	BOOST_CHECK(probe_file(file) == content_encoding::text);
	BOOST_CHECK(digest_file(file).encoding == content_encoding::text);
	BOOST_CHECK_EQUAL(read_file(dir.write("empty", "")), "");
}

BOOST_AUTO_TEST_CASE(missing_file_throws)
{
	TemporaryDirectory dir;
	BOOST_CHECK_THROW(read_file(dir.path() / "nope"), std::system_error);
	try {
		digest_file(dir.path() / "nope");
	} catch(const std::system_error& err) {
		fs_entry entry = stat_entry(dir.path() / "nope", "nope").entry;
		BOOST_CHECK(entry.error == entry_error::vanished);
		record_error(entry, err);
		BOOST_CHECK(entry.error == entry_error::vanished);
		BOOST_CHECK(!entry.error_detail.empty());
	}
}

BOOST_AUTO_TEST_SUITE_END()
