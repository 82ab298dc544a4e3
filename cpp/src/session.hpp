#pragma once

#include "cancel.hpp"
#include "diff.hpp"
#include "memoize.hpp"
#include "scan.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/thread_pool.hpp>

struct compare_options {
	std::filesystem::path left;
	std::filesystem::path right;
	scan_options scan = {};
	unsigned threads = 0; // 0 picks the hardware concurrency
};

// Scan both roots concurrently, then match them. Throws std::system_error
// with root_not_found, root_unreadable or cancelled.
std::shared_ptr<const diff_tree> compare_roots(
	const compare_options& opts,
	boost::asio::thread_pool& pool,
	const cancel_token& cancel
);

// Read both sides of a file node and diff them by line. An absent side
// reads as empty. Throws entry_not_found, not_a_file, binary_content, or
// the OS error of a failed read.
file_diff diff_entry(const diff_tree& tree, std::string_view rel_path);

// mtimes of both sides of an entry at the time its hunks were computed
struct content_token {
	std::optional<struct timespec> left;
	std::optional<struct timespec> right;

	bool operator ==(const content_token& other) const;
};

// One comparison and the hunks computed from it so far.
class diff_session {
	public:
	explicit diff_session(compare_options opts);
	~diff_session();

	diff_session(const diff_session&) = delete;
	diff_session& operator =(const diff_session&) = delete;

	// Compare the roots again, replacing the tree and dropping cached hunks.
	std::shared_ptr<const diff_tree> refresh(const cancel_token& cancel = {});

	// nullptr until the first refresh succeeds
	std::shared_ptr<const diff_tree> tree() const;

	// Cached per path until either file's mtime changes.
	std::shared_ptr<const file_diff> file_hunks(const std::string& rel_path);

	const compare_options& options() const { return opts; }
	boost::asio::thread_pool& pool() { return workers; }

	private:
	content_token token_of(const std::string& rel_path) const;

	compare_options opts;
	boost::asio::thread_pool workers;
	mutable std::mutex tree_mutex;
	std::shared_ptr<const diff_tree> current;
	memoized<std::shared_ptr<const file_diff>, content_token, std::string> hunks;
};
