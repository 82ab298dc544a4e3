#include "session.hpp"
#include "linediff.hpp"
#include "match.hpp"
#include "trace.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace fs = std::filesystem;

std::shared_ptr<const diff_tree> compare_roots(
	const compare_options& opts,
	boost::asio::thread_pool& pool,
	const cancel_token& cancel
) {
	auto start = std::chrono::steady_clock::now();
	trace("compare:", opts.left, "<->", opts.right, "fingerprint", opts.scan.policy);

	// The walks block on pool tasks, so they get threads of their own.
	auto left = std::async(std::launch::async,
		[&] () { return scan_root(opts.left, opts.scan, pool, cancel); });
	auto right = std::async(std::launch::async,
		[&] () { return scan_root(opts.right, opts.scan, pool, cancel); });
	left.wait();
	right.wait();
	auto left_scan = left.get();
	auto right_scan = right.get();

	auto tree = std::make_shared<const diff_tree>(
		match_scans(left_scan, right_scan, opts.scan.policy, pool, cancel));

	auto summary = tree->summary();
	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start);
	trace("compare:", summary.files, "files",
		summary.added, "added", summary.removed, "removed",
		summary.modified, "modified", summary.conflicted, "conflicted",
		summary.errors, "errors in", elapsed.count(), "ms");
	return tree;
}

static std::string read_side(
	const fs::path& root,
	const std::string& rel_path,
	const std::optional<fs_entry>& entry
) {
	if(!entry)
		return "";
	return read_file(entry_path(root, rel_path));
}

file_diff diff_entry(const diff_tree& tree, std::string_view rel_path) {
	const diff_node* node = tree.find(rel_path);
	if(node == nullptr)
		throw std::system_error(make_error_code(diff_errc::entry_not_found),
			std::string(rel_path));
	if(node->is_directory())
		throw std::system_error(make_error_code(diff_errc::not_a_file),
			std::string(rel_path));
	std::string left = read_side(tree.left_root, node->rel_path, node->left);
	std::string right = read_side(tree.right_root, node->rel_path, node->right);
	file_diff diff = diff_text(left, right);
	diff.rel_path = node->rel_path;
	trace_debug("diff:", node->rel_path, diff.hunks.size(), "hunks");
	return diff;
}

bool content_token::operator ==(const content_token& other) const {
	auto same = [] (const auto& x, const auto& y) {
		return x.has_value() == y.has_value() && (!x || *x == *y);
	};
	return same(left, other.left) && same(right, other.right);
}

static unsigned pool_size(unsigned threads) {
	if(threads == 0)
		threads = std::thread::hardware_concurrency();
	return std::max(1u, threads);
}

diff_session::diff_session(compare_options opts)
	: opts(std::move(opts))
	, workers(pool_size(this->opts.threads))
{
	hunks.token = [this] (const std::string& rel_path) {
		return token_of(rel_path);
	};
	hunks.func = [this] (const std::string& rel_path) {
		auto tree = this->tree();
		if(!tree)
			throw std::system_error(make_error_code(diff_errc::entry_not_found), rel_path);
		return std::shared_ptr<const file_diff>(
			std::make_shared<file_diff>(diff_entry(*tree, rel_path)));
	};
}

diff_session::~diff_session() {
	workers.join();
}

std::shared_ptr<const diff_tree> diff_session::refresh(const cancel_token& cancel) {
	auto tree = compare_roots(opts, workers, cancel);
	{
		const std::lock_guard<std::mutex> lock(tree_mutex);
		current = tree;
	}
	hunks.clear();
	return tree;
}

std::shared_ptr<const diff_tree> diff_session::tree() const {
	const std::lock_guard<std::mutex> lock(tree_mutex);
	return current;
}

std::shared_ptr<const file_diff> diff_session::file_hunks(const std::string& rel_path) {
	return hunks(rel_path);
}

content_token diff_session::token_of(const std::string& rel_path) const {
	content_token token;
	auto tree = this->tree();
	if(!tree)
		return token;
	const diff_node* node = tree->find(rel_path);
	if(node == nullptr)
		return token;
	if(node->left)
		token.left = stat_entry(entry_path(tree->left_root, rel_path), rel_path).entry.mtime;
	if(node->right)
		token.right = stat_entry(entry_path(tree->right_root, rel_path), rel_path).entry.mtime;
	return token;
}
