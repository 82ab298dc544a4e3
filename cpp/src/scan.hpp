#pragma once

#include "cancel.hpp"
#include "fileio.hpp"
#include "ignore.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

#include <boost/asio/thread_pool.hpp>

struct scan_options {
	ignore_rules rules = {};
	bool vcs_ignore = true; // read .gitignore files and .git/info/exclude
	fingerprint_policy policy = fingerprint_policy::fast;
};

// keyed by root-relative, slash separated path; the root itself is ""
typedef std::map<std::string, fs_entry> scan_map;

struct scan_result {
	std::filesystem::path root;
	scan_map entries;
	std::chrono::system_clock::time_point scanned;
};

std::filesystem::path entry_path(const std::filesystem::path& root, const std::string& rel_path);

// Throws std::system_error with diff_errc::root_not_found or
// diff_errc::root_unreadable. Symlinks are followed.
scan_result scan_root(
	const std::filesystem::path& root,
	const scan_options& opts,
	boost::asio::thread_pool& pool,
	const cancel_token& cancel
);
