#pragma once

#include "fileio.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

enum struct diff_status {
	added,
	removed,
	modified,
	unchanged,
	conflicted,
};

enum struct conflict_reason {
	none,
	kind_mismatch,
	decode_inconsistent,
	entry_unreadable,
};

std::ostream& operator <<(std::ostream& out, diff_status status);
std::ostream& operator <<(std::ostream& out, conflict_reason reason);

const char* status_name(diff_status status);
const char* reason_name(conflict_reason reason);

// One node of the merged tree. Added nodes have no left entry, removed
// nodes no right entry, every other status has both.
struct diff_node {
	std::string rel_path;
	std::string name;
	diff_status status;
	conflict_reason reason;
	std::optional<fs_entry> left;
	std::optional<fs_entry> right;
	std::vector<diff_node> children;

	bool is_directory() const;
	bool has_error() const;
};

struct diff_summary {
	std::size_t files = 0;
	std::size_t directories = 0;
	std::size_t added = 0;
	std::size_t removed = 0;
	std::size_t modified = 0;
	std::size_t unchanged = 0;
	std::size_t conflicted = 0;
	std::size_t errors = 0;
};

struct diff_tree {
	std::filesystem::path left_root;
	std::filesystem::path right_root;
	std::chrono::system_clock::time_point left_scanned;
	std::chrono::system_clock::time_point right_scanned;
	diff_node root;

	// nullptr when no node has that path; "" is the root
	const diff_node* find(std::string_view rel_path) const;
	diff_summary summary() const;
};

enum struct hunk_op {
	equal,
	insert,
	remove,
	replace,
};

std::ostream& operator <<(std::ostream& out, hunk_op op);

const char* op_name(hunk_op op);

// 1-based, inclusive
struct line_range {
	std::size_t first;
	std::size_t last;

	std::size_t count() const { return last - first + 1; }
	bool operator ==(const line_range& other) const = default;
};

struct diff_hunk {
	hunk_op op;
	std::optional<line_range> left;
	std::optional<line_range> right;

	bool operator ==(const diff_hunk& other) const = default;
};

// Lines keep their terminators, so joining them restores the input.
struct file_diff {
	std::string rel_path;
	std::vector<std::string> left_lines;
	std::vector<std::string> right_lines;
	std::vector<diff_hunk> hunks;
};
