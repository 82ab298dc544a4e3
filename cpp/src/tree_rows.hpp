#pragma once

#include "diff.hpp"
#include "session.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

struct tree_row {
	const diff_node* node;
	int depth;
};

// true if the node or anything below it is not unchanged or carries an error
bool has_changes(const diff_node& node);

// Rows shown for a tree: the root's children (or a file root itself),
// descending into expanded directories. Rows point into the tree.
std::vector<tree_row> flatten_rows(
	const diff_node& root,
	const std::set<std::string>& expanded,
	bool hide_unchanged);

// index of the row for rel_path, or 0 if it is not shown
int find_row(const std::vector<tree_row>& rows, const std::string& rel_path);

struct file_view {
	std::shared_ptr<const file_diff> diff;
	std::string message;
};

// Hunks for the diff pane. Any failure becomes the message shown instead.
file_view load_file_view(diff_session& session, const std::string& rel_path);
