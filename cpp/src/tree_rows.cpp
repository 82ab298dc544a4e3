#include "tree_rows.hpp"
#include "errors.hpp"
#include "trace.hpp"

#include <algorithm>

bool has_changes(const diff_node& node) {
	if(node.status != diff_status::unchanged || node.has_error())
		return true;
	return std::any_of(node.children.begin(), node.children.end(),
		[] (const diff_node& child) { return has_changes(child); });
}

static void flatten(
	std::vector<tree_row>& rows,
	const diff_node& node,
	int depth,
	const std::set<std::string>& expanded,
	bool hide_unchanged
) {
	if(hide_unchanged && !has_changes(node))
		return;
	rows.push_back({ &node, depth });
	if(node.is_directory() && expanded.count(node.rel_path))
		for(const auto& child : node.children)
			flatten(rows, child, depth + 1, expanded, hide_unchanged);
}

std::vector<tree_row> flatten_rows(
	const diff_node& root,
	const std::set<std::string>& expanded,
	bool hide_unchanged
) {
	std::vector<tree_row> rows;
	if(root.is_directory())
		for(const auto& child : root.children)
			flatten(rows, child, 0, expanded, hide_unchanged);
	else
		flatten(rows, root, 0, expanded, hide_unchanged);
	return rows;
}

int find_row(const std::vector<tree_row>& rows, const std::string& rel_path) {
	for(size_t i = 0; i < rows.size(); ++i)
		if(rows[i].node->rel_path == rel_path)
			return i;
	return 0;
}

file_view load_file_view(diff_session& session, const std::string& rel_path) {
	file_view view;
	try {
		view.diff = session.file_hunks(rel_path);
	} catch(const std::system_error& err) {
		view.message = err.code() == diff_errc::binary_content
			? "binary files differ" : err.what();
		trace_debug("view:", rel_path, err.what());
	} catch(const std::exception& err) {
		view.message = err.what();
		trace("view:", rel_path, err.what());
	}
	return view;
}
