#include "diff.hpp"

#include <algorithm>

const char* status_name(diff_status status) {
	switch(status) {
		case diff_status::added:      return "added";
		case diff_status::removed:    return "removed";
		case diff_status::modified:   return "modified";
		case diff_status::unchanged:  return "unchanged";
		case diff_status::conflicted: return "conflicted";
	}
	return "unknown";
}

const char* reason_name(conflict_reason reason) {
	switch(reason) {
		case conflict_reason::none:                return "none";
		case conflict_reason::kind_mismatch:       return "kind_mismatch";
		case conflict_reason::decode_inconsistent: return "decode_inconsistent";
		case conflict_reason::entry_unreadable:    return "entry_unreadable";
	}
	return "unknown";
}

const char* op_name(hunk_op op) {
	switch(op) {
		case hunk_op::equal:   return "equal";
		case hunk_op::insert:  return "insert";
		case hunk_op::remove:  return "delete";
		case hunk_op::replace: return "replace";
	}
	return "unknown";
}

std::ostream& operator <<(std::ostream& out, diff_status status) {
	return out << status_name(status);
}

std::ostream& operator <<(std::ostream& out, conflict_reason reason) {
	return out << reason_name(reason);
}

std::ostream& operator <<(std::ostream& out, hunk_op op) {
	return out << op_name(op);
}

bool diff_node::is_directory() const {
	return (left && left->is_directory()) || (right && right->is_directory());
}

bool diff_node::has_error() const {
	return (left && !left->readable()) || (right && !right->readable());
}

const diff_node* diff_tree::find(std::string_view rel_path) const {
	const diff_node* node = &root;
	while(!rel_path.empty()) {
		auto slash = rel_path.find('/');
		auto name = rel_path.substr(0, slash);
		rel_path = slash == std::string_view::npos
			? std::string_view() : rel_path.substr(slash + 1);
		auto child = std::lower_bound(node->children.begin(), node->children.end(), name,
			[] (const diff_node& child, std::string_view name) { return child.name < name; });
		if(child == node->children.end() || child->name != name)
			return nullptr;
		node = &*child;
	}
	return node;
}

static void count(const diff_node& node, diff_summary& summary) {
	if(node.is_directory())
		++summary.directories;
	else
		++summary.files;
	switch(node.status) {
		case diff_status::added:      ++summary.added;      break;
		case diff_status::removed:    ++summary.removed;    break;
		case diff_status::modified:   ++summary.modified;   break;
		case diff_status::unchanged:  ++summary.unchanged;  break;
		case diff_status::conflicted: ++summary.conflicted; break;
	}
	if(node.has_error())
		++summary.errors;
	for(const auto& child : node.children)
		count(child, summary);
}

diff_summary diff_tree::summary() const {
	diff_summary summary;
	if(root.is_directory())
		for(const auto& child : root.children)
			count(child, summary);
	else
		count(root, summary);
	return summary;
}
