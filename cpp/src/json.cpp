#include "json.hpp"
#include "errors.hpp"
#include "linediff.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

#include <boost/json/src.hpp>

namespace json = boost::json;

static std::string hex(std::size_t value) {
	std::ostringstream out;
	out << std::hex << std::setw(16) << std::setfill('0') << value;
	return out.str();
}

static std::int64_t epoch_millis(std::chrono::system_clock::time_point time) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(
		time.time_since_epoch()).count();
}

json::value to_json(const fs_entry& entry) {
	json::value print = nullptr;
	if(entry.print)
		print = json::object
			{ { "head", hex(entry.print->head) }
			, { "whole", hex(entry.print->whole) }
			};
	return json::object
		{ { "path", entry.rel_path }
		, { "kind", kind_name(entry.kind) }
		, { "size", entry.size }
		, { "mtime", json::object
			{ { "sec", static_cast<std::int64_t>(entry.mtime.tv_sec) }
			, { "nsec", static_cast<std::int64_t>(entry.mtime.tv_nsec) }
			} }
		, { "fingerprint", print }
		, { "encoding", encoding_name(entry.encoding) }
		, { "error", entry.readable() ? json::value(nullptr) : json::value(error_name(entry.error)) }
		, { "error_detail", entry.error_detail }
		, { "symlink", entry.symlink }
		};
}

json::value to_json(const diff_node& node, bool with_children) {
	json::object out
		{ { "path", node.rel_path }
		, { "name", node.name }
		, { "status", status_name(node.status) }
		, { "reason", node.reason == conflict_reason::none
			? json::value(nullptr) : json::value(reason_name(node.reason)) }
		, { "is_directory", node.is_directory() }
		, { "left", node.left ? to_json(*node.left) : json::value(nullptr) }
		, { "right", node.right ? to_json(*node.right) : json::value(nullptr) }
		};
	if(with_children) {
		json::array children;
		children.reserve(node.children.size());
		for(const auto& child : node.children)
			children.push_back(to_json(child));
		out["children"] = std::move(children);
	}
	return out;
}

json::value to_json(const diff_summary& summary) {
	return json::object
		{ { "files", summary.files }
		, { "directories", summary.directories }
		, { "added", summary.added }
		, { "removed", summary.removed }
		, { "modified", summary.modified }
		, { "unchanged", summary.unchanged }
		, { "conflicted", summary.conflicted }
		, { "errors", summary.errors }
		};
}

json::value to_json(const diff_tree& tree) {
	return json::object
		{ { "left_root", tree.left_root.string() }
		, { "right_root", tree.right_root.string() }
		, { "left_scanned", epoch_millis(tree.left_scanned) }
		, { "right_scanned", epoch_millis(tree.right_scanned) }
		, { "summary", to_json(tree.summary()) }
		, { "root", to_json(tree.root) }
		};
}

static json::value range_json(const std::optional<line_range>& range) {
	if(!range)
		return nullptr;
	return json::object { { "first", range->first }, { "last", range->last } };
}

static json::array lines_json(
	const std::vector<std::string>& lines,
	const std::optional<line_range>& range
) {
	json::array out;
	if(!range)
		return out;
	for(std::size_t line = range->first; line <= range->last; ++line)
		out.emplace_back(line_text(lines.at(line - 1)));
	return out;
}

static bool newline_at_eof(const std::vector<std::string>& lines) {
	return lines.empty() || has_newline(lines.back());
}

json::value to_json(const file_diff& diff) {
	json::array hunks;
	hunks.reserve(diff.hunks.size());
	for(const auto& hunk : diff.hunks)
		hunks.push_back(json::object
			{ { "op", op_name(hunk.op) }
			, { "left", range_json(hunk.left) }
			, { "right", range_json(hunk.right) }
			, { "left_lines", lines_json(diff.left_lines, hunk.left) }
			, { "right_lines", lines_json(diff.right_lines, hunk.right) }
			});
	return json::object
		{ { "path", diff.rel_path }
		, { "hunks", std::move(hunks) }
		, { "left_newline_at_eof", newline_at_eof(diff.left_lines) }
		, { "right_newline_at_eof", newline_at_eof(diff.right_lines) }
		};
}

json::value api_response(json::value data) {
	return json::object
		{ { "success", true }
		, { "data", std::move(data) }
		, { "error", nullptr }
		};
}

json::value api_error(const std::system_error& err) {
	std::string code = "io_error";
	if(err.code().category() == diff_category())
		code = errc_name(static_cast<diff_errc>(err.code().value()));
	return json::object
		{ { "success", false }
		, { "data", nullptr }
		, { "error", err.what() }
		, { "code", code }
		};
}
