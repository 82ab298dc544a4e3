#include "match.hpp"
#include "pool.hpp"
#include "trace.hpp"

#include <algorithm>
#include <map>
#include <vector>

namespace fs = std::filesystem;

static bool ensure_digest(fs_entry& entry, const fs::path& path) {
	if(entry.print)
		return true;
	try {
		auto digest = digest_file(path);
		entry.print = digest.print;
		entry.encoding = digest.encoding;
		return true;
	} catch(const std::system_error& err) {
		record_error(entry, err);
		return false;
	}
}

static bool ensure_encoding(fs_entry& entry, const fs::path& path) {
	if(entry.encoding != content_encoding::unknown)
		return true;
	try {
		entry.encoding = probe_file(path);
		return true;
	} catch(const std::system_error& err) {
		record_error(entry, err);
		return false;
	}
}

classification diff_file(
	fs_entry& left, const fs::path& left_path,
	fs_entry& right, const fs::path& right_path,
	fingerprint_policy policy
) {
	constexpr classification unreadable
		{ diff_status::conflicted, conflict_reason::entry_unreadable };
	if(!left.readable() || !right.readable())
		return unreadable;
	if(policy == fingerprint_policy::fast
		&& left.size == right.size && left.mtime == right.mtime)
		return { diff_status::unchanged, conflict_reason::none };
	if(left.size == right.size) {
		bool left_ok = ensure_digest(left, left_path);
		bool right_ok = ensure_digest(right, right_path);
		if(!left_ok || !right_ok)
			return unreadable;
		if(*left.print == *right.print)
			return { diff_status::unchanged, conflict_reason::none };
	}
	bool left_ok = ensure_encoding(left, left_path);
	bool right_ok = ensure_encoding(right, right_path);
	if(!left_ok || !right_ok)
		return unreadable;
	if(left.encoding != right.encoding)
		return { diff_status::conflicted, conflict_reason::decode_inconsistent };
	return { diff_status::modified, conflict_reason::none };
}

static std::string parent_of(const std::string& rel_path) {
	auto slash = rel_path.rfind('/');
	return slash == std::string::npos ? std::string() : rel_path.substr(0, slash);
}

static std::string name_of(const std::string& rel_path) {
	auto slash = rel_path.rfind('/');
	return slash == std::string::npos ? rel_path : rel_path.substr(slash + 1);
}

namespace {

struct tree_builder {
	std::map<std::string, diff_node> nodes;
	std::map<std::string, std::vector<std::string>> children_of = {};

	diff_node build(const std::string& rel_path) {
		diff_node node = std::move(nodes.at(rel_path));
		auto children = children_of.find(rel_path);
		if(children != children_of.end()) {
			node.children.reserve(children->second.size());
			for(const auto& child : children->second)
				node.children.push_back(build(child));
		}
		std::sort(node.children.begin(), node.children.end(),
			[] (const diff_node& x, const diff_node& y) { return x.name < y.name; });
		return node;
	}
};

}

diff_tree match_scans(
	const scan_result& left,
	const scan_result& right,
	fingerprint_policy policy,
	boost::asio::thread_pool& pool,
	const cancel_token& cancel
) {
	tree_builder builder;
	auto node_at = [&] (const std::string& rel) -> diff_node& {
		auto [it, inserted] = builder.nodes.try_emplace(rel);
		if(inserted) {
			it->second.rel_path = rel;
			it->second.name = name_of(rel);
			it->second.status = diff_status::unchanged;
			it->second.reason = conflict_reason::none;
		}
		return it->second;
	};
	for(const auto& [rel, entry] : left.entries)
		node_at(rel).left = entry;
	for(const auto& [rel, entry] : right.entries)
		node_at(rel).right = entry;

	std::vector<diff_node*> file_pairs;
	for(auto& [rel, node] : builder.nodes) {
		if(!rel.empty())
			builder.children_of[parent_of(rel)].push_back(rel);
		if(!node.left)
			node.status = diff_status::added;
		else if(!node.right)
			node.status = diff_status::removed;
		else if(node.left->kind != node.right->kind) {
			node.status = diff_status::conflicted;
			node.reason = conflict_reason::kind_mismatch;
		} else if(node.left->is_directory()) {
			if(!node.left->readable() || !node.right->readable()) {
				node.status = diff_status::conflicted;
				node.reason = conflict_reason::entry_unreadable;
			}
		} else
			file_pairs.push_back(&node);
	}

	std::vector<std::future<void>> pending;
	pending.reserve(file_pairs.size());
	for(auto* node : file_pairs)
		pending.push_back(submit(pool, [node, &left, &right, policy, &cancel] () {
			if(cancel.cancelled())
				return;
			auto result = diff_file(
				*node->left, entry_path(left.root, node->rel_path),
				*node->right, entry_path(right.root, node->rel_path),
				policy);
			node->status = result.status;
			node->reason = result.reason;
		}));
	wait_all(pending);
	cancel.check();
	trace_debug("match:", builder.nodes.size(), "paths,", file_pairs.size(), "file pairs compared");

	return diff_tree
		{ .left_root = left.root
		, .right_root = right.root
		, .left_scanned = left.scanned
		, .right_scanned = right.scanned
		, .root = builder.build("")
		};
}
