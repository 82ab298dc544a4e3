#include "scan.hpp"
#include "pool.hpp"
#include "trace.hpp"

#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

fs::path entry_path(const fs::path& root, const std::string& rel_path) {
	if(rel_path.empty())
		return root;
	return root / rel_path;
}

namespace {

struct walker {
	const scan_options& opts;
	const cancel_token& cancel;
	ignore_rules rules;
	std::vector<file_id> ancestors = {};
	scan_map entries = {};

	void walk(const fs::path& dir, const std::string& rel_dir);
	void visit(const fs::path& path, const std::string& rel_dir);
};

void walker::walk(const fs::path& dir, const std::string& rel_dir) {
	const std::size_t inherited = rules.size();
	if(opts.vcs_ignore)
		rules.add_file(dir / ".gitignore", rel_dir);
	std::error_code ec;
	for(auto it = fs::directory_iterator(dir, ec);
		!ec && it != fs::directory_iterator();
		it.increment(ec)
	) visit(it->path(), rel_dir);
	if(ec) {
		auto& entry = entries.at(rel_dir);
		entry.error = entry_error_of(ec.value());
		entry.error_detail = ec.message();
		trace("scan: cannot list", dir, ec.message());
	}
	rules.truncate(inherited);
}

void walker::visit(const fs::path& path, const std::string& rel_dir) {
	cancel.check();
	std::string name = path.filename().string();
	if(opts.vcs_ignore && name == ".git")
		return;
	std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;
	auto [entry, id] = stat_entry(path, rel);
	if(rules.ignored(rel, entry.is_directory())) {
		trace_debug("scan: ignored", rel);
		return;
	}
	bool descend = entry.is_directory() && entry.readable() && id.has_value();
	if(descend && std::find(ancestors.begin(), ancestors.end(), *id) != ancestors.end()) {
		entry.error = entry_error::symlink_loop;
		entry.error_detail = "directory is its own ancestor";
		descend = false;
	}
	if(!entry.readable())
		trace_debug("scan:", rel, entry.error, entry.error_detail);
	entries.emplace(rel, std::move(entry));
	if(descend) {
		ancestors.push_back(*id);
		walk(path, rel);
		ancestors.pop_back();
	}
}

}

scan_result scan_root(
	const fs::path& root,
	const scan_options& opts,
	boost::asio::thread_pool& pool,
	const cancel_token& cancel
) {
	auto start = std::chrono::steady_clock::now();
	auto [root_entry, root_id] = stat_entry(root, "");
	switch(root_entry.error) {
		case entry_error::none:
			break;
		case entry_error::vanished:
		case entry_error::broken_symlink:
			throw std::system_error(make_error_code(diff_errc::root_not_found), root.string());
		default:
			throw std::system_error(make_error_code(diff_errc::root_unreadable),
				root.string() + ": " + root_entry.error_detail);
	}

	walker w { .opts = opts, .cancel = cancel, .rules = opts.rules };
	bool is_directory = root_entry.is_directory();
	w.entries.emplace("", std::move(root_entry));
	if(is_directory) {
		std::error_code ec;
		fs::directory_iterator listing(root, ec);
		if(ec)
			throw std::system_error(make_error_code(diff_errc::root_unreadable),
				root.string() + ": " + ec.message());
		if(opts.vcs_ignore)
			w.rules.add_file(root / ".git" / "info" / "exclude");
		if(root_id)
			w.ancestors.push_back(*root_id);
		w.walk(root, "");
	}

	if(opts.policy == fingerprint_policy::always) {
		std::vector<std::future<void>> pending;
		for(auto& [rel, entry] : w.entries) {
			if(entry.is_directory() || !entry.readable())
				continue;
			pending.push_back(submit(pool,
				[&entry = entry, path = entry_path(root, rel), &cancel] () {
					if(cancel.cancelled())
						return;
					try {
						auto digest = digest_file(path);
						entry.print = digest.print;
						entry.encoding = digest.encoding;
					} catch(const std::system_error& err) {
						record_error(entry, err);
					}
				}));
		}
		wait_all(pending);
		cancel.check();
	}

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start);
	trace("scan:", root, w.entries.size(), "entries in", elapsed.count(), "ms");
	return scan_result
		{ .root = root
		, .entries = std::move(w.entries)
		, .scanned = std::chrono::system_clock::now()
		};
}
