#pragma once

#include "cancel.hpp"
#include "diff.hpp"
#include "scan.hpp"

#include <filesystem>

#include <boost/asio/thread_pool.hpp>

struct classification {
	diff_status status;
	conflict_reason reason;
};

// Classify a file present on both sides. Fingerprints and encodings are
// computed on the entries as needed; read failures are recorded on them.
classification diff_file(
	fs_entry& left, const std::filesystem::path& left_path,
	fs_entry& right, const std::filesystem::path& right_path,
	fingerprint_policy policy
);

// Merge two scans into one tree. Both scans must be complete.
diff_tree match_scans(
	const scan_result& left,
	const scan_result& right,
	fingerprint_policy policy,
	boost::asio::thread_pool& pool,
	const cancel_token& cancel
);
