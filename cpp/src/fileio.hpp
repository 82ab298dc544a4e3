#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <sys/stat.h>

enum struct entry_kind {
	file,
	directory,
};

// Why an entry could not be fully read. Recorded on the entry, never thrown.
enum struct entry_error {
	none,
	permission_denied,
	broken_symlink,
	symlink_loop,
	vanished,
	unsupported_type,
	io_error,
};

enum struct content_encoding {
	unknown,
	text,
	binary,
};

enum struct fingerprint_policy {
	fast,   // trust equal size + mtime, hash only on demand
	always, // hash every file during the scan
};

struct fingerprint {
	size_t head;
	size_t whole;

	bool operator ==(const fingerprint& other) const = default;
};

struct fs_entry {
	std::string rel_path;
	entry_kind kind;
	std::uintmax_t size;
	struct timespec mtime;
	std::optional<fingerprint> print;
	content_encoding encoding;
	entry_error error;
	std::string error_detail;
	bool symlink;

	bool is_directory() const { return kind == entry_kind::directory; }
	bool readable() const { return error == entry_error::none; }
};

struct file_id {
	dev_t dev;
	ino_t ino;

	bool operator ==(const file_id& other) const = default;
};

struct stat_result {
	fs_entry entry;
	std::optional<file_id> id;
};

// size of the block hashed into fingerprint::head and inspected by the text probe
constexpr std::size_t probe_size = 8192;

std::ostream& operator <<(std::ostream& output, entry_kind kind);
std::ostream& operator <<(std::ostream& output, entry_error error);
std::ostream& operator <<(std::ostream& output, content_encoding encoding);
std::ostream& operator <<(std::ostream& output, fingerprint_policy policy);
std::istream& operator >>(std::istream& input, fingerprint_policy& policy);

const char* kind_name(entry_kind kind);
const char* error_name(entry_error error);
const char* encoding_name(content_encoding encoding);

bool operator ==(const struct timespec& x, const struct timespec& y);

// Target of a symlink, relative targets joined to the link's directory;
// empty if it cannot be read.
std::filesystem::path resolve_symlink(const std::filesystem::path& path);

entry_error entry_error_of(int err);

// Stat a path, following symlinks. Failures land in entry.error.
stat_result stat_entry(const std::filesystem::path& path, std::string rel_path);

// Classify the leading bytes of a file as text or binary.
// `truncated` means more content follows the sample.
content_encoding probe_encoding(std::string_view sample, bool truncated);

// Probe only the leading block of a whole buffer.
content_encoding probe_content(std::string_view content);

struct content_digest {
	struct fingerprint print;
	content_encoding encoding;
};

// The following throw std::system_error on open or read failures.
content_digest digest_file(const std::filesystem::path& path);
content_encoding probe_file(const std::filesystem::path& path);
std::string read_file(const std::filesystem::path& path);

// Store the outcome of a failed read on the entry.
void record_error(fs_entry& entry, const std::system_error& err);
