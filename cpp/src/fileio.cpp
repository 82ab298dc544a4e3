#include "fileio.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <istream>
#include <sys/stat.h>
#include <unistd.h>

#include <boost/functional/hash.hpp>

namespace fs = std::filesystem;

const char* kind_name(entry_kind kind) {
	switch(kind) {
		case entry_kind::file:      return "file";
		case entry_kind::directory: return "directory";
	}
	return "unknown";
}

const char* error_name(entry_error error) {
	switch(error) {
		case entry_error::none:              return "none";
		case entry_error::permission_denied: return "permission_denied";
		case entry_error::broken_symlink:    return "broken_symlink";
		case entry_error::symlink_loop:      return "symlink_loop";
		case entry_error::vanished:          return "vanished";
		case entry_error::unsupported_type:  return "unsupported_type";
		case entry_error::io_error:          return "io_error";
	}
	return "unknown";
}

const char* encoding_name(content_encoding encoding) {
	switch(encoding) {
		case content_encoding::unknown: return "unknown";
		case content_encoding::text:    return "text";
		case content_encoding::binary:  return "binary";
	}
	return "unknown";
}

std::ostream& operator <<(std::ostream& output, entry_kind kind) {
	return output << kind_name(kind);
}

std::ostream& operator <<(std::ostream& output, entry_error error) {
	return output << error_name(error);
}

std::ostream& operator <<(std::ostream& output, content_encoding encoding) {
	return output << encoding_name(encoding);
}

std::ostream& operator <<(std::ostream& output, fingerprint_policy policy) {
	switch(policy) {
		case fingerprint_policy::fast:   output << "fast";   break;
		case fingerprint_policy::always: output << "always"; break;
	}
	return output;
}

std::istream& operator >>(std::istream& input, fingerprint_policy& policy) {
	std::string word;
	input >> word;
	if(word == "fast")
		policy = fingerprint_policy::fast;
	else if(word == "always")
		policy = fingerprint_policy::always;
	else
		input.setstate(std::ios::failbit);
	return input;
}

bool operator ==(const struct timespec& x, const struct timespec& y) {
	return (x.tv_sec == y.tv_sec) && (x.tv_nsec == y.tv_nsec);
}

fs::path resolve_symlink(const fs::path& path) {
	std::error_code ec;
	auto link = fs::read_symlink(path, ec);
	if(ec)
		return fs::path();
	if(link.is_relative())
		link = path.parent_path() / link;
	return link;
}

entry_error entry_error_of(int err) {
	switch(err) {
		case EACCES:
		case EPERM:   return entry_error::permission_denied;
		case ENOENT:
		case ENOTDIR: return entry_error::vanished;
		case ELOOP:   return entry_error::symlink_loop;
		default:      return entry_error::io_error;
	}
}

static void set_error(fs_entry& entry, entry_error error, int err) {
	entry.error = error;
	entry.error_detail = std::strerror(err);
}

stat_result stat_entry(const fs::path& path, std::string rel_path) {
	stat_result result
		{ .entry =
			{ .rel_path = std::move(rel_path)
			, .kind = entry_kind::file
			, .size = 0
			, .mtime = { 0, 0 }
			, .print = std::nullopt
			, .encoding = content_encoding::unknown
			, .error = entry_error::none
			, .error_detail = ""
			, .symlink = false
			}
		, .id = std::nullopt
		};
	fs_entry& entry = result.entry;
	struct stat fstat;
	if(lstat(path.c_str(), &fstat)) {
		set_error(entry, entry_error_of(errno), errno);
		return result;
	}
	if(S_ISLNK(fstat.st_mode)) {
		entry.symlink = true;
		entry.mtime = fstat.st_mtim;
		if(stat(path.c_str(), &fstat)) {
			int err = errno;
			set_error(entry, err == ELOOP ? entry_error::symlink_loop
				: err == ENOENT || err == ENOTDIR ? entry_error::broken_symlink
				: entry_error_of(err), err);
			if(entry.error == entry_error::broken_symlink)
				entry.error_detail += ": " + resolve_symlink(path).string();
			return result;
		}
	}
	entry.mtime = fstat.st_mtim;
	result.id = file_id{ .dev = fstat.st_dev, .ino = fstat.st_ino };
	switch(fstat.st_mode & S_IFMT) {
		case S_IFREG:
			entry.kind = entry_kind::file;
			entry.size = fstat.st_size;
			break;
		case S_IFDIR:
			entry.kind = entry_kind::directory;
			break;
		default:
			entry.kind = entry_kind::file;
			entry.error = entry_error::unsupported_type;
			entry.error_detail = "not a regular file or directory";
			break;
	}
	return result;
}

// Rejects malformed, overlong and surrogate sequences. Returns the length
// of the sequence at `pos`, 0 if invalid, or -1 if cut off by the end.
static int utf8_sequence(std::string_view bytes, std::size_t pos) {
	auto byte = [&] (std::size_t i) { return static_cast<unsigned char>(bytes[i]); };
	unsigned char lead = byte(pos);
	int length;
	unsigned char low = 0x80, high = 0xbf;
	if(lead < 0x80)
		return 1;
	else if(lead >= 0xc2 && lead <= 0xdf)
		length = 2;
	else if(lead >= 0xe0 && lead <= 0xef) {
		length = 3;
		if(lead == 0xe0) low = 0xa0;
		if(lead == 0xed) high = 0x9f;
	} else if(lead >= 0xf0 && lead <= 0xf4) {
		length = 4;
		if(lead == 0xf0) low = 0x90;
		if(lead == 0xf4) high = 0x8f;
	} else
		return 0;
	for(int i = 1; i < length; ++i) {
		if(pos + i >= bytes.size())
			return -1;
		unsigned char next = byte(pos + i);
		if(i == 1 ? (next < low || next > high) : (next < 0x80 || next > 0xbf))
			return 0;
	}
	return length;
}

static bool is_control(unsigned char c) {
	switch(c) {
		case '\t': case '\n': case '\v': case '\f': case '\r': case '\b':
		case 0x1b:
			return false;
		default:
			return c < 0x20 || c == 0x7f;
	}
}

content_encoding probe_encoding(std::string_view sample, bool truncated) {
	if(sample.empty())
		return content_encoding::text;
	if(sample.find('\0') != std::string_view::npos)
		return content_encoding::binary;
	std::size_t controls = 0;
	for(std::size_t pos = 0; pos < sample.size(); ) {
		int length = utf8_sequence(sample, pos);
		if(length == 0)
			return content_encoding::binary;
		if(length < 0)
			return truncated ? content_encoding::text : content_encoding::binary;
		if(length == 1 && is_control(static_cast<unsigned char>(sample[pos])))
			++controls;
		pos += length;
	}
	// more than 30% control bytes
	if(controls * 10 > sample.size() * 3)
		return content_encoding::binary;
	return content_encoding::text;
}

content_encoding probe_content(std::string_view content) {
	return probe_encoding(content.substr(0, probe_size), content.size() > probe_size);
}

namespace {

struct fd_reader {
	int fd;

	explicit fd_reader(const fs::path& path)
		: fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
		if(fd < 0)
			throw std::system_error(errno, std::generic_category(), path.string());
	}
	fd_reader(const fd_reader&) = delete;
	fd_reader& operator =(const fd_reader&) = delete;
	~fd_reader() { ::close(fd); }

	// fills the buffer unless end of file is reached first
	std::size_t read_block(char* buffer, std::size_t size, const fs::path& path) {
		std::size_t total = 0;
		while(total < size) {
			ssize_t count = ::read(fd, buffer + total, size - total);
			if(count < 0) {
				if(errno == EINTR)
					continue;
				throw std::system_error(errno, std::generic_category(), path.string());
			}
			if(count == 0)
				break;
			total += count;
		}
		return total;
	}
};

}

content_digest digest_file(const fs::path& path) {
	fd_reader file(path);
	char buffer[probe_size];
	std::size_t count = file.read_block(buffer, probe_size, path);
	std::string head(buffer, count);
	content_digest digest
		{ .print =
			{ .head = boost::hash_range(head.begin(), head.end())
			, .whole = 0
			}
		, .encoding = content_encoding::unknown
		};
	boost::hash_combine(digest.print.whole, digest.print.head);
	bool truncated = false;
	while(count == probe_size) {
		count = file.read_block(buffer, probe_size, path);
		if(count == 0)
			break;
		truncated = true;
		boost::hash_combine(digest.print.whole,
			boost::hash_range(buffer, buffer + count));
	}
	digest.encoding = probe_encoding(head, truncated);
	return digest;
}

content_encoding probe_file(const fs::path& path) {
	fd_reader file(path);
	char buffer[probe_size + 1];
	std::size_t count = file.read_block(buffer, probe_size + 1, path);
	bool truncated = count > probe_size;
	return probe_encoding(std::string_view(buffer, std::min(count, probe_size)), truncated);
}

std::string read_file(const fs::path& path) {
	fd_reader file(path);
	std::string content;
	char buffer[probe_size];
	std::size_t count;
	while((count = file.read_block(buffer, probe_size, path)) > 0)
		content.append(buffer, count);
	return content;
}

void record_error(fs_entry& entry, const std::system_error& err) {
	entry.error = err.code().category() == std::generic_category()
		? entry_error_of(err.code().value()) : entry_error::io_error;
	entry.error_detail = err.what();
}
