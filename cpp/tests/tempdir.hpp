#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

// RAII class for managing temporary directories
class TemporaryDirectory {
public:
	TemporaryDirectory() {
		// unique per process, thread and instance
		static int counter = 0;
		auto pid = getpid();
		auto tid = std::this_thread::get_id();
		auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();

		std::ostringstream oss;
		oss << "tdiff-test-" << pid << "-" << tid << "-" << timestamp << "-" << counter++;
		path_ = fs::temp_directory_path() / oss.str();

		fs::create_directory(path_);
	}

	~TemporaryDirectory() {
		std::error_code ec;
		fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
		fs::remove_all(path_, ec);
	}

	const fs::path& path() const {
		return path_;
	}

	// Write `content` to a path relative to the directory, creating parents.
	fs::path write(const std::string& rel, const std::string& content) const {
		fs::path file = path_ / rel;
		fs::create_directories(file.parent_path());
		std::ofstream out(file, std::ios::binary | std::ios::trunc);
		out << content;
		return file;
	}

	fs::path mkdir(const std::string& rel) const {
		fs::path dir = path_ / rel;
		fs::create_directories(dir);
		return dir;
	}

private:
	fs::path path_;
};
