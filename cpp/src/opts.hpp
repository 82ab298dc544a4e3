#pragma once

#include "fileio.hpp"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

struct app_options {
	std::filesystem::path left;
	std::filesystem::path right;
	std::string editor;
	unsigned threads = 0;
	std::vector<std::string> excludes = {};
	bool vcs_ignore = true;
	fingerprint_policy policy = fingerprint_policy::fast;
	bool web = false;
	unsigned short port = 3000;
	bool open = false;
	bool verbose = false;
	std::filesystem::path log = "";
};

// Either the exit status for --help and usage errors, or the options.
std::variant<int,app_options> get_opts(int argc, const char* argv[]);
