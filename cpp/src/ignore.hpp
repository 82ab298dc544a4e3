#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

struct ignore_rule {
	std::string source;
	std::string base;
	std::regex pattern;
	bool negated;
	bool dir_only;
};

// gitignore-style rules. Later rules override earlier ones.
struct ignore_rules {
	std::vector<ignore_rule> rules = {};

	// Returns false for blank lines and comments. `base` is the
	// root-relative directory the pattern was declared in.
	bool add(std::string_view line, const std::string& base = "");

	// Adds every pattern of an ignore file; a missing file adds nothing.
	std::size_t add_file(const std::filesystem::path& file, const std::string& base = "");

	bool ignored(std::string_view rel_path, bool is_directory) const;

	std::size_t size() const { return rules.size(); }

	// drop rules added after the first `size`
	void truncate(std::size_t size);
};

std::string glob_to_regex(std::string_view glob);
