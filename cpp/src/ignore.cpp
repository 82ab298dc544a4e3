#include "ignore.hpp"
#include "trace.hpp"

#include <fstream>

namespace fs = std::filesystem;

static void append_literal(std::string& out, char c) {
	static const std::string_view special = "\\.^$|()[]{}*+?";
	if(special.find(c) != std::string_view::npos)
		out.push_back('\\');
	out.push_back(c);
}

std::string glob_to_regex(std::string_view glob) {
	std::string out;
	const std::size_t n = glob.size();
	for(std::size_t i = 0; i < n; ) {
		char c = glob[i];
		if(c == '*') {
			bool starts_segment = i == 0 || glob[i - 1] == '/';
			if(i + 1 < n && glob[i + 1] == '*' && starts_segment) {
				if(i + 2 == n) {
					out += ".*";
					i += 2;
					continue;
				}
				if(glob[i + 2] == '/') {
					out += "(?:.*/)?";
					i += 3;
					continue;
				}
			}
			while(i < n && glob[i] == '*') ++i;
			out += "[^/]*";
			continue;
		}
		if(c == '?') {
			out += "[^/]";
			++i;
			continue;
		}
		if(c == '[') {
			std::size_t j = i + 1;
			if(j < n && (glob[j] == '!' || glob[j] == '^')) ++j;
			if(j < n && glob[j] == ']') ++j;
			while(j < n && glob[j] != ']') ++j;
			if(j >= n) {
				append_literal(out, c);
				++i;
				continue;
			}
			out.push_back('[');
			std::size_t k = i + 1;
			if(glob[k] == '!' || glob[k] == '^') {
				out.push_back('^');
				++k;
			}
			for(; k < j; ++k) {
				if(glob[k] == '\\' || glob[k] == '[' || glob[k] == ']')
					out.push_back('\\');
				out.push_back(glob[k]);
			}
			out.push_back(']');
			i = j + 1;
			continue;
		}
		if(c == '\\' && i + 1 < n) {
			append_literal(out, glob[i + 1]);
			i += 2;
			continue;
		}
		append_literal(out, c);
		++i;
	}
	return out;
}

bool ignore_rules::add(std::string_view line, const std::string& base) {
	std::string text(line);
	if(!text.empty() && text.back() == '\r')
		text.pop_back();
	// trailing spaces are dropped unless escaped
	while(!text.empty() && text.back() == ' '
		&& !(text.size() >= 2 && text[text.size() - 2] == '\\'))
		text.pop_back();
	if(text.empty() || text[0] == '#')
		return false;
	ignore_rule rule
		{ .source = text
		, .base = base
		, .pattern = {}
		, .negated = false
		, .dir_only = false
		};
	std::string_view glob = text;
	if(glob[0] == '!') {
		rule.negated = true;
		glob.remove_prefix(1);
	} else if(glob.starts_with("\\!") || glob.starts_with("\\#"))
		glob.remove_prefix(1);
	if(glob.ends_with('/')) {
		rule.dir_only = true;
		glob.remove_suffix(1);
	}
	if(glob.empty())
		return false;
	bool anchored = glob.find('/') != std::string_view::npos;
	if(glob[0] == '/')
		glob.remove_prefix(1);
	std::string regex = glob_to_regex(glob);
	if(!anchored && !regex.starts_with("(?:.*/)?"))
		regex = "(?:.*/)?" + regex;
	try {
		rule.pattern = std::regex(regex, std::regex::ECMAScript | std::regex::optimize);
	} catch(const std::regex_error& err) {
		trace("ignore: skipping bad pattern", text, err.what());
		return false;
	}
	rules.push_back(std::move(rule));
	return true;
}

std::size_t ignore_rules::add_file(const fs::path& file, const std::string& base) {
	std::ifstream input(file);
	if(!input)
		return 0;
	std::size_t added = 0;
	std::string line;
	while(std::getline(input, line))
		if(add(line, base))
			++added;
	trace_debug("ignore: loaded", added, "rules from", file);
	return added;
}

bool ignore_rules::ignored(std::string_view rel_path, bool is_directory) const {
	bool result = false;
	for(const auto& rule : rules) {
		if(rule.dir_only && !is_directory)
			continue;
		std::string_view relative = rel_path;
		if(!rule.base.empty()) {
			if(relative.size() <= rule.base.size()
				|| !relative.starts_with(rule.base)
				|| relative[rule.base.size()] != '/')
				continue;
			relative.remove_prefix(rule.base.size() + 1);
		}
		if(std::regex_match(relative.begin(), relative.end(), rule.pattern))
			result = !rule.negated;
	}
	return result;
}

void ignore_rules::truncate(std::size_t size) {
	if(size < rules.size())
		rules.erase(rules.begin() + size, rules.end());
}
