#pragma once

#include <filesystem>
#include <string>

std::string shell_quote(const std::string& str);

// Run `editor LEFT RIGHT` through bash, attached to the terminal.
// Returns the exit status.
int run_editor(
	const std::string& editor,
	const std::filesystem::path& left,
	const std::filesystem::path& right);

// Launch $BROWSER, or xdg-open, on the url without waiting for it.
// Returns false if neither could be started.
bool open_browser(const std::string& url);
