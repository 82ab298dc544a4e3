#include "shell.hpp"
#include "trace.hpp"

#include <cstdlib>
#include <regex>

#include <boost/process.hpp>

namespace proc = boost::process;

std::string shell_quote(const std::string& str) {
	if(str.size() == 0) return "''";
	if(!std::regex_search(str, std::regex("[^\\w@%+=:,./-]"))) return str;
	return "'" + std::regex_replace(str, std::regex("'"), "'\"'\"'") + "'";
}

int run_editor(
	const std::string& editor,
	const std::filesystem::path& left,
	const std::filesystem::path& right
) {
	std::string call = editor
		+ " " + shell_quote(left.string())
		+ " " + shell_quote(right.string());
	trace("editor:", call);
	return proc::system(proc::search_path("bash"), "-c", call,
		proc::std_out > stdout, proc::std_err > stderr, proc::std_in < stdin);
}

bool open_browser(const std::string& url) {
	const char* browser = std::getenv("BROWSER");
	try {
		proc::child child;
		if(browser != NULL && *browser != '\0')
			child = proc::child(proc::search_path("sh"), "-c",
				std::string(browser) + " " + shell_quote(url),
				proc::std_out > proc::null, proc::std_err > proc::null);
		else {
			auto opener = proc::search_path("xdg-open");
			if(opener.empty()) {
				trace("browser: xdg-open not found");
				return false;
			}
			child = proc::child(opener, url,
				proc::std_out > proc::null, proc::std_err > proc::null);
		}
		child.detach();
		return true;
	} catch(const proc::process_error& err) {
		trace("browser:", err.what());
		return false;
	}
}
