#pragma once

#include <string>
#include <system_error>

enum struct diff_errc {
	root_not_found = 1,
	root_unreadable,
	entry_not_found,
	not_a_file,
	binary_content,
	cancelled,
};

namespace std {
template<> struct is_error_code_enum<diff_errc> : true_type {};
}

const std::error_category& diff_category();

std::error_code make_error_code(diff_errc errc);

// short machine name, e.g. "binary_content"
const char* errc_name(diff_errc errc);
