#include "errors.hpp"

namespace {

struct diff_error_category : public std::error_category {
	const char* name() const noexcept override {
		return "tdiff";
	}

	std::string message(int value) const override {
		switch(static_cast<diff_errc>(value)) {
			case diff_errc::root_not_found:  return "root path does not exist";
			case diff_errc::root_unreadable: return "root path cannot be read";
			case diff_errc::entry_not_found: return "no such entry in the comparison";
			case diff_errc::not_a_file:      return "entry is not a file on both sides";
			case diff_errc::binary_content:  return "binary content cannot be diffed by line";
			case diff_errc::cancelled:       return "comparison cancelled";
		}
		return "unknown error";
	}
};

}

const std::error_category& diff_category() {
	static const diff_error_category category;
	return category;
}

std::error_code make_error_code(diff_errc errc) {
	return { static_cast<int>(errc), diff_category() };
}

const char* errc_name(diff_errc errc) {
	switch(errc) {
		case diff_errc::root_not_found:  return "root_not_found";
		case diff_errc::root_unreadable: return "root_unreadable";
		case diff_errc::entry_not_found: return "entry_not_found";
		case diff_errc::not_a_file:      return "not_a_file";
		case diff_errc::binary_content:  return "binary_content";
		case diff_errc::cancelled:       return "cancelled";
	}
	return "unknown";
}
