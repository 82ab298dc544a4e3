#pragma once

#include "diff.hpp"

#include <string>
#include <string_view>
#include <vector>

enum struct diff_side {
	left,
	right,
};

// Split on '\n'. Every line keeps its terminator; a final line without
// one stays distinct from the same text followed by a newline.
std::vector<std::string> split_lines(std::string_view text);

// line content without "\n" or "\r\n"
std::string_view line_text(std::string_view line);

bool has_newline(std::string_view line);

// Minimal edit script between two line sequences (Myers, linear space).
// Change runs between equal runs become one delete, insert or replace hunk.
std::vector<diff_hunk> diff_lines(
	const std::vector<std::string>& left,
	const std::vector<std::string>& right
);

// Throws std::system_error with diff_errc::binary_content when either
// side does not probe as text.
file_diff diff_text(std::string_view left, std::string_view right);

// Rebuild one input from the lines its hunks cover.
std::string reconstruct(const file_diff& diff, diff_side side);
