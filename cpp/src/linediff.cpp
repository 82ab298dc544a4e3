#include "linediff.hpp"
#include "errors.hpp"
#include "fileio.hpp"

#include <unordered_map>

std::vector<std::string> split_lines(std::string_view text) {
	std::vector<std::string> lines;
	std::size_t start = 0;
	while(start < text.size()) {
		auto end = text.find('\n', start);
		if(end == std::string_view::npos) {
			lines.emplace_back(text.substr(start));
			break;
		}
		lines.emplace_back(text.substr(start, end + 1 - start));
		start = end + 1;
	}
	return lines;
}

std::string_view line_text(std::string_view line) {
	if(line.ends_with('\n'))
		line.remove_suffix(1);
	if(line.ends_with('\r'))
		line.remove_suffix(1);
	return line;
}

bool has_newline(std::string_view line) {
	return line.ends_with('\n');
}

namespace {

// Marks the lines outside a longest common subsequence, after Myers'
// "An O(ND) Difference Algorithm", with the middle snake found by
// bisection so memory stays linear.
struct myers {
	const std::vector<std::size_t>& a;
	const std::vector<std::size_t>& b;
	std::vector<bool> left_changed;
	std::vector<bool> right_changed;
	std::vector<long> v1 = {};
	std::vector<long> v2 = {};

	void compare(long left, long top, long right, long bottom);
	bool bisect(long left, long top, long right, long bottom, long& split_x, long& split_y);
};

void myers::compare(long left, long top, long right, long bottom) {
	while(left < right && top < bottom && a[left] == b[top])
		++left, ++top;
	while(left < right && top < bottom && a[right - 1] == b[bottom - 1])
		--right, --bottom;
	if(left == right) {
		for(long y = top; y < bottom; ++y)
			right_changed[y] = true;
		return;
	}
	if(top == bottom) {
		for(long x = left; x < right; ++x)
			left_changed[x] = true;
		return;
	}
	long x, y;
	if(!bisect(left, top, right, bottom, x, y)) {
		for(long i = left; i < right; ++i)
			left_changed[i] = true;
		for(long i = top; i < bottom; ++i)
			right_changed[i] = true;
		return;
	}
	compare(left, top, left + x, top + y);
	compare(left + x, top + y, right, bottom);
}

// Coordinates inside the box are relative to (left, top); the reverse
// search counts from (right, bottom).
bool myers::bisect(long left, long top, long right, long bottom, long& split_x, long& split_y) {
	const long width = right - left;
	const long height = bottom - top;
	const long max_d = (width + height + 1) / 2;
	const long offset = max_d;
	const long length = 2 * max_d + 2;
	v1.assign(length, -1);
	v2.assign(length, -1);
	v1[offset + 1] = 0;
	v2[offset + 1] = 0;
	const long delta = width - height;
	const bool front = delta % 2 != 0;
	long k1start = 0, k1end = 0, k2start = 0, k2end = 0;
	for(long d = 0; d < max_d; ++d) {
		for(long k1 = -d + k1start; k1 <= d - k1end; k1 += 2) {
			const long k1_offset = offset + k1;
			long x1;
			if(k1 == -d || (k1 != d && v1[k1_offset - 1] < v1[k1_offset + 1]))
				x1 = v1[k1_offset + 1];
			else
				x1 = v1[k1_offset - 1] + 1;
			long y1 = x1 - k1;
			while(x1 < width && y1 < height && a[left + x1] == b[top + y1])
				++x1, ++y1;
			v1[k1_offset] = x1;
			if(x1 > width)
				k1end += 2;
			else if(y1 > height)
				k1start += 2;
			else if(front) {
				const long k2_offset = offset + delta - k1;
				if(k2_offset >= 0 && k2_offset < length && v2[k2_offset] != -1) {
					if(x1 >= width - v2[k2_offset]) {
						split_x = x1;
						split_y = y1;
						return true;
					}
				}
			}
		}
		for(long k2 = -d + k2start; k2 <= d - k2end; k2 += 2) {
			const long k2_offset = offset + k2;
			long x2;
			if(k2 == -d || (k2 != d && v2[k2_offset - 1] < v2[k2_offset + 1]))
				x2 = v2[k2_offset + 1];
			else
				x2 = v2[k2_offset - 1] + 1;
			long y2 = x2 - k2;
			while(x2 < width && y2 < height
				&& a[right - x2 - 1] == b[bottom - y2 - 1])
				++x2, ++y2;
			v2[k2_offset] = x2;
			if(x2 > width)
				k2end += 2;
			else if(y2 > height)
				k2start += 2;
			else if(!front) {
				const long k1_offset = offset + delta - k2;
				if(k1_offset >= 0 && k1_offset < length && v1[k1_offset] != -1) {
					const long x1 = v1[k1_offset];
					const long y1 = offset + x1 - k1_offset;
					if(x1 <= width && y1 <= height && x1 >= width - x2) {
						split_x = x1;
						split_y = y1;
						return true;
					}
				}
			}
		}
	}
	return false;
}

std::vector<std::size_t> intern(
	const std::vector<std::string>& lines,
	std::unordered_map<std::string_view, std::size_t>& ids
) {
	std::vector<std::size_t> out;
	out.reserve(lines.size());
	for(const auto& line : lines)
		out.push_back(ids.try_emplace(line, ids.size()).first->second);
	return out;
}

}

std::vector<diff_hunk> diff_lines(
	const std::vector<std::string>& left,
	const std::vector<std::string>& right
) {
	std::unordered_map<std::string_view, std::size_t> ids;
	const auto a = intern(left, ids);
	const auto b = intern(right, ids);
	const long n = static_cast<long>(a.size());
	const long m = static_cast<long>(b.size());

	myers engine
		{ .a = a
		, .b = b
		, .left_changed = std::vector<bool>(n, false)
		, .right_changed = std::vector<bool>(m, false)
		};
	engine.compare(0, 0, n, m);
	const auto& lc = engine.left_changed;
	const auto& rc = engine.right_changed;

	std::vector<diff_hunk> hunks;
	long i = 0, j = 0;
	while(i < n || j < m) {
		const long si = i, sj = j;
		if(i < n && j < m && !lc[i] && !rc[j]) {
			while(i < n && j < m && !lc[i] && !rc[j])
				++i, ++j;
			hunks.push_back(diff_hunk
				{ .op = hunk_op::equal
				, .left = line_range{ std::size_t(si + 1), std::size_t(i) }
				, .right = line_range{ std::size_t(sj + 1), std::size_t(j) }
				});
			continue;
		}
		while((i < n && lc[i]) || (j < m && rc[j])) {
			while(i < n && lc[i]) ++i;
			while(j < m && rc[j]) ++j;
		}
		if(i == si && j == sj)
			throw std::logic_error("diff_lines: unaligned common subsequence");
		diff_hunk hunk { .op = hunk_op::replace, .left = std::nullopt, .right = std::nullopt };
		if(i > si)
			hunk.left = line_range{ std::size_t(si + 1), std::size_t(i) };
		if(j > sj)
			hunk.right = line_range{ std::size_t(sj + 1), std::size_t(j) };
		if(!hunk.left)
			hunk.op = hunk_op::insert;
		else if(!hunk.right)
			hunk.op = hunk_op::remove;
		hunks.push_back(hunk);
	}
	return hunks;
}

file_diff diff_text(std::string_view left, std::string_view right) {
	if(probe_content(left) == content_encoding::binary
		|| probe_content(right) == content_encoding::binary)
		throw std::system_error(make_error_code(diff_errc::binary_content));
	file_diff diff
		{ .rel_path = ""
		, .left_lines = split_lines(left)
		, .right_lines = split_lines(right)
		, .hunks = {}
		};
	diff.hunks = diff_lines(diff.left_lines, diff.right_lines);
	return diff;
}

std::string reconstruct(const file_diff& diff, diff_side side) {
	const auto& lines = side == diff_side::left ? diff.left_lines : diff.right_lines;
	std::string out;
	for(const auto& hunk : diff.hunks) {
		const auto& range = side == diff_side::left ? hunk.left : hunk.right;
		if(!range)
			continue;
		for(std::size_t line = range->first; line <= range->last; ++line)
			out += lines.at(line - 1);
	}
	return out;
}
