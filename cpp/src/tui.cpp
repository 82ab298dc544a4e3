#include "tui.hpp"
#include "linediff.hpp"
#include "pool.hpp"
#include "shell.hpp"
#include "trace.hpp"
#include "tree_rows.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <iomanip>
#include <map>
#include <mutex>
#include <numeric>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/node.hpp>
#include <ftxui/component/captured_mouse.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>

using namespace std::chrono_literals;

namespace fs = std::filesystem;

struct app_state {
	diff_session& session;
	const app_options& opts;
	ftxui::ScreenInteractive screen;
	std::shared_ptr<const diff_tree> tree = nullptr;
	std::string summary = "";
	std::set<std::string> expanded = {};
	std::vector<tree_row> rows = {};
	std::vector<std::string> indexes = {};
	int index = 0;
	bool unified = false;
	bool hide_unchanged = false;
	int scroll = 0;
	std::string message = "";
	// written by pool threads
	struct {
		std::mutex mutex;
		std::string path;
		std::shared_ptr<const file_diff> diff;
		std::string message;
	} view;
	std::vector<std::future<void>> tasks = {};
	struct {
		bool help = false;
	} modal;
};

ftxui::Color operator""_rgb216(unsigned long long rgb) {
	return ftxui::Color::Palette256(16
		+ 36*(rgb/100%10) + 6*(rgb/10%10) + rgb%10);
}

static const diff_node* selected(const app_state& st) {
	if(st.index < 0 || st.index >= static_cast<int>(st.rows.size()))
		return nullptr;
	return st.rows[st.index].node;
}

static std::string entry_message(const diff_node& node) {
	if(node.reason == conflict_reason::kind_mismatch)
		return std::string("kind mismatch: ")
			+ kind_name(node.left->kind) + " vs " + kind_name(node.right->kind);
	for(const auto* entry : { &node.left, &node.right })
		if(*entry && !(*entry)->readable())
			return std::string(entry == &node.left ? "left" : "right")
				+ ": " + error_name((*entry)->error) + ": " + (*entry)->error_detail;
	if(node.is_directory())
		return "directory, " + std::to_string(node.children.size()) + " entries";
	return "";
}

// Fetch the selected file's hunks on the pool; the screen redraws when ready.
void load_view(app_state& st) {
	const diff_node* node = selected(st);
	std::string path = node ? node->rel_path : "";
	std::string message = node ? entry_message(*node) : "no differences";
	bool fetch = node != nullptr && message.empty();
	{
		const std::lock_guard<std::mutex> lock(st.view.mutex);
		st.view.path = path;
		st.view.diff = nullptr;
		st.view.message = fetch ? "loading" : message;
	}
	st.scroll = 0;
	if(!fetch)
		return;

	auto done = std::remove_if(st.tasks.begin(), st.tasks.end(), [] (auto& task) {
		if(task.wait_for(0s) != std::future_status::ready)
			return false;
		task.get();
		return true;
	});
	st.tasks.erase(done, st.tasks.end());
	st.tasks.push_back(submit(st.session.pool(), [&st, path] () {
		file_view view = load_file_view(st.session, path);
		{
			const std::lock_guard<std::mutex> lock(st.view.mutex);
			if(st.view.path != path)
				return;
			st.view.diff = view.diff;
			st.view.message = view.message;
		}
		st.screen.Post(ftxui::Event::Custom);
	}));
}

// Rebuild the rows of st.tree and select `path` if it is still shown.
void refresh_rows(app_state& st, const std::string& path) {
	st.rows = flatten_rows(st.tree->root, st.expanded, st.hide_unchanged);
	st.indexes.clear();
	for(size_t i = 0; i < st.rows.size(); ++i)
		st.indexes.push_back(std::to_string(i));
	st.index = find_row(st.rows, path);
	load_view(st);
}

void refresh_rows(app_state& st) {
	const diff_node* current = selected(st);
	refresh_rows(st, current ? current->rel_path : "");
}

void set_tree(app_state& st, std::shared_ptr<const diff_tree> tree) {
	// rows point into the old tree, which may be freed by the assignment
	const diff_node* current = selected(st);
	std::string path = current ? current->rel_path : "";
	st.rows.clear();
	st.tree = std::move(tree);
	auto s = st.tree->summary();
	std::ostringstream out;
	out << s.files << " files: " << s.added << " added, " << s.removed << " removed, "
		<< s.modified << " modified, " << s.conflicted << " conflicted";
	if(s.errors)
		out << ", " << s.errors << " errors";
	st.summary = out.str();
	refresh_rows(st, path);
}

ftxui::Element row_of(
	ftxui::Element left,
	ftxui::Element right,
	const int width
) {
	return ftxui::hbox(
		{ left | ftxui::size(ftxui::WIDTH, ftxui::EQUAL, (width - 1) / 2)
		, ftxui::separator()
		, right | ftxui::size(ftxui::WIDTH, ftxui::EQUAL, width / 2)
		});
};

ftxui::ButtonOption button_simple() {
	ftxui::ButtonOption option;
	option.transform = [] (const ftxui::EntryState& s) {
		auto element = ftxui::text(s.label);
		if(s.focused) element |= ftxui::inverted;
		return element;
	};
	return option;
}

void action_toggle(app_state& st) {
	const diff_node* node = selected(st);
	if(node == nullptr || !node->is_directory()) return;
	if(!st.expanded.erase(node->rel_path))
		st.expanded.insert(node->rel_path);
	refresh_rows(st);
}

void action_expand(app_state& st) {
	const diff_node* node = selected(st);
	if(node == nullptr || !node->is_directory()) return;
	if(st.expanded.insert(node->rel_path).second)
		refresh_rows(st);
}

void action_collapse(app_state& st) {
	const diff_node* node = selected(st);
	if(node == nullptr) return;
	if(st.expanded.erase(node->rel_path)) {
		refresh_rows(st);
		return;
	}
	auto slash = node->rel_path.rfind('/');
	if(slash == std::string::npos) return;
	std::string parent = node->rel_path.substr(0, slash);
	for(size_t i = 0; i < st.rows.size(); ++i)
		if(st.rows[i].node->rel_path == parent) {
			st.index = i;
			load_view(st);
			return;
		}
}

std::function<void(app_state&)> action_scroll(int lines) {
	return [lines] (app_state& st) {
		st.scroll = std::max(0, st.scroll + lines);
	};
}

void action_editor(app_state& st) {
	const diff_node* node = selected(st);
	if(node == nullptr || node->is_directory()) return;
	fs::path left = node->left
		? entry_path(st.tree->left_root, node->rel_path) : fs::path("/dev/null");
	fs::path right = node->right
		? entry_path(st.tree->right_root, node->rel_path) : fs::path("/dev/null");
	st.screen.WithRestoredIO([&] () {
		int status = run_editor(st.opts.editor, left, right);
		if(status != 0)
			st.message = "editor exited with status " + std::to_string(status);
	})();
	load_view(st);
}

void action_rescan(app_state& st) {
	trace("event: rescan");
	try {
		set_tree(st, st.session.refresh());
		st.message = "";
	} catch(const std::system_error& err) {
		trace("rescan:", err.what());
		st.message = err.what();
	}
}

struct button_def {
	std::string key;
	std::string name;
	std::string desc;
	std::function<void(app_state&)> func;
};

std::vector<std::pair<std::string, button_def>> button_defs =
	{ { "?", { "?", "close", "close this window",
		[] (app_state& st) { st.modal.help ^= true; } } }
	, { "q", { "q", "quit", "quit the app",
		[] (app_state& st) { st.screen.Exit(); } } }
	, { "\x1b[C", { "▶", "expand", "expand the directory",
		action_expand } }
	, { "\x1b[D", { "◀", "collapse", "collapse the directory / go to its parent",
		action_collapse } }
	, { "j", { "j", "down", "scroll the diff down",
		action_scroll(1) } }
	, { "k", { "k", "up", "scroll the diff up",
		action_scroll(-1) } }
	, { "u", { "u", "unified", "toggle unified / side by side",
		[] (app_state& st) { st.unified ^= true; } } }
	, { "h", { "h", "hide", "hide unchanged entries",
		[] (app_state& st) { st.hide_unchanged ^= true; refresh_rows(st); } } }
	, { "e", { "e", "edit", "open both files in the editor",
		action_editor } }
	, { "r", { "r", "rescan", "compare both roots again",
		action_rescan } }
	};

std::map<std::string, button_def> button_map =
	std::map(button_defs.begin(), button_defs.end());

ftxui::ComponentDecorator with_buttons(
	app_state* st,
	const std::set<std::string>& buttons
) {
	return ftxui::CatchEvent([=] (const ftxui::Event& event) {
		if(event.is_mouse()) return false;
		auto button = buttons.find(event.input());
		if(button == buttons.end()) return false;
		button_map.at(event.input()).func(*st);
		return true;
	});
}

static std::string expand_tabs(std::string_view line) {
	std::string out;
	for(char c : line_text(line)) {
		if(c == '\t')
			out.append(4 - out.size() % 4, ' ');
		else
			out += c;
	}
	return out;
}

static std::string pad_number(std::optional<std::size_t> number) {
	std::ostringstream out;
	out << std::setw(5);
	if(number)
		out << *number;
	else
		out << "";
	return out.str();
}

struct marker {
	std::string symbol;
	ftxui::Color color;
};

static marker marker_of(const diff_node& node) {
	if(node.has_error())
		return { "?", 12_rgb216 };
	switch(node.status) {
		case diff_status::added:      return { "+",  30_rgb216 };
		case diff_status::removed:    return { "-", 300_rgb216 };
		case diff_status::modified:   return { "~", 210_rgb216 };
		case diff_status::conflicted: return { "!", 303_rgb216 };
		case diff_status::unchanged:  break;
	}
	return { " ", 0_rgb216 };
}

decltype(ftxui::MenuEntryOption::transform) render_entry(app_state& st) {
	return [&] (const ftxui::EntryState& entry) {
		const auto& row = st.rows[std::stoi(entry.label)];
		const diff_node& node = *row.node;
		auto mark = marker_of(node);
		std::string cursor = entry.active ? "▶" : entry.focused ? "▸" : " ";
		std::string fold = !node.is_directory() ? "  "
			: st.expanded.count(node.rel_path) ? "▾ " : "▸ ";
		std::string name = node.name.empty()
			? st.tree->left_root.filename().string() : node.name;
		if(node.is_directory())
			name += "/";
		return ftxui::hbox(
			{ ftxui::text(mark.symbol) | ftxui::bgcolor(mark.color) | ftxui::bold
			, ftxui::text(cursor)
			, ftxui::text(std::string(2 * row.depth, ' ') + fold)
			, ftxui::text(name)
			, ftxui::filler()
			});
	};
}

static ftxui::Element numbered(
	std::optional<std::size_t> number,
	const std::vector<std::string>& lines,
	ftxui::Decorator style
) {
	if(!number)
		return ftxui::text("");
	return ftxui::hbox(
		{ ftxui::text(pad_number(number) + " ") | ftxui::dim
		, ftxui::text(expand_tabs(lines.at(*number - 1))) | style | ftxui::flex
		});
}

static void side_by_side(
	const file_diff& diff,
	const diff_hunk& hunk,
	int width,
	ftxui::Elements& out
) {
	std::size_t left_count = hunk.left ? hunk.left->count() : 0;
	std::size_t right_count = hunk.right ? hunk.right->count() : 0;
	ftxui::Decorator left_style = ftxui::nothing, right_style = ftxui::nothing;
	if(hunk.op != hunk_op::equal) {
		left_style = ftxui::bgcolor(100_rgb216);
		right_style = ftxui::bgcolor(10_rgb216);
	}
	for(std::size_t i = 0; i < std::max(left_count, right_count); ++i) {
		std::optional<std::size_t> left, right;
		if(i < left_count) left = hunk.left->first + i;
		if(i < right_count) right = hunk.right->first + i;
		out.push_back(row_of
			( numbered(left, diff.left_lines, left_style)
			, numbered(right, diff.right_lines, right_style)
			, width ));
	}
}

static void unified(
	const file_diff& diff,
	const diff_hunk& hunk,
	ftxui::Elements& out
) {
	auto line = [&] (std::optional<std::size_t> left, std::optional<std::size_t> right,
		const std::string& text, const char* prefix, ftxui::Decorator style) {
		out.push_back(ftxui::hbox(
			{ ftxui::text(pad_number(left) + pad_number(right) + " ") | ftxui::dim
			, ftxui::text(prefix + expand_tabs(text)) | style | ftxui::flex
			}));
	};
	if(hunk.op == hunk_op::equal) {
		for(std::size_t i = 0; i < hunk.left->count(); ++i)
			line(hunk.left->first + i, hunk.right->first + i,
				diff.left_lines.at(hunk.left->first + i - 1), " ", ftxui::nothing);
		return;
	}
	if(hunk.left)
		for(std::size_t n = hunk.left->first; n <= hunk.left->last; ++n)
			line(n, std::nullopt, diff.left_lines.at(n - 1), "-", ftxui::color(300_rgb216));
	if(hunk.right)
		for(std::size_t n = hunk.right->first; n <= hunk.right->last; ++n)
			line(std::nullopt, n, diff.right_lines.at(n - 1), "+", ftxui::color(30_rgb216));
}

ftxui::Element render_diff(app_state& st, int width, int height) {
	std::shared_ptr<const file_diff> diff;
	std::string message;
	{
		const std::lock_guard<std::mutex> lock(st.view.mutex);
		diff = st.view.diff;
		message = st.view.message;
	}
	if(!diff)
		return ftxui::vbox({ ftxui::text(message) | ftxui::dim, ftxui::filler() });
	ftxui::Elements lines;
	for(const auto& hunk : diff->hunks) {
		if(st.unified)
			unified(*diff, hunk, lines);
		else
			side_by_side(*diff, hunk, width, lines);
	}
	if(lines.empty())
		return ftxui::vbox({ ftxui::text("empty files") | ftxui::dim, ftxui::filler() });
	int last = std::max(0, static_cast<int>(lines.size()) - height);
	st.scroll = std::clamp(st.scroll, 0, last);
	ftxui::Elements visible(lines.begin() + st.scroll,
		lines.begin() + std::min<int>(lines.size(), st.scroll + height));
	visible.push_back(ftxui::filler());
	return ftxui::vbox(visible);
}

int run_tui(diff_session& session, const app_options& opts) {
	app_state st =
		{ .session = session
		, .opts = opts
		, .screen = ftxui::ScreenInteractive::Fullscreen()
		};

	auto menuopt = ftxui::MenuOption::Vertical();
	menuopt.entries_option.transform = render_entry(st);
	menuopt.on_change = [&] () { load_view(st); };
	menuopt.on_enter = [&] () { action_toggle(st); };
	auto menu_component = ftxui::Menu(&st.indexes, &st.index, menuopt);

	set_tree(st, session.tree());

	ftxui::Components buttons =
		{ ftxui::Button("q Quit", [&] () { button_map["q"].func(st); }, button_simple())
		, ftxui::Button("? Help", [&] () { button_map["?"].func(st); }, button_simple())
		};
	auto footer_component = ftxui::Renderer(
		ftxui::Container::Horizontal(buttons), [&] () {
			ftxui::Elements elems = { buttons[0]->Render() };
			for(size_t i = 1; i < buttons.size(); ++i) {
				elems.push_back(ftxui::text(" "));
				elems.push_back(buttons[i]->Render());
			}
			elems.push_back(ftxui::filler());
			if(!st.message.empty())
				elems.push_back(ftxui::text(st.message + "  ") | ftxui::bold);
			elems.push_back(ftxui::text(st.summary) | ftxui::dim);
			return ftxui::hbox(elems);
		}
	);

	auto main_layout = ftxui::Renderer(
		ftxui::Container::Vertical(
			{ menu_component | with_buttons(&st, { "\x1b[C", "\x1b[D" })
			, footer_component }),
		[&] () {
			const int tree_width = st.screen.dimx() / 3;
			const int diff_width = st.screen.dimx() - tree_width - 1;
			const int height = st.screen.dimy() - 4;
			const diff_node* node = selected(st);
			std::string path = node ? "/" + node->rel_path : "";
			return ftxui::vbox(
				{ row_of
					( ftxui::hbox(
						{ ftxui::text(st.tree->left_root.string()) | ftxui::bold
						, ftxui::text(path) })
					, ftxui::hbox(
						{ ftxui::text(st.tree->right_root.string()) | ftxui::bold
						, ftxui::text(path) })
					, st.screen.dimx() )
				, ftxui::separator()
				, ftxui::hbox(
					{ menu_component->Render() | ftxui::yframe
						| ftxui::size(ftxui::WIDTH, ftxui::EQUAL, tree_width)
					, ftxui::separator()
					, render_diff(st, diff_width, height) | ftxui::flex
					}) | ftxui::size(ftxui::HEIGHT, ftxui::EQUAL, height)
				, ftxui::separator()
				, footer_component->Render() | ftxui::xframe
				});
		});

	ftxui::Components help_buttons;
	auto mkfunc = [&] (std::function<void(app_state&)> func)
		{ return [func, &st] () { func(st); }; };
	auto button_name_width = std::accumulate(
		button_defs.begin(), button_defs.end(), size_t(0),
		[&] (size_t x, auto y) { return std::max(x, y.second.name.size()); });
	std::transform(button_defs.begin(), button_defs.end(),
		std::back_inserter(help_buttons), [&] (auto& button) {
			std::ostringstream name;
			name << button.second.key << ' ' << std::setw(button_name_width)
				<< button.second.name << "  " << button.second.desc;
			return ftxui::Button(name.str(),
				mkfunc(button.second.func), button_simple());
		});

	auto help_modal = ftxui::Modal(
		ftxui::Container::Vertical(help_buttons) | ftxui::border,
		&st.modal.help);

	st.screen.Loop(main_layout | help_modal
		| with_buttons(&st, { "?", "q", "j", "k", "u", "h", "e", "r" })
		);

	{
		const std::lock_guard<std::mutex> lock(st.view.mutex);
		st.view.path = "";
	}
	wait_all(st.tasks);
	return 0;
}
