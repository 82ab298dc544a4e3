#pragma once

#include <filesystem>
#include <iostream>
#include <sstream>

struct timestamp { };
extern struct timestamp now;

std::ostream& operator <<(
	std::ostream& output,
	const struct timestamp& _
);

struct trace_config {
	std::filesystem::path file = "";
	bool to_stderr = false;
	bool verbose = false;
};

// Sinks are fixed once at startup. Without a configured file,
// tdiff.log in the working directory is used if it already exists.
void trace_init(const trace_config& config);

bool trace_enabled();
bool trace_verbose();

void trace_write(const std::string& line);

void tracef(std::ostream& out);

template<typename X, typename ...Xs>
void tracef(std::ostream& out, X&& x, Xs&& ...xs) {
	out << x << ' ';
	return tracef(out, xs...);
}

template<typename ...Xs>
void trace(Xs&& ...xs) {
	if(!trace_enabled())
		return;
	std::ostringstream line;
	tracef(line, now, std::forward<Xs>(xs)...);
	trace_write(line.str());
}

template<typename ...Xs>
void trace_debug(Xs&& ...xs) {
	if(trace_verbose())
		trace(std::forward<Xs>(xs)...);
}
