#include "trace.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>

namespace fs = std::filesystem;

struct timestamp now;

namespace {

struct trace_sink {
	std::mutex mutex;
	std::ofstream file;
	bool to_stderr = false;
	bool verbose = false;
};

trace_sink& sink() {
	static trace_sink sink;
	return sink;
}

}

std::ostream& operator <<(std::ostream& output, const struct timestamp& _) {
	auto clock = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(clock);
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
		clock.time_since_epoch()).count() % 1000;
	std::tm local;
	localtime_r(&time, &local);
	return output << std::put_time(&local, "%FT%T")
		<< '.' << std::setw(3) << std::setfill('0') << millis << std::setfill(' ');
}

void trace_init(const trace_config& config) {
	auto& st = sink();
	const std::lock_guard<std::mutex> lock(st.mutex);
	fs::path file = config.file;
	if(file.empty() && fs::exists("tdiff.log"))
		file = "tdiff.log";
	if(st.file.is_open())
		st.file.close();
	if(!file.empty()) {
		st.file.open(file, std::ios::out | std::ios::app);
		if(!st.file)
			std::cerr << "warning: cannot open log file " << file << '\n';
	}
	st.to_stderr = config.to_stderr;
	st.verbose = config.verbose;
}

bool trace_enabled() {
	auto& st = sink();
	const std::lock_guard<std::mutex> lock(st.mutex);
	return st.file.is_open() || st.to_stderr;
}

bool trace_verbose() {
	auto& st = sink();
	const std::lock_guard<std::mutex> lock(st.mutex);
	return st.verbose;
}

void trace_write(const std::string& line) {
	auto& st = sink();
	const std::lock_guard<std::mutex> lock(st.mutex);
	if(st.file.is_open())
		st.file << line << std::endl;
	if(st.to_stderr)
		std::cerr << line << std::endl;
}

void tracef(std::ostream& out) { }
