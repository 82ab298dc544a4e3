#include "opts.hpp"
#include "session.hpp"
#include "shell.hpp"
#include "trace.hpp"
#include "tui.hpp"
#include "web.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>

namespace asio = boost::asio;

static compare_options compare_options_of(const app_options& opts) {
	compare_options compare
		{ .left = opts.left
		, .right = opts.right
		, .scan =
			{ .rules = {}
			, .vcs_ignore = opts.vcs_ignore
			, .policy = opts.policy
			}
		, .threads = opts.threads
		};
	for(const auto& pattern : opts.excludes)
		compare.scan.rules.add(pattern);
	return compare;
}

// SIGINT and SIGTERM cancel the comparison while it runs.
static int first_comparison(diff_session& session) {
	cancel_token cancel;
	asio::io_context ioc;
	asio::signal_set signals(ioc, SIGINT, SIGTERM);
	signals.async_wait([&] (const boost::system::error_code& ec, int signal) {
		if(ec) return;
		trace("signal", signal, "cancelling");
		cancel.cancel();
	});
	std::thread waiter([&] () { ioc.run(); });
	int status = 0;
	try {
		session.refresh(cancel);
	} catch(const std::system_error& err) {
		trace("compare failed:", err.what());
		std::cerr << "tdiff: " << err.what() << std::endl;
		status = err.code() == diff_errc::cancelled ? 130 : 1;
	}
	boost::system::error_code ec;
	signals.cancel(ec);
	waiter.join();
	return status;
}

static int serve_web(diff_session& session, const app_options& opts) {
	asio::io_context ioc;
	asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), opts.port);
	std::unique_ptr<web_server> server;
	try {
		server = std::make_unique<web_server>(session, ioc, endpoint);
	} catch(const boost::system::system_error& err) {
		std::cerr << "tdiff: cannot listen on " << endpoint << ": " << err.what() << std::endl;
		return 1;
	}
	server->start();

	asio::signal_set signals(ioc, SIGINT, SIGTERM);
	signals.async_wait([&] (const boost::system::error_code& ec, int signal) {
		if(ec) return;
		trace("signal", signal, "stopping");
		server->stop();
		ioc.stop();
	});

	std::string url = "http://127.0.0.1:" + std::to_string(server->local_endpoint().port()) + "/";
	std::cout << "serving " << url << std::endl;
	if(opts.open && !open_browser(url))
		std::cerr << "warning: could not open a browser, visit " << url << std::endl;
	ioc.run();
	return 0;
}

int main(int argc, const char* argv[]) {
	auto opts_alt = get_opts(argc, argv);
	if(std::holds_alternative<int>(opts_alt))
		return std::get<int>(opts_alt);
	auto opts = std::get<app_options>(opts_alt);

	trace_init(
		{ .file = opts.log
		, .to_stderr = opts.verbose && opts.web
		, .verbose = opts.verbose
		});
	trace("------------------------------------------------------------");
	trace("pid", getpid());

	diff_session session(compare_options_of(opts));
	if(int status = first_comparison(session))
		return status;

	if(opts.web)
		return serve_web(session, opts);
	return run_tui(session, opts);
}
