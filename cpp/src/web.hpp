#pragma once

#include "session.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

namespace http = boost::beast::http;

typedef http::request<http::string_body> web_request;
typedef http::response<http::string_body> web_response;

// the single page served at /
extern const char* const viewer_html;

std::string percent_decode(std::string_view text);

// Decoded query parameters of a request target; later keys win.
std::map<std::string, std::string> parse_query(std::string_view target);

// Answer one request from the session. Never throws for request errors.
web_response handle_request(diff_session& session, const web_request& req);

// Accepts on the io_context, serves each connection on its own thread.
// Hunks are computed on the connection thread, so an idle keep-alive
// client never holds up another.
class web_server {
	public:
	web_server(
		diff_session& session,
		boost::asio::io_context& ioc,
		const boost::asio::ip::tcp::endpoint& endpoint);
	~web_server();

	boost::asio::ip::tcp::endpoint local_endpoint() const;

	void start();

	// Close the acceptor and shut down connections still being served.
	void stop();

	private:
	void do_accept();
	void serve(boost::asio::ip::tcp::socket socket);
	void serve_requests(boost::asio::ip::tcp::socket& socket);

	diff_session& session;
	boost::asio::ip::tcp::acceptor acceptor;
	std::mutex mutex;
	std::set<boost::asio::ip::tcp::socket*> connections;
	std::size_t active = 0;
	std::condition_variable drained;
};
