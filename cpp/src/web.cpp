#include "web.hpp"
#include "json.hpp"
#include "trace.hpp"

#include <thread>

#include <boost/beast/core.hpp>

#include <sys/socket.h>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static int hex_value(char c) {
	if('0' <= c && c <= '9') return c - '0';
	if('a' <= c && c <= 'f') return c - 'a' + 10;
	if('A' <= c && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::string percent_decode(std::string_view text) {
	std::string out;
	out.reserve(text.size());
	for(std::size_t i = 0; i < text.size(); ++i) {
		if(text[i] == '+')
			out += ' ';
		else if(text[i] == '%' && i + 2 < text.size()
			&& hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
			out += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
			i += 2;
		} else
			out += text[i];
	}
	return out;
}

std::map<std::string, std::string> parse_query(std::string_view target) {
	std::map<std::string, std::string> params;
	auto pos = target.find('?');
	if(pos == std::string_view::npos)
		return params;
	std::string_view query = target.substr(pos + 1);
	while(!query.empty()) {
		auto amp = query.find('&');
		std::string_view pair = query.substr(0, amp);
		query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
		if(pair.empty())
			continue;
		auto eq = pair.find('=');
		if(eq == std::string_view::npos)
			params[percent_decode(pair)] = "";
		else
			params[percent_decode(pair.substr(0, eq))] = percent_decode(pair.substr(eq + 1));
	}
	return params;
}

static web_response make_response(
	const web_request& req,
	http::status status,
	const char* content_type,
	std::string body
) {
	web_response res { status, req.version() };
	res.set(http::field::server, "tdiff");
	res.set(http::field::content_type, content_type);
	res.keep_alive(req.keep_alive());
	res.body() = std::move(body);
	res.prepare_payload();
	return res;
}

static web_response json_response(
	const web_request& req,
	http::status status,
	const boost::json::value& value
) {
	return make_response(req, status, "application/json", boost::json::serialize(value));
}

static http::status status_of(const std::system_error& err) {
	if(err.code() == diff_errc::entry_not_found)
		return http::status::not_found;
	if(err.code() == diff_errc::not_a_file || err.code() == diff_errc::binary_content)
		return http::status::unprocessable_entity;
	return http::status::internal_server_error;
}

web_response handle_request(diff_session& session, const web_request& req) {
	std::string_view target(req.target().data(), req.target().size());
	std::string_view path = target.substr(0, target.find('?'));
	trace_debug("web:", req.method_string(), target);

	if(req.method() != http::verb::get) {
		auto res = make_response(req, http::status::method_not_allowed,
			"text/plain", "method not allowed\n");
		res.set(http::field::allow, "GET");
		return res;
	}
	if(path == "/" || path == "/index.html")
		return make_response(req, http::status::ok, "text/html; charset=utf-8", viewer_html);
	if(!path.starts_with("/api/"))
		return make_response(req, http::status::not_found, "text/plain", "not found\n");

	auto params = parse_query(target);
	std::string rel_path = params.count("path") ? params["path"] : "";
	try {
		auto tree = session.tree();
		if(!tree)
			throw std::system_error(make_error_code(diff_errc::entry_not_found), "no comparison");
		if(path == "/api/diff")
			return json_response(req, http::status::ok, api_response(to_json(*tree)));
		if(path == "/api/node") {
			const diff_node* node = tree->find(rel_path);
			if(node == nullptr)
				throw std::system_error(make_error_code(diff_errc::entry_not_found), rel_path);
			return json_response(req, http::status::ok, api_response(to_json(*node, false)));
		}
		if(path == "/api/file") {
			auto diff = session.file_hunks(rel_path);
			return json_response(req, http::status::ok, api_response(to_json(*diff)));
		}
	} catch(const std::system_error& err) {
		trace_debug("web:", target, err.what());
		return json_response(req, status_of(err), api_error(err));
	}
	return make_response(req, http::status::not_found, "text/plain", "not found\n");
}

web_server::web_server(
	diff_session& session,
	net::io_context& ioc,
	const tcp::endpoint& endpoint
)
	: session(session)
	, acceptor(ioc)
{
	beast::error_code ec;
	acceptor.open(endpoint.protocol(), ec);
	if(ec) throw beast::system_error(ec);
	acceptor.set_option(net::socket_base::reuse_address(true), ec);
	if(ec) throw beast::system_error(ec);
	acceptor.bind(endpoint, ec);
	if(ec) throw beast::system_error(ec);
	acceptor.listen(net::socket_base::max_listen_connections, ec);
	if(ec) throw beast::system_error(ec);
}

web_server::~web_server() {
	stop();
	std::unique_lock<std::mutex> lock(mutex);
	drained.wait(lock, [this] () { return active == 0; });
}

tcp::endpoint web_server::local_endpoint() const {
	return acceptor.local_endpoint();
}

void web_server::start() {
	trace("web: listening on", local_endpoint());
	do_accept();
}

void web_server::stop() {
	const std::lock_guard<std::mutex> lock(mutex);
	beast::error_code ec;
	acceptor.close(ec);
	if(ec)
		trace("web: close:", ec.message());
	// the sockets belong to their connection threads; only wake them
	for(auto* socket : connections)
		::shutdown(socket->native_handle(), SHUT_RDWR);
}

void web_server::do_accept() {
	acceptor.async_accept([this] (beast::error_code ec, tcp::socket socket) {
		if(ec == net::error::operation_aborted)
			return;
		if(ec)
			trace("web: accept:", ec.message());
		else {
			{
				const std::lock_guard<std::mutex> lock(mutex);
				++active;
			}
			try {
				std::thread([this, socket = std::move(socket)] () mutable {
					serve(std::move(socket));
				}).detach();
			} catch(const std::system_error& err) {
				trace("web: thread:", err.what());
				const std::lock_guard<std::mutex> lock(mutex);
				--active;
				drained.notify_all();
			}
		}
		do_accept();
	});
}

void web_server::serve(tcp::socket socket) {
	bool open;
	{
		const std::lock_guard<std::mutex> lock(mutex);
		open = acceptor.is_open();
		if(open)
			connections.insert(&socket);
	}
	if(open) {
		try {
			serve_requests(socket);
		} catch(const std::exception& err) {
			trace("web: connection:", err.what());
		}
	}
	const std::lock_guard<std::mutex> lock(mutex);
	connections.erase(&socket);
	--active;
	drained.notify_all();
}

void web_server::serve_requests(tcp::socket& socket) {
	beast::flat_buffer buffer;
	beast::error_code ec;
	for(;;) {
		web_request req;
		http::read(socket, buffer, req, ec);
		if(ec == http::error::end_of_stream)
			break;
		if(ec) {
			trace_debug("web: read:", ec.message());
			return;
		}
		web_response res = handle_request(session, req);
		bool keep_alive = res.keep_alive();
		http::write(socket, res, ec);
		if(ec) {
			trace_debug("web: write:", ec.message());
			return;
		}
		if(!keep_alive)
			break;
	}
	socket.shutdown(tcp::socket::shutdown_send, ec);
}
