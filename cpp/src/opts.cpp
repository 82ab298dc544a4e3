#include "opts.hpp"

#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

namespace opt = boost::program_options;

static std::string default_editor() {
	const char* editor = std::getenv("EDITOR");
	if(editor == NULL || *editor == '\0')
		editor = "vi";
	return std::string(editor) + " -d";
}

std::variant<int,app_options> get_opts(int argc, const char* argv[]) {
	opt::options_description opts_desc(
		"usage: tdiff [options] LEFT RIGHT\noptions");
	opts_desc.add_options()
		( "help,h"
		, "show this help message" )
		( "left,l"
		, opt::value<std::string>()->required()
		, "left file or directory" )
		( "right,r"
		, opt::value<std::string>()->required()
		, "right file or directory" )
		( "web"
		, opt::bool_switch()
		, "serve the comparison over http instead of the terminal ui" )
		( "port"
		, opt::value<unsigned short>()->default_value(3000)
		, "port for --web" )
		( "open"
		, opt::bool_switch()
		, "open a browser on the --web address" )
		( "verbose,v"
		, opt::bool_switch()
		, "trace debug messages" )
		( "exclude,x"
		, opt::value<std::vector<std::string>>()->composing()
		, "ignore paths matching a gitignore pattern" )
		( "no-ignore"
		, opt::bool_switch()
		, "do not read .gitignore and .git/info/exclude" )
		( "fingerprint"
		, opt::value<fingerprint_policy>()->default_value(fingerprint_policy::fast)
		, "when to hash file contents: fast or always" )
		( "threads,j"
		, opt::value<unsigned>()->default_value(0)
		, "number of worker threads, 0 for one per core" )
		( "editor,e"
		, opt::value<std::string>()->default_value(default_editor())
		, "program used to diff two files" )
		( "log"
		, opt::value<std::string>()
		, "append trace messages to this file" )
		;
	opt::positional_options_description posn_desc;
	posn_desc.add("left", 1);
	posn_desc.add("right", 1);

	opt::variables_map args;
	try {
		opt::store(opt::command_line_parser(argc, argv)
			.options(opts_desc).positional(posn_desc).run(), args);
		if(args.count("help")) {
			std::cout << opts_desc << std::flush;
			return 0;
		}
		opt::notify(args);
	} catch(opt::error& err) {
		std::cerr << err.what() << '\n' << opts_desc << std::flush;
		return 1;
	}

	app_options opts
		{ .left = args["left"].as<std::string>()
		, .right = args["right"].as<std::string>()
		, .editor = args["editor"].as<std::string>()
		, .threads = args["threads"].as<unsigned>()
		, .vcs_ignore = !args["no-ignore"].as<bool>()
		, .policy = args["fingerprint"].as<fingerprint_policy>()
		, .web = args["web"].as<bool>()
		, .port = args["port"].as<unsigned short>()
		, .open = args["open"].as<bool>()
		, .verbose = args["verbose"].as<bool>()
		};
	auto exclude = args.find("exclude");
	if(exclude != args.end())
		opts.excludes = exclude->second.as<std::vector<std::string>>();
	auto log = args.find("log");
	if(log != args.end())
		opts.log = log->second.as<std::string>();
	return opts;
}
