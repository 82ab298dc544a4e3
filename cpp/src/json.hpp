#pragma once

#include "diff.hpp"
#include "fileio.hpp"

#include <system_error>

#include <boost/json.hpp>

boost::json::value to_json(const fs_entry& entry);
boost::json::value to_json(const diff_node& node, bool with_children = true);
boost::json::value to_json(const diff_summary& summary);
boost::json::value to_json(const diff_tree& tree);
boost::json::value to_json(const file_diff& diff);

// {"success":true,"data":...,"error":null}
boost::json::value api_response(boost::json::value data);

// {"success":false,"data":null,"error":<message>,"code":<name>}
boost::json::value api_error(const std::system_error& err);
