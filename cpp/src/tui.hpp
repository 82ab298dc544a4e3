#pragma once

#include "opts.hpp"
#include "session.hpp"

// Browse the session's tree in the terminal until the user quits.
int run_tui(diff_session& session, const app_options& opts);
