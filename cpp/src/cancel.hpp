#pragma once

#include "errors.hpp"

#include <atomic>
#include <memory>

// Copies share one flag. A comparison polls it between entries and
// throws diff_errc::cancelled once it is set.
struct cancel_token {
	std::shared_ptr<std::atomic<bool>> flag
		= std::make_shared<std::atomic<bool>>(false);

	void cancel() const { flag->store(true); }

	bool cancelled() const { return flag->load(); }

	void check() const {
		if(cancelled())
			throw std::system_error(make_error_code(diff_errc::cancelled));
	}
};
