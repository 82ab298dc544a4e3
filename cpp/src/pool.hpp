#pragma once

#include <future>
#include <memory>
#include <type_traits>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

// Run `func` on the pool; the future carries its result or exception.
template<typename F>
auto submit(boost::asio::thread_pool& pool, F&& func)
	-> std::future<std::invoke_result_t<std::decay_t<F>&>>
{
	typedef std::invoke_result_t<std::decay_t<F>&> result_type;
	auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(func));
	auto future = task->get_future();
	boost::asio::post(pool, [task] () { (*task)(); });
	return future;
}

// Every task finishes before the first stored exception is rethrown,
// so tasks never outlive the data they reference.
template<typename T>
void wait_all(std::vector<std::future<T>>& futures) {
	for(auto& future : futures)
		future.wait();
	for(auto& future : futures)
		future.get();
}
