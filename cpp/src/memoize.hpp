#pragma once

#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

#include <boost/functional/hash.hpp>

template<typename Tuple, size_t Index = std::tuple_size<Tuple>::value - 1>
struct HashTuple {
	static void apply(size_t& seed, Tuple const& tuple) {
		HashTuple<Tuple, Index - 1>::apply(seed, tuple);
		boost::hash_combine(seed, std::get<Index>(tuple));
	}
};

template<typename Tuple>
struct HashTuple<Tuple, 0> {
	static void apply(size_t& seed, Tuple const& tuple) {
		boost::hash_combine(seed, std::get<0>(tuple));
	}
};

template<typename ...Ts>
struct hash_tuple {
	size_t operator()(std::tuple<Ts...> const& ts) const {
		size_t seed = 0;
		HashTuple<std::tuple<Ts...> >::apply(seed, ts);
		return seed;
	}
};

// Caches func(args...) together with the token(args...) it was computed
// under. A cached value is returned only while a fresh token compares
// equal to the stored one.
template<typename Val, typename Tok, typename ...Args>
struct memoized {
	typedef std::tuple<std::decay_t<Args>...> key_type;

	std::function<Tok(const Args&...)> token
		= [] (const auto&...) { return Tok(); };
	std::function<Val(const Args&...)> func;

	mutable std::shared_mutex mutex = std::shared_mutex();
	std::unordered_map<key_type, std::pair<Tok, Val>, hash_tuple<std::decay_t<Args>...>> cache = {};

	Val operator ()(const Args&... args) {
		Tok current = this->token(args...);
		key_type key(args...);
		{
			const std::shared_lock<std::shared_mutex> lock(this->mutex);
			auto find = this->cache.find(key);
			if(find != this->cache.end() && find->second.first == current)
				return find->second.second;
		}
		Val val = func(args...);
		{
			const std::unique_lock<std::shared_mutex> lock(this->mutex);
			this->cache.insert_or_assign(key, std::make_pair(current, val));
		}
		return val;
	}

	void clear() {
		const std::unique_lock<std::shared_mutex> lock(this->mutex);
		this->cache.clear();
	}

	size_t size() const {
		const std::shared_lock<std::shared_mutex> lock(this->mutex);
		return this->cache.size();
	}
};
