#pragma once

#include "core/game.hpp"

#include <mutex>
#include <utility>

namespace gomoku {

//! The one game instance shared by all connections.
//! Every access runs under a single mutex, so commands apply in the order they acquire the lock.
class SharedGame {
public:
	//! Run func(Game&) with exclusive access and return its result.
	template <class Func>
	decltype(auto) withLock(Func&& func) {
		std::lock_guard<std::mutex> lock(m_mutex);
		return std::forward<Func>(func)(m_game);
	}

private:
	Game m_game;
	std::mutex m_mutex;
};

} // namespace gomoku
