#include "core/game.hpp"
#include "core/winChecker.hpp"

#include <algorithm>
#include <cassert>
#include <iterator>

namespace gomoku {

static Response fail(const GameError error, const PeerAddress& peer) {
	return FailResponse{.message = std::string{toMessage(error)}, .peer = peer};
}

Game::Game() : m_board{BOARD_CELLS, BOARD_COLUMNS} {
}

Response Game::handle(const Command& command, const PeerAddress& peer) {
	return std::visit([&](const auto& cmd) { return handleCommand(cmd, peer); }, command);
}

void Game::disconnect(const PeerAddress& peer) {
	if (!m_activePlayer) {
		std::erase_if(m_players, [&](const Player& player) { return player.address == peer; });
		return;
	}

	// Game running. The seat stays reserved until the next reset.
	for (auto& player: m_players) {
		if (player.address == peer) {
			player.connected = false;
		}
	}
}

GameState Game::state() const {
	if (m_winner) {
		return GameState::Won;
	}
	if (m_players.size() < MAX_PLAYERS) {
		return GameState::Lobby;
	}
	return m_activePlayer ? GameState::InPlay : GameState::Opening;
}

const Board& Game::board() const {
	return m_board;
}

const std::vector<Player>& Game::players() const {
	return m_players;
}

std::optional<std::size_t> Game::activePlayer() const {
	return m_activePlayer;
}

const std::optional<std::string>& Game::winner() const {
	return m_winner;
}

Response Game::handleCommand(const ConnectCommand& command, const PeerAddress& peer) {
	if (command.name.size() > MAX_NAME_BYTES) {
		return fail(GameError::NameTooLong, peer);
	}
	if (findPlayer(command.name)) {
		return fail(GameError::NameTaken, peer);
	}
	if (m_players.size() >= MAX_PLAYERS) {
		return fail(GameError::GameFull, peer);
	}

	m_players.push_back(Player{.address = peer, .name = command.name, .color = std::nullopt});
	return OkResponse{.peer = peer};
}

Response Game::handleCommand(const MoveCommand& command, const PeerAddress& peer) {
	const auto mover = findPlayer(command.name);
	if (const auto error = checkMove(command, mover)) {
		return fail(*error, peer);
	}

	assert(mover && m_players.size() == MAX_PLAYERS);
	const auto other = *mover == 0u ? 1u : 0u;

	// Opening move: the mover takes the first color, the opponent gets the next turn.
	if (!m_activePlayer) {
		m_players[*mover].color = Color::First;
		m_players[other].color  = Color::Second;
	}
	m_activePlayer = other;

	const auto color = *m_players[*mover].color;
	m_board.set(command.cell, toBoardValue(color));
	if (hasFiveInRow(m_board, toBoardValue(color))) {
		m_winner = m_players[*mover].name;
	}

	return MoveResponse{.cell = command.cell, .color = color, .winner = m_winner};
}

Response Game::handleCommand(const ResetCommand&, const PeerAddress&) {
	reset();
	return ResetResponse{};
}

std::optional<GameError> Game::checkMove(const MoveCommand& command, const std::optional<std::size_t> mover) const {
	if (m_players.size() < MAX_PLAYERS) {
		return GameError::NotEnoughPlayers;
	}
	if (!mover) {
		return GameError::UnknownPlayer;
	}
	if (m_winner) {
		return GameError::GameOver;
	}
	if (m_activePlayer && *m_activePlayer != *mover) {
		return GameError::OutOfTurn;
	}
	if (!m_board.contains(command.cell)) {
		return GameError::InvalidCell;
	}
	if (!m_board.isFree(command.cell)) {
		return GameError::CellOccupied;
	}
	return std::nullopt;
}

std::optional<std::size_t> Game::findPlayer(const std::string& name) const {
	const auto it = std::ranges::find(m_players, name, &Player::name);
	if (it == m_players.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(std::distance(m_players.begin(), it));
}

void Game::reset() {
	m_activePlayer.reset();
	m_winner.reset();
	m_board.clear();
	std::erase_if(m_players, [](const Player& player) { return !player.connected; });
}

} // namespace gomoku
