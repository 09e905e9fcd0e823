#include "network/messages.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace gomoku::network {

using nlohmann::json;

static constexpr const char* KEY_TYPE    = "type";
static constexpr const char* KEY_NAME    = "name";
static constexpr const char* KEY_CELL    = "cell";
static constexpr const char* KEY_COLOR   = "color";
static constexpr const char* KEY_WINNER  = "winner";
static constexpr const char* KEY_PEER    = "peer";
static constexpr const char* KEY_MESSAGE = "message";

static constexpr const char* TYPE_CONNECT = "connect";
static constexpr const char* TYPE_MOVE    = "move";
static constexpr const char* TYPE_RESET   = "reset";
static constexpr const char* TYPE_OK      = "ok";
static constexpr const char* TYPE_FAIL    = "fail";

static core::Message toBinary(const json& j) {
	const auto bytes = json::to_msgpack(j);
	return core::Message(bytes.begin(), bytes.end());
}

static std::optional<json> fromBinary(const core::Message& message) {
	auto j = json::from_msgpack(message.begin(), message.end(), true, false);
	if (j.is_discarded() || !j.is_object()) {
		return std::nullopt;
	}
	return j;
}

static std::optional<std::string> stringField(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_string()) {
		return std::nullopt;
	}
	return it->get<std::string>();
}

static std::optional<std::uint64_t> unsignedField(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_number_unsigned()) {
		return std::nullopt;
	}
	return it->get<std::uint64_t>();
}

// Commands

static json toJson(const ConnectCommand& e) {
	json j;
	j[KEY_TYPE] = TYPE_CONNECT;
	j[KEY_NAME] = e.name;
	return j;
}
static json toJson(const MoveCommand& e) {
	json j;
	j[KEY_TYPE] = TYPE_MOVE;
	j[KEY_CELL] = e.cell;
	j[KEY_NAME] = e.name;
	return j;
}
static json toJson(const ResetCommand&) {
	json j;
	j[KEY_TYPE] = TYPE_RESET;
	return j;
}

core::Message toMessage(const Command& command) {
	return toBinary(std::visit([](const auto& e) { return toJson(e); }, command));
}

std::optional<Command> fromClientMessage(const core::Message& message) {
	const auto j = fromBinary(message);
	if (!j) {
		return std::nullopt;
	}
	const auto type = stringField(*j, KEY_TYPE);
	if (!type) {
		return std::nullopt;
	}

	if (*type == TYPE_CONNECT) {
		auto name = stringField(*j, KEY_NAME);
		if (!name) {
			return std::nullopt;
		}
		return ConnectCommand{.name = std::move(*name)};
	}

	if (*type == TYPE_MOVE) {
		const auto cell = unsignedField(*j, KEY_CELL);
		auto name       = stringField(*j, KEY_NAME);
		if (!cell || !name) {
			return std::nullopt;
		}
		return MoveCommand{.cell = static_cast<CellIndex>(*cell), .name = std::move(*name)};
	}

	if (*type == TYPE_RESET) {
		return ResetCommand{};
	}

	// Invalid
	return std::nullopt;
}

// Responses

static json toJson(const OkResponse& e) {
	json j;
	j[KEY_TYPE] = TYPE_OK;
	j[KEY_PEER] = e.peer;
	return j;
}
static json toJson(const FailResponse& e) {
	json j;
	j[KEY_TYPE]    = TYPE_FAIL;
	j[KEY_MESSAGE] = e.message;
	j[KEY_PEER]    = e.peer;
	return j;
}
static json toJson(const MoveResponse& e) {
	json j;
	j[KEY_TYPE]   = TYPE_MOVE;
	j[KEY_CELL]   = e.cell;
	j[KEY_COLOR]  = static_cast<unsigned>(e.color);
	j[KEY_WINNER] = e.winner ? json(*e.winner) : json(nullptr);
	return j;
}
static json toJson(const ResetResponse&) {
	json j;
	j[KEY_TYPE] = TYPE_RESET;
	return j;
}

core::Message toMessage(const Response& response) {
	return toBinary(std::visit([](const auto& e) { return toJson(e); }, response));
}

static std::optional<Response> fromMoveMessage(const json& j) {
	const auto cell  = unsignedField(j, KEY_CELL);
	const auto color = unsignedField(j, KEY_COLOR);
	if (!cell || !color) {
		return std::nullopt;
	}
	if (*color != static_cast<unsigned>(Color::First) && *color != static_cast<unsigned>(Color::Second)) {
		return std::nullopt;
	}

	std::optional<std::string> winner;
	const auto it = j.find(KEY_WINNER);
	if (it != j.end() && !it->is_null()) {
		if (!it->is_string()) {
			return std::nullopt;
		}
		winner = it->get<std::string>();
	}

	return MoveResponse{.cell = static_cast<CellIndex>(*cell), .color = static_cast<Color>(*color), .winner = std::move(winner)};
}

std::optional<Response> fromServerMessage(const core::Message& message) {
	const auto j = fromBinary(message);
	if (!j) {
		return std::nullopt;
	}
	const auto type = stringField(*j, KEY_TYPE);
	if (!type) {
		return std::nullopt;
	}

	if (*type == TYPE_OK) {
		auto peer = stringField(*j, KEY_PEER);
		if (!peer) {
			return std::nullopt;
		}
		return OkResponse{.peer = std::move(*peer)};
	}

	if (*type == TYPE_FAIL) {
		auto text = stringField(*j, KEY_MESSAGE);
		auto peer = stringField(*j, KEY_PEER);
		if (!text || !peer) {
			return std::nullopt;
		}
		return FailResponse{.message = std::move(*text), .peer = std::move(*peer)};
	}

	if (*type == TYPE_MOVE) {
		return fromMoveMessage(*j);
	}

	if (*type == TYPE_RESET) {
		return ResetResponse{};
	}

	return std::nullopt;
}

} // namespace gomoku::network
