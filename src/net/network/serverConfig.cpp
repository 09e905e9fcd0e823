#include "network/serverConfig.hpp"

#include <cctype>
#include <charconv>

namespace gomoku::network {

static std::string_view trim(std::string_view text) {
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
		text.remove_prefix(1);
	}
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
		text.remove_suffix(1);
	}
	return text;
}

std::optional<ServerConfig> parseServerConfig(std::string_view address) {
	address = trim(address);

	ServerConfig config{};
	if (address.empty()) {
		return config;
	}

	const auto colon = address.rfind(':');
	if (colon == std::string_view::npos || colon == 0u || colon + 1 == address.size()) {
		return std::nullopt;
	}

	auto host = address.substr(0, colon);
	if (host.front() == '[') {
		if (host.size() < 3u || host.back() != ']') {
			return std::nullopt;
		}
		host = host.substr(1, host.size() - 2);
	}

	const auto portText  = address.substr(colon + 1);
	std::uint16_t port   = 0;
	const auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
	if (ec != std::errc() || ptr != portText.data() + portText.size()) {
		return std::nullopt;
	}

	config.host = std::string{host};
	config.port = port;
	return config;
}

} // namespace gomoku::network
