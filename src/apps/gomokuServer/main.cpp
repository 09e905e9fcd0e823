#include "network/gameServer.hpp"
#include "network/serverConfig.hpp"

#include <format>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
	std::string address;
	if (argc > 1) {
		address = argv[1];
	} else {
		std::cout << "Enter desired IP or leave it blank to keep a default value:" << std::endl;
		std::getline(std::cin, address);
	}

	const auto config = gomoku::network::parseServerConfig(address);
	if (!config) {
		std::cerr << std::format("Invalid address '{}'. Expected host:port.\n", address);
		return 1;
	}

	gomoku::network::GameServer server(*config);
	if (!server.start()) {
		std::cerr << std::format("Could not listen on {}:{}.\n", config->host, config->port);
		return 1;
	}
	std::cout << std::format("Server listening on ip:port = {}:{}", config->host, server.port()) << std::endl;

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
