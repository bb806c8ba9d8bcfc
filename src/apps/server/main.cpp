#include "network/server.hpp"

#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

//! Port from the first argument. Falls back to the default port.
static std::uint16_t parsePort(int argc, char** argv) {
	if (argc < 2) {
		return wiz::network::core::DEFAULT_PORT;
	}

	const std::string_view text{argv[1]};
	std::uint16_t port = 0;
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
	if (ec != std::errc{} || end != text.data() + text.size() || port == 0) {
		std::cerr << "Invalid port '" << text << "'. Using " << wiz::network::core::DEFAULT_PORT << ".\n";
		return wiz::network::core::DEFAULT_PORT;
	}
	return port;
}

int main(int argc, char** argv) {
	wiz::network::Server server{parsePort(argc, argv)};
	if (!server.start()) {
		std::cerr << "Could not start the relay.\n";
		return 1;
	}
	std::cout << "Relay listening on port " << server.port() << ". Type 'quit' to stop.\n";

	// Keep the relay alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
