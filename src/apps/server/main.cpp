#include "hoshi/app/config.hpp"
#include "hoshi/app/gameServer.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
	hoshi::app::ServerConfig config;
	try {
		if (argc > 1) {
			config = hoshi::app::ServerConfig::load(argv[1]);
		}
	} catch (const std::exception& e) {
		std::cerr << "Invalid server configuration: " << e.what() << '\n';
		return 1;
	}

	try {
		hoshi::app::GameServer server(config);
		server.start();
		std::cout << "Hoshi server listening on port " << server.port() << '\n';

		// Keep the server process alive until stdin closes or quit command.
		std::string line;
		while (std::getline(std::cin, line)) {
			if (line == "quit" || line == "exit") {
				break;
			}
		}

		server.stop();
	} catch (const std::exception& e) {
		std::cerr << "Server failed: " << e.what() << '\n';
		return 1;
	}
	return 0;
}
