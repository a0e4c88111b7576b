#include "lobby/config.hpp"
#include "lobby/gameServer.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
	const auto config = tictac::lobby::parseArguments(argc, argv);
	if (!config) {
		std::cerr << tictac::lobby::usage(argc > 0 ? argv[0] : "tictac_server") << std::endl;
		return 1;
	}

	tictac::lobby::GameServer server{*config};
	if (!server.start()) {
		std::cerr << "Could not listen on port " << config->port << std::endl;
		return 1;
	}
	std::cout << "Listening on port " << server.port() << ". Commands: status, quit." << std::endl;

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
		if (line == "status") {
			auto& hub = server.hub();
			std::cout << hub.presence().listOnline().size() << " online, " << hub.gameCount() << " games running, "
			          << hub.accounts().size() << " accounts." << std::endl;
		}
	}

	server.stop();
	return 0;
}
