#include "gameNet/nwEvents.hpp"

#include <charconv>
#include <format>

namespace tictac::gameNet {

static std::string key(std::string_view name) {
	return std::string{name};
}

static Message typed(std::string_view messageType) {
	return Message{{key(field::Type), std::string{messageType}}};
}

static std::string joinPlayers(const std::vector<std::string>& players) {
	std::string out;
	for (const auto& player: players) {
		if (!out.empty()) {
			out.push_back(',');
		}
		out += player;
	}
	return out;
}

static std::vector<std::string> split(std::string_view text, char separator) {
	std::vector<std::string> parts;
	if (text.empty()) {
		return parts;
	}
	std::size_t start = 0;
	while (true) {
		const auto end = text.find(separator, start);
		parts.emplace_back(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
		if (end == std::string_view::npos) {
			break;
		}
		start = end + 1;
	}
	return parts;
}

static std::optional<unsigned> toUnsigned(std::string_view text) {
	unsigned value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

static std::optional<unsigned> toUnsigned(const std::optional<std::string>& text) {
	if (!text) {
		return std::nullopt;
	}
	return toUnsigned(std::string_view{*text});
}

static FieldMap encodeBoard(const BoardGrid& board) {
	FieldMap cells;
	for (std::size_t x = 0; x != board.size(); ++x) {
		for (std::size_t y = 0; y != board[x].size(); ++y) {
			cells.emplace(std::format("{},{}", x, y), std::string(1, board[x][y]));
		}
	}
	return cells;
}

static std::optional<BoardGrid> decodeBoard(const FieldMap& cells) {
	BoardGrid board{};
	for (std::size_t x = 0; x != board.size(); ++x) {
		for (std::size_t y = 0; y != board[x].size(); ++y) {
			const auto it = cells.find(std::format("{},{}", x, y));
			if (it == cells.end() || it->second.size() != 1u) {
				return std::nullopt;
			}
			board[x][y] = it->second.front();
		}
	}
	return board;
}

std::string_view toString(Response response) {
	return response == Response::Accept ? "ACCEPT" : "REJECT";
}

std::optional<Response> responseFromString(std::string_view text) {
	if (text == "ACCEPT") {
		return Response::Accept;
	}
	if (text == "REJECT") {
		return Response::Reject;
	}
	return std::nullopt;
}

std::string_view toString(Outcome outcome) {
	switch (outcome) {
	case Outcome::Win:
		return "WIN";
	case Outcome::Loss:
		return "LOSS";
	case Outcome::Draw:
		break;
	}
	return "DRAW";
}

std::optional<Outcome> outcomeFromString(std::string_view text) {
	if (text == "WIN") {
		return Outcome::Win;
	}
	if (text == "LOSS") {
		return Outcome::Loss;
	}
	if (text == "DRAW") {
		return Outcome::Draw;
	}
	return std::nullopt;
}

// Client events

static Message toFields(const ClientRegister& e) {
	auto m = typed(type::Register);
	m[key(field::Username)] = e.username;
	m[key(field::Password)] = e.password;
	return m;
}
static Message toFields(const ClientLogin& e) {
	auto m = typed(type::Login);
	m[key(field::Username)] = e.username;
	m[key(field::Password)] = e.password;
	return m;
}
static Message toFields(const ClientListPlayers&) {
	return typed(type::ListPlayers);
}
static Message toFields(const ClientChallenge& e) {
	auto m = typed(type::Challenge);
	m[key(field::Opponent)] = e.opponent;
	return m;
}
static Message toFields(const ClientChallengeResponse& e) {
	auto m = typed(type::ChallengeResponse);
	m[key(field::Challenger)] = e.challenger;
	m[key(field::Response)]   = std::string{toString(e.response)};
	return m;
}
static Message toFields(const ClientMove& e) {
	auto m = typed(type::Move);
	m[key(field::GameId)] = e.gameId;
	m[key(field::Data)]   = FieldMap{{key(field::X), std::to_string(e.x)}, {key(field::Y), std::to_string(e.y)}};
	return m;
}
static Message toFields(const ClientLogout&) {
	return typed(type::Logout);
}
static Message toFields(const ClientRematchRequest& e) {
	auto m = typed(type::RematchRequest);
	if (e.opponent) {
		m[key(field::Opponent)] = *e.opponent;
	}
	return m;
}
static Message toFields(const ClientRematchResponse& e) {
	auto m = typed(type::RematchResponse);
	m[key(field::Opponent)] = e.opponent;
	m[key(field::Response)] = std::string{toString(e.response)};
	return m;
}
static Message toFields(const ClientLeaderboard&) {
	return typed(type::Leaderboard);
}

// Server events

static Message toFields(const ServerSuccess& e) {
	auto m = typed(type::Success);
	m[key(field::Text)] = e.message;
	return m;
}
static Message toFields(const ServerError& e) {
	auto m = typed(type::Error);
	m[key(field::Text)] = e.message;
	return m;
}
static Message toFields(const ServerLoginSuccess& e) {
	auto m = typed(type::LoginSuccess);
	m[key(field::Username)] = e.username;
	m[key(field::Wins)]     = std::to_string(e.wins);
	m[key(field::Losses)]   = std::to_string(e.losses);
	m[key(field::Draws)]    = std::to_string(e.draws);
	return m;
}
static Message toFields(const ServerPlayersList& e) {
	auto m = typed(type::PlayersList);
	m[key(field::Players)] = joinPlayers(e.players);
	return m;
}
static Message toFields(const ServerChallenge& e) {
	auto m = typed(type::Challenge);
	m[key(field::Challenger)] = e.challenger;
	return m;
}
static Message toFields(const ServerChallengeResponse& e) {
	auto m = typed(type::ChallengeResponse);
	m[key(field::Opponent)] = e.opponent;
	m[key(field::Response)] = std::string{toString(e.response)};
	return m;
}
static Message toFields(const ServerStartGame& e) {
	auto m = typed(type::StartGame);
	m[key(field::GameId)]        = e.gameId;
	m[key(field::Player1)]       = e.player1;
	m[key(field::Player2)]       = e.player2;
	m[key(field::CurrentPlayer)] = e.currentPlayer;
	return m;
}
static Message toFields(const ServerUpdate& e) {
	auto m = typed(type::Update);
	m[key(field::GameId)]        = e.gameId;
	m[key(field::Board)]         = encodeBoard(e.board);
	m[key(field::CurrentPlayer)] = e.currentPlayer;
	return m;
}
static Message toFields(const ServerResult& e) {
	auto m = typed(type::Result);
	m[key(field::GameId)] = e.gameId;
	m[key(field::Result)] = std::string{toString(e.result)};
	m[key(field::Board)]  = encodeBoard(e.board);
	return m;
}
static Message toFields(const ServerOpponentDisconnected& e) {
	auto m = typed(type::OpponentDisconnected);
	m[key(field::GameId)] = e.gameId;
	return m;
}
static Message toFields(const ServerRematchRequest& e) {
	auto m = typed(type::RematchRequest);
	m[key(field::Requester)] = e.requester;
	return m;
}
static Message toFields(const ServerRematchResponse& e) {
	auto m = typed(type::RematchResponse);
	m[key(field::Opponent)] = e.opponent;
	m[key(field::Response)] = std::string{toString(e.response)};
	return m;
}
static Message toFields(const ServerLeaderboard& e) {
	std::string data;
	for (const auto& entry: e.entries) {
		if (!data.empty()) {
			data.push_back('|');
		}
		data += std::format("{},{},{},{},{}", entry.rank, entry.username, entry.wins, entry.losses, entry.draws);
	}

	auto m = typed(type::Leaderboard);
	m[key(field::Data)] = data;
	return m;
}

std::string toMessage(const ClientEvent& event) {
	return encode(std::visit([](const auto& e) { return toFields(e); }, event));
}

std::string toMessage(const ServerEvent& event) {
	return encode(std::visit([](const auto& e) { return toFields(e); }, event));
}

static std::optional<std::vector<LeaderboardEntry>> decodeLeaderboard(const std::string& data) {
	std::vector<LeaderboardEntry> entries;
	for (const auto& row: split(data, '|')) {
		const auto cols = split(row, ',');
		if (cols.size() != 5u) {
			return std::nullopt;
		}
		const auto rank   = toUnsigned(std::string_view{cols[0]});
		const auto wins   = toUnsigned(std::string_view{cols[2]});
		const auto losses = toUnsigned(std::string_view{cols[3]});
		const auto draws  = toUnsigned(std::string_view{cols[4]});
		if (!rank || !wins || !losses || !draws) {
			return std::nullopt;
		}
		entries.push_back(LeaderboardEntry{.rank = *rank, .username = cols[1], .wins = *wins, .losses = *losses, .draws = *draws});
	}
	return entries;
}

std::optional<ServerEvent> fromServerMessage(const std::string& message) {
	const auto decoded = decode(message);
	if (!decoded) {
		return {};
	}
	const auto& m = *decoded;

	const auto messageType = getString(m, key(field::Type));
	if (!messageType) {
		return {};
	}
	const auto str = [&](std::string_view name) { return getString(m, key(name)); };

	if (*messageType == type::Success || *messageType == type::Error) {
		const auto text = str(field::Text);
		if (!text) {
			return {};
		}
		if (*messageType == type::Success) {
			return ServerSuccess{*text};
		}
		return ServerError{*text};
	}

	if (*messageType == type::LoginSuccess) {
		const auto username = str(field::Username);
		const auto wins     = toUnsigned(str(field::Wins));
		const auto losses   = toUnsigned(str(field::Losses));
		const auto draws    = toUnsigned(str(field::Draws));
		if (!username || !wins || !losses || !draws) {
			return {};
		}
		return ServerLoginSuccess{.username = *username, .wins = *wins, .losses = *losses, .draws = *draws};
	}

	if (*messageType == type::PlayersList) {
		const auto players = str(field::Players);
		if (!players) {
			return {};
		}
		return ServerPlayersList{split(*players, ',')};
	}

	if (*messageType == type::Challenge) {
		const auto challenger = str(field::Challenger);
		if (!challenger) {
			return {};
		}
		return ServerChallenge{*challenger};
	}

	if (*messageType == type::ChallengeResponse || *messageType == type::RematchResponse) {
		const auto opponent = str(field::Opponent);
		const auto response = str(field::Response);
		if (!opponent || !response) {
			return {};
		}
		const auto parsed = responseFromString(*response);
		if (!parsed) {
			return {};
		}
		if (*messageType == type::ChallengeResponse) {
			return ServerChallengeResponse{.opponent = *opponent, .response = *parsed};
		}
		return ServerRematchResponse{.opponent = *opponent, .response = *parsed};
	}

	if (*messageType == type::StartGame) {
		const auto gameId  = str(field::GameId);
		const auto player1 = str(field::Player1);
		const auto player2 = str(field::Player2);
		const auto current = str(field::CurrentPlayer);
		if (!gameId || !player1 || !player2 || !current) {
			return {};
		}
		return ServerStartGame{.gameId = *gameId, .player1 = *player1, .player2 = *player2, .currentPlayer = *current};
	}

	if (*messageType == type::Update) {
		const auto gameId  = str(field::GameId);
		const auto current = str(field::CurrentPlayer);
		const auto cells   = getMap(m, key(field::Board));
		if (!gameId || !current || !cells) {
			return {};
		}
		const auto board = decodeBoard(*cells);
		if (!board) {
			return {};
		}
		return ServerUpdate{.gameId = *gameId, .board = *board, .currentPlayer = *current};
	}

	if (*messageType == type::Result) {
		const auto gameId = str(field::GameId);
		const auto text   = str(field::Result);
		const auto cells  = getMap(m, key(field::Board));
		if (!gameId || !text || !cells) {
			return {};
		}
		const auto result = outcomeFromString(*text);
		if (!result) {
			return {};
		}
		const auto board = decodeBoard(*cells);
		if (!board) {
			return {};
		}
		return ServerResult{.gameId = *gameId, .result = *result, .board = *board};
	}

	if (*messageType == type::OpponentDisconnected) {
		const auto gameId = str(field::GameId);
		if (!gameId) {
			return {};
		}
		return ServerOpponentDisconnected{*gameId};
	}

	if (*messageType == type::RematchRequest) {
		const auto requester = str(field::Requester);
		if (!requester) {
			return {};
		}
		return ServerRematchRequest{*requester};
	}

	if (*messageType == type::Leaderboard) {
		const auto data = str(field::Data);
		if (!data) {
			return {};
		}
		const auto entries = decodeLeaderboard(*data);
		if (!entries) {
			return {};
		}
		return ServerLeaderboard{*entries};
	}

	// Invalid
	return {};
}

} // namespace tictac::gameNet
