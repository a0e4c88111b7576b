#include "lobby/accountStore.hpp"

#include "Logging.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace tictac::lobby {

static std::optional<unsigned> parseCounter(std::string_view text) {
	unsigned value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
		return std::nullopt;
	}
	return value;
}

//! Parse "username,secret,wins,losses,draws". Empty on any deviation.
static std::optional<Account> parseRecord(std::string_view line) {
	std::string_view cols[5];
	std::size_t count = 0;
	std::size_t start = 0;
	while (true) {
		const auto end = line.find(',', start);
		if (count == 5u) {
			return std::nullopt; // Too many columns.
		}
		cols[count++] = line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
		if (end == std::string_view::npos) {
			break;
		}
		start = end + 1;
	}
	if (count != 5u || cols[0].empty()) {
		return std::nullopt;
	}

	const auto wins   = parseCounter(cols[2]);
	const auto losses = parseCounter(cols[3]);
	const auto draws  = parseCounter(cols[4]);
	if (!wins || !losses || !draws) {
		return std::nullopt;
	}

	return Account{
	        .username = std::string{cols[0]},
	        .secret   = std::string{cols[1]},
	        .wins     = *wins,
	        .losses   = *losses,
	        .draws    = *draws,
	};
}

FileAccountStore::FileAccountStore(std::filesystem::path path) : m_path{std::move(path)} {
}

const std::filesystem::path& FileAccountStore::path() const {
	return m_path;
}

std::vector<Account> FileAccountStore::loadAccounts() {
	std::vector<Account> accounts;

	std::ifstream file(m_path);
	if (!file.is_open()) {
		Logger().Log(Logging::LogLevel::Info, std::format("[AccountStore] No account file at '{}'. Starting empty.", m_path.string()));
		return accounts;
	}

	std::string line;
	std::size_t lineNumber = 0;
	while (std::getline(file, line)) {
		++lineNumber;
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line.empty()) {
			continue;
		}

		auto account = parseRecord(line);
		if (!account) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[AccountStore] Skipping malformed line {} in '{}'.", lineNumber, m_path.string()));
			continue;
		}
		accounts.push_back(std::move(*account));
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[AccountStore] Loaded {} accounts from '{}'.", accounts.size(), m_path.string()));
	return accounts;
}

bool FileAccountStore::saveAccounts(const std::vector<Account>& accounts) {
	auto tmpPath = m_path;
	tmpPath += ".tmp";

	{
		std::ofstream file(tmpPath, std::ios::trunc);
		if (!file.is_open()) {
			Logger().Log(Logging::LogLevel::Error, std::format("[AccountStore] Could not open '{}' for writing.", tmpPath.string()));
			return false;
		}
		for (const auto& account: accounts) {
			file << std::format("{},{},{},{},{}\n", account.username, account.secret, account.wins, account.losses, account.draws);
		}
		file.flush();
		if (!file) {
			Logger().Log(Logging::LogLevel::Error, std::format("[AccountStore] Writing '{}' failed.", tmpPath.string()));
			return false;
		}
	}

	std::error_code ec;
	std::filesystem::rename(tmpPath, m_path, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[AccountStore] Could not replace '{}': {}", m_path.string(), ec.message()));
		std::filesystem::remove(tmpPath, ec);
		return false;
	}
	return true;
}

} // namespace tictac::lobby
