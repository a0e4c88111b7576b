#include "lobby/accountRegistry.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace tictac::lobby {

AccountRegistry::AccountRegistry(IAccountStore& store) : m_store{store} {
	for (auto& account: m_store.loadAccounts()) {
		const auto name = account.username;
		if (!m_accounts.emplace(name, std::move(account)).second) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[AccountRegistry] Duplicate stored account '{}' ignored.", name));
		}
	}
}

bool AccountRegistry::registerAccount(const std::string& username, const std::string& secret) {
	std::lock_guard lock{m_mutex};

	const auto [it, inserted] = m_accounts.try_emplace(username, Account{.username = username, .secret = secret});
	if (!inserted) {
		return false;
	}

	persist();
	Logger().Log(Logging::LogLevel::Info, std::format("[AccountRegistry] Registered '{}'.", username));
	return true;
}

bool AccountRegistry::authenticate(const std::string& username, const std::string& secret) const {
	std::lock_guard lock{m_mutex};

	const auto it = m_accounts.find(username);
	return it != m_accounts.end() && it->second.secret == secret;
}

std::optional<Account> AccountRegistry::get(const std::string& username) const {
	std::lock_guard lock{m_mutex};

	const auto it = m_accounts.find(username);
	if (it == m_accounts.end()) {
		return {};
	}
	return it->second;
}

bool AccountRegistry::updateOutcome(const std::string& username, Outcome outcome) {
	std::lock_guard lock{m_mutex};

	const auto it = m_accounts.find(username);
	if (it == m_accounts.end()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[AccountRegistry] Outcome for unknown account '{}'.", username));
		return false;
	}

	switch (outcome) {
	case Outcome::Win:
		++it->second.wins;
		break;
	case Outcome::Loss:
		++it->second.losses;
		break;
	case Outcome::Draw:
		++it->second.draws;
		break;
	}

	persist();
	return true;
}

std::vector<Account> AccountRegistry::leaderboard(std::size_t limit) const {
	std::vector<Account> ranked;
	{
		std::lock_guard lock{m_mutex};
		ranked.reserve(m_accounts.size());
		for (const auto& [_, account]: m_accounts) {
			ranked.push_back(account);
		}
	}

	std::stable_sort(ranked.begin(), ranked.end(), [](const Account& lhs, const Account& rhs) {
		if (lhs.wins != rhs.wins) {
			return lhs.wins > rhs.wins;
		}
		return lhs.totalGames() > rhs.totalGames();
	});

	if (ranked.size() > limit) {
		ranked.resize(limit);
	}
	return ranked;
}

std::size_t AccountRegistry::size() const {
	std::lock_guard lock{m_mutex};
	return m_accounts.size();
}

void AccountRegistry::persist() {
	std::vector<Account> snapshot;
	snapshot.reserve(m_accounts.size());
	for (const auto& [_, account]: m_accounts) {
		snapshot.push_back(account);
	}

	if (!m_store.saveAccounts(snapshot)) {
		Logger().Log(Logging::LogLevel::Error, "[AccountRegistry] Saving accounts failed. Changes are kept in memory only.");
	}
}

} // namespace tictac::lobby
