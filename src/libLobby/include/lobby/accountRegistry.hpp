#pragma once

#include "core/types.hpp"
#include "lobby/account.hpp"
#include "lobby/accountStore.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tictac::lobby {

//! In-memory account table backed by an IAccountStore.
//! Every mutation writes the full set through the store while the table lock is held,
//! so the persisted state always matches a state the registry was in.
//! \note A failed save is logged. The in-memory state stays authoritative.
class AccountRegistry {
public:
	explicit AccountRegistry(IAccountStore& store); //!< Loads all accounts from the store.

	//! Create an account with zeroed counters. False if the username is taken.
	bool registerAccount(const std::string& username, const std::string& secret);
	bool authenticate(const std::string& username, const std::string& secret) const;
	std::optional<Account> get(const std::string& username) const;

	//! Increment the counter matching outcome. False for unknown usernames.
	bool updateOutcome(const std::string& username, Outcome outcome);

	//! Accounts by wins descending, then total games descending. Equal entries keep username order.
	std::vector<Account> leaderboard(std::size_t limit) const;

	std::size_t size() const;

private:
	void persist(); //!< Caller holds m_mutex.

private:
	IAccountStore& m_store;

	std::map<std::string, Account> m_accounts;
	mutable std::mutex m_mutex;
};

} // namespace tictac::lobby
