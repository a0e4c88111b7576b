#pragma once

#include "lobby/account.hpp"

#include <filesystem>
#include <vector>

namespace tictac::lobby {

//! Persistence backend of the account registry. Always reads and writes the full set.
class IAccountStore {
public:
	virtual ~IAccountStore() = default;

	virtual std::vector<Account> loadAccounts()                    = 0;
	virtual bool saveAccounts(const std::vector<Account>& accounts) = 0; //!< Returns false if nothing was written.
};

//! Stores one account per line: username,secret,wins,losses,draws
//! \note A missing file is an empty store. Malformed lines are skipped on load.
//!       Saving writes a sibling temporary file and renames it over the target.
class FileAccountStore : public IAccountStore {
public:
	explicit FileAccountStore(std::filesystem::path path);

	std::vector<Account> loadAccounts() override;
	bool saveAccounts(const std::vector<Account>& accounts) override;

	const std::filesystem::path& path() const;

private:
	std::filesystem::path m_path;
};

} // namespace tictac::lobby
