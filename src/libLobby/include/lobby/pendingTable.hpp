#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace tictac::lobby {

//! Outstanding invitations keyed by sender. One open invitation per sender, a new one replaces the old.
//! Used for both challenges and rematches with separate instances.
class PendingTable {
public:
	void put(const std::string& from, const std::string& to);

	//! Remove the invitation from -> to if it is the one on record. Check and remove in one step.
	bool consume(const std::string& from, const std::string& to);

	std::optional<std::string> targetOf(const std::string& from) const;

	//! Drop every invitation sent or received by username. Returns the number dropped.
	std::size_t removeInvolving(const std::string& username);

	std::size_t size() const;

private:
	std::map<std::string, std::string> m_pending; //!< Sender -> target.
	mutable std::mutex m_mutex;
};

} // namespace tictac::lobby
