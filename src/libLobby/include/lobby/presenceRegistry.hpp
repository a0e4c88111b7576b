#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace tictac::lobby {

using SessionId = std::string;

//! Who is online and through which session. At most one session per username.
class PresenceRegistry {
public:
	//! Check and set in one step. False if username already has a session.
	bool markOnline(const std::string& username, const SessionId& sessionId);

	//! Remove username only if it is held by sessionId. Returns whether an entry was removed.
	//! \note Keeps a stale session from evicting a newer login of the same account.
	bool markOffline(const std::string& username, const SessionId& sessionId);

	bool isOnline(const std::string& username) const;
	std::optional<SessionId> sessionOf(const std::string& username) const;
	std::set<std::string> listOnline() const;

private:
	std::map<std::string, SessionId> m_online;
	mutable std::mutex m_mutex;
};

} // namespace tictac::lobby
