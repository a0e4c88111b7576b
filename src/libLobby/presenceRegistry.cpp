#include "lobby/presenceRegistry.hpp"

namespace tictac::lobby {

bool PresenceRegistry::markOnline(const std::string& username, const SessionId& sessionId) {
	std::lock_guard lock{m_mutex};
	return m_online.try_emplace(username, sessionId).second;
}

bool PresenceRegistry::markOffline(const std::string& username, const SessionId& sessionId) {
	std::lock_guard lock{m_mutex};

	const auto it = m_online.find(username);
	if (it == m_online.end() || it->second != sessionId) {
		return false;
	}
	m_online.erase(it);
	return true;
}

bool PresenceRegistry::isOnline(const std::string& username) const {
	std::lock_guard lock{m_mutex};
	return m_online.contains(username);
}

std::optional<SessionId> PresenceRegistry::sessionOf(const std::string& username) const {
	std::lock_guard lock{m_mutex};

	const auto it = m_online.find(username);
	if (it == m_online.end()) {
		return {};
	}
	return it->second;
}

std::set<std::string> PresenceRegistry::listOnline() const {
	std::lock_guard lock{m_mutex};

	std::set<std::string> names;
	for (const auto& [username, _]: m_online) {
		names.insert(username);
	}
	return names;
}

} // namespace tictac::lobby
