#include "lobby/pendingTable.hpp"

#include <map>

namespace tictac::lobby {

void PendingTable::put(const std::string& from, const std::string& to) {
	std::lock_guard lock{m_mutex};
	m_pending.insert_or_assign(from, to);
}

bool PendingTable::consume(const std::string& from, const std::string& to) {
	std::lock_guard lock{m_mutex};

	const auto it = m_pending.find(from);
	if (it == m_pending.end() || it->second != to) {
		return false;
	}
	m_pending.erase(it);
	return true;
}

std::optional<std::string> PendingTable::targetOf(const std::string& from) const {
	std::lock_guard lock{m_mutex};

	const auto it = m_pending.find(from);
	if (it == m_pending.end()) {
		return {};
	}
	return it->second;
}

std::size_t PendingTable::removeInvolving(const std::string& username) {
	std::lock_guard lock{m_mutex};
	return std::erase_if(m_pending, [&](const auto& entry) { return entry.first == username || entry.second == username; });
}

std::size_t PendingTable::size() const {
	std::lock_guard lock{m_mutex};
	return m_pending.size();
}

} // namespace tictac::lobby
