#include "gameNet/message.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <utility>
#include <vector>

namespace tictac::gameNet {

using nlohmann::json;

std::string encode(const Message& message) {
	json out = json::object();
	for (const auto& [key, value]: message) {
		if (const auto* text = std::get_if<std::string>(&value)) {
			out[key] = *text;
		} else {
			out[key] = std::get<FieldMap>(value);
		}
	}
	return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

//! Convert a parsed object. Every member must be a string or an object of strings.
static std::optional<Message> fromJson(const json& object) {
	Message result;
	for (const auto& member: object.items()) {
		const auto& value = member.value();
		if (value.is_string()) {
			result.emplace(member.key(), value.get<std::string>());
			continue;
		}
		if (!value.is_object()) {
			return std::nullopt;
		}

		FieldMap fields;
		for (const auto& field: value.items()) {
			if (!field.value().is_string()) {
				return std::nullopt;
			}
			fields.emplace(field.key(), field.value().get<std::string>());
		}
		result.emplace(member.key(), std::move(fields));
	}
	return result;
}

std::optional<Message> decode(std::string_view raw) {
	// json keeps the last of duplicate keys. Track the keys of every open object to refuse them instead.
	std::vector<std::set<std::string>> openObjects;
	bool duplicateKey = false;

	const json::parser_callback_t onEvent = [&](int, json::parse_event_t event, json& parsed) {
		switch (event) {
		case json::parse_event_t::object_start:
			openObjects.emplace_back();
			break;
		case json::parse_event_t::object_end:
			if (!openObjects.empty()) {
				openObjects.pop_back();
			}
			break;
		case json::parse_event_t::key:
			if (!openObjects.empty() && !openObjects.back().insert(parsed.get<std::string>()).second) {
				duplicateKey = true;
			}
			break;
		default:
			break;
		}
		return true;
	};

	const auto parsed = json::parse(raw.begin(), raw.end(), onEvent, false);
	if (parsed.is_discarded() || duplicateKey || !parsed.is_object()) {
		return std::nullopt;
	}
	return fromJson(parsed);
}

std::optional<std::string> getString(const Message& message, const std::string& key) {
	const auto it = message.find(key);
	if (it == message.end()) {
		return std::nullopt;
	}
	if (const auto* text = std::get_if<std::string>(&it->second)) {
		return *text;
	}
	return std::nullopt;
}

std::optional<FieldMap> getMap(const Message& message, const std::string& key) {
	const auto it = message.find(key);
	if (it == message.end()) {
		return std::nullopt;
	}
	if (const auto* fields = std::get_if<FieldMap>(&it->second)) {
		return *fields;
	}
	return std::nullopt;
}

} // namespace tictac::gameNet
