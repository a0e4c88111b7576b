#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tictac::gameNet {

//! Nested string map. Only used for move coordinates and board snapshots.
using FieldMap = std::map<std::string, std::string>;

//! A field is either a plain string or one level of nested string map.
using Value = std::variant<std::string, FieldMap>;

//! Decoded wire message: {"type":"MOVE","gameId":"..","data":{"x":"0","y":"1"}}
using Message = std::map<std::string, Value>;

//! Encode a message as a single line JSON object. Keys are emitted in sorted order.
//! Quotes and control characters are escaped, invalid UTF-8 is replaced, so the result never contains a line break.
std::string encode(const Message& message);

//! Decode a single line. Returns empty on anything that is not a JSON object of strings and
//! string maps: syntax errors, numbers, booleans, arrays, nesting deeper than one level or duplicate keys.
std::optional<Message> decode(std::string_view raw);

//! String field lookup. Empty if missing or if the field holds a nested map.
std::optional<std::string> getString(const Message& message, const std::string& key);

//! Nested map lookup. Empty if missing or if the field holds a plain string.
std::optional<FieldMap> getMap(const Message& message, const std::string& key);

} // namespace tictac::gameNet
