#include "network/nwEvents.hpp"

#include <memory>
#include <string_view>

namespace wiz::network {

static constexpr std::string_view TYPE_JOIN_ROOM   = "joinRoom";
static constexpr std::string_view TYPE_ROOM_JOINED = "roomJoined";
static constexpr std::string_view TYPE_STATE       = "state";
static constexpr std::string_view TYPE_ERROR       = "error";

static std::string write(const Json::Value& value) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	return Json::writeString(builder, value);
}

static std::optional<Json::Value> parse(const std::string& message) {
	Json::CharReaderBuilder builder;
	builder["collectComments"] = false;
	const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value root;
	std::string errors;
	if (!reader->parse(message.data(), message.data() + message.size(), &root, &errors) || !root.isObject()) {
		return std::nullopt;
	}
	if (!root.isMember("type") || !root["type"].isString()) {
		return std::nullopt;
	}
	return root;
}

static Json::Value typed(std::string_view type) {
	Json::Value root{Json::objectValue};
	root["type"] = std::string{type};
	return root;
}

static Json::Value toJson(const ClientJoinRoom& e) {
	auto root        = typed(TYPE_JOIN_ROOM);
	root["password"] = e.password;
	return root;
}
static Json::Value toJson(const ClientState& e) {
	auto root     = typed(TYPE_STATE);
	root["state"] = e.state;
	return root;
}
static Json::Value toJson(const ServerRoomJoined& e) {
	auto root        = typed(TYPE_ROOM_JOINED);
	root["password"] = e.password;
	root["state"]    = e.state;
	return root;
}
static Json::Value toJson(const ServerState& e) {
	auto root     = typed(TYPE_STATE);
	root["state"] = e.state;
	return root;
}
static Json::Value toJson(const ServerError& e) {
	auto root       = typed(TYPE_ERROR);
	root["message"] = e.message;
	return root;
}

std::string toMessage(const ClientEvent& event) {
	return std::visit([](const auto& e) { return write(toJson(e)); }, event);
}

std::string toMessage(const ServerEvent& event) {
	return std::visit([](const auto& e) { return write(toJson(e)); }, event);
}

std::optional<ClientEvent> fromClientMessage(const std::string& message) {
	const auto root = parse(message);
	if (!root) {
		return std::nullopt;
	}

	const auto type = (*root)["type"].asString();
	if (type == TYPE_JOIN_ROOM) {
		// A missing password selects the default room.
		const auto& password = (*root)["password"];
		if (!password.isNull() && !password.isString()) {
			return std::nullopt;
		}
		return ClientJoinRoom{.password = password.isString() ? password.asString() : RoomPassword{}};
	}
	if (type == TYPE_STATE) {
		if (!root->isMember("state")) {
			return std::nullopt;
		}
		return ClientState{.state = (*root)["state"]};
	}
	return std::nullopt;
}

std::optional<ServerEvent> fromServerMessage(const std::string& message) {
	const auto root = parse(message);
	if (!root) {
		return std::nullopt;
	}

	const auto type = (*root)["type"].asString();
	if (type == TYPE_ROOM_JOINED) {
		const auto& password = (*root)["password"];
		if (!password.isString()) {
			return std::nullopt;
		}
		return ServerRoomJoined{.password = password.asString(), .state = (*root)["state"]};
	}
	if (type == TYPE_STATE) {
		if (!root->isMember("state")) {
			return std::nullopt;
		}
		return ServerState{.state = (*root)["state"]};
	}
	if (type == TYPE_ERROR) {
		const auto& text = (*root)["message"];
		if (!text.isString()) {
			return std::nullopt;
		}
		return ServerError{.message = text.asString()};
	}
	return std::nullopt;
}

} // namespace wiz::network
