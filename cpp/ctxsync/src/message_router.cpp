#include <ctxsync/message_router.hpp>
#include <ctxsync/protocol.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace ctxsync {

namespace {

// A field that is present but has the wrong type is an error; an absent field is not.
struct FieldError {
  std::string message;
};

template<typename T>
using Field = tl::expected<std::optional<T>, FieldError>;

Field<std::string> optionalString(const nlohmann::json& message, const char* name) {
  auto it = message.find(name);
  if (it == message.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return tl::make_unexpected(FieldError{std::string("'") + name + "' must be a string"});
  }
  return std::optional<std::string>{it->get<std::string>()};
}

Field<int64_t> optionalInteger(const nlohmann::json& message, const char* name) {
  auto it = message.find(name);
  if (it == message.end() || it->is_null()) {
    return std::optional<int64_t>{};
  }
  if (!it->is_number_integer()) {
    return tl::make_unexpected(FieldError{std::string("'") + name + "' must be an integer"});
  }
  return std::optional<int64_t>{it->get<int64_t>()};
}

nlohmann::json validationError(std::string_view text, std::string_view type) {
  return protocol::errorMessage(CtxError::ValidationError, text, type);
}

}  // namespace

MessageRouter::MessageRouter(
  ContextStore& store, SessionRegistry& registry, Authenticator& authenticator,
  BroadcastEngine& broadcaster, RouterOptions options
)
    : store_(store)
    , registry_(registry)
    , authenticator_(authenticator)
    , broadcaster_(broadcaster)
    , options_(std::move(options)) {
  handlers_ = {
    {protocol::kUpdateContext, &MessageRouter::handleUpdate},
    {protocol::kGetContext, &MessageRouter::handleGet},
    {protocol::kQueryContext, &MessageRouter::handleQuery},
    {protocol::kClearContext, &MessageRouter::handleClear},
    {protocol::kSetPriority, &MessageRouter::handleSetPriority},
    {protocol::kRefreshToken, &MessageRouter::handleRefreshToken},
    {protocol::kPing, &MessageRouter::handlePing},
    {protocol::kAuthenticate, &MessageRouter::handleAuthenticate},
  };
}

nlohmann::json MessageRouter::handle(
  const std::string& client_id, std::string_view raw, TimePoint now
) {
  auto session = registry_.find(client_id);
  if (!session) {
    return protocol::errorMessage(CtxError::AuthenticationError, "Client not authenticated");
  }
  registry_.touch(client_id, now);

  auto message = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
  if (message.is_discarded()) {
    return protocol::errorMessage(CtxError::ValidationError, "Invalid JSON");
  }
  if (!message.is_object()) {
    return protocol::errorMessage(CtxError::ValidationError, "Message must be a JSON object");
  }
  auto type = message.find("type");
  if (type == message.end() || !type->is_string()) {
    return protocol::errorMessage(CtxError::ValidationError, "Message has no 'type'");
  }
  const auto& type_name = type->get_ref<const std::string&>();
  auto handler = handlers_.find(type_name);
  if (handler == handlers_.end()) {
    return protocol::errorMessage(
      CtxError::ValidationError, "Unknown message type: " + type_name, type_name
    );
  }

  try {
    return (this->*(handler->second))(*session, message);
  } catch (const std::exception& exc) {
    error() << "handling " << type_name << " from client " << client_id << " failed: " << exc.what();
    return protocol::errorMessage(CtxError::Unspecified, "Internal error", type_name);
  }
}

bool MessageRouter::isElevated(const Principal& principal) const {
  return options_.elevated_roles.count(principal.role) > 0;
}

bool MessageRouter::ownsSource(const Principal& principal, const std::string& source) {
  const auto& user = principal.user_id;
  return source == user ||
         (source.size() > user.size() && source.compare(0, user.size(), user) == 0 &&
          source[user.size()] == '_');
}

nlohmann::json MessageRouter::handleUpdate(const Session& session, const nlohmann::json& message) {
  constexpr auto type = protocol::kUpdateContext;
  auto context = message.find("context");
  if (context == message.end() || !context->is_object()) {
    return validationError("'context' must be an object", type);
  }
  auto source = optionalString(message, "source");
  if (!source) {
    return validationError(source.error().message, type);
  }
  auto priority = optionalInteger(message, "priority");
  if (!priority) {
    return validationError(priority.error().message, type);
  }
  auto key = optionalString(message, "key");
  if (!key) {
    return validationError(key.error().message, type);
  }
  if (*key && (*key)->empty()) {
    return validationError("'key' must not be empty", type);
  }

  std::string entry_source = source->value_or(session.principal.user_id + "_" + session.client_id);
  std::string entry_key;
  if (*key) {
    entry_key = **key;
  } else {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
      Clock::now().time_since_epoch()
    );
    entry_key = entry_source + "_" + std::to_string(micros.count());
  }

  auto result = store_.update(entry_key, *context, entry_source, *priority);
  if (!result.has_value()) {
    return protocol::errorMessage(result.error(), "Payload is not serializable", type);
  }
  if (result->evicted > 0) {
    info() << "update of " << entry_key << " evicted " << result->evicted << " entries";
  }
  broadcaster_.publish(result->version);

  auto reply = protocol::makeMessage(protocol::kUpdateAck);
  reply["key"] = result->key;
  reply["accepted"] = result->accepted;
  reply["total_tokens"] = result->total_tokens;
  reply["entry_count"] = result->entry_count;
  return reply;
}

nlohmann::json MessageRouter::handleGet(const Session&, const nlohmann::json&) {
  return protocol::snapshotMessage(store_.get(), protocol::kContext);
}

nlohmann::json MessageRouter::handleQuery(const Session&, const nlohmann::json& message) {
  constexpr auto type = protocol::kQueryContext;
  const nlohmann::json* query = &message;
  if (auto nested = message.find("query"); nested != message.end() && !nested->is_null()) {
    if (!nested->is_object()) {
      return validationError("'query' must be an object", type);
    }
    query = &*nested;
  }
  auto source = optionalString(*query, "source");
  if (!source) {
    return validationError(source.error().message, type);
  }
  auto min_priority = optionalInteger(*query, "min_priority");
  if (!min_priority) {
    return validationError(min_priority.error().message, type);
  }

  QueryFilter filter;
  filter.source = *source;
  filter.min_priority = *min_priority;
  auto data = nlohmann::json::object();
  for (const auto& entry : store_.query(filter)) {
    data[entry.key] = protocol::entryToJson(entry);
  }
  auto reply = protocol::makeMessage(protocol::kQueryResponse);
  reply["data"] = std::move(data);
  return reply;
}

nlohmann::json MessageRouter::handleClear(const Session& session, const nlohmann::json& message) {
  constexpr auto type = protocol::kClearContext;
  auto source = optionalString(message, "source");
  if (!source) {
    return validationError(source.error().message, type);
  }
  std::optional<std::vector<std::string>> keys;
  if (auto it = message.find("keys"); it != message.end() && !it->is_null()) {
    if (!it->is_array()) {
      return validationError("'keys' must be an array of strings", type);
    }
    keys.emplace();
    for (const auto& key : *it) {
      if (!key.is_string()) {
        return validationError("'keys' must be an array of strings", type);
      }
      keys->push_back(key.get<std::string>());
    }
  }
  if (keys && *source) {
    return validationError("Specify either 'keys' or 'source', not both", type);
  }

  const bool elevated = isElevated(session.principal);
  ClearResult result;
  if (!keys && !*source) {
    if (!elevated) {
      return protocol::errorMessage(
        CtxError::PermissionDenied, "Clearing the whole context requires an elevated role", type
      );
    }
    result = store_.clear();
  } else if (*source) {
    if (!elevated && !ownsSource(session.principal, **source)) {
      return protocol::errorMessage(
        CtxError::PermissionDenied, "Cannot clear context written by another user", type
      );
    }
    result = store_.clearSource(**source);
  } else if (elevated) {
    result = store_.clear(keys);
  } else {
    auto cleared = store_.clearIf(keys, [&session](const Entry& entry) {
      return ownsSource(session.principal, entry.source);
    });
    if (!cleared.has_value()) {
      return protocol::errorMessage(
        CtxError::PermissionDenied, "Cannot clear context written by another user", type
      );
    }
    result = *cleared;
  }

  info() << "user " << session.principal.user_id << " cleared " << result.removed
         << " context entries";
  broadcaster_.publish(result.version);

  auto reply = protocol::makeMessage(protocol::kClearAck);
  reply["removed"] = result.removed;
  reply["total_tokens"] = result.total_tokens;
  reply["entry_count"] = result.entry_count;
  return reply;
}

nlohmann::json MessageRouter::handleSetPriority(const Session&, const nlohmann::json& message) {
  constexpr auto type = protocol::kSetPriority;
  auto key = optionalString(message, "key");
  if (!key || !*key) {
    return validationError("'key' must be a string", type);
  }
  auto priority = optionalInteger(message, "priority");
  if (!priority || !*priority) {
    return validationError("'priority' must be an integer", type);
  }

  auto result = store_.setPriority(**key, **priority);
  if (!result.has_value()) {
    return protocol::errorMessage(result.error(), "No context entry with key " + **key, type);
  }
  broadcaster_.publish(result->version);

  auto reply = protocol::makeMessage(protocol::kPriorityAck);
  reply["key"] = result->key;
  reply["priority"] = result->priority;
  reply["total_tokens"] = result->total_tokens;
  reply["entry_count"] = result->entry_count;
  return reply;
}

nlohmann::json MessageRouter::handleRefreshToken(
  const Session& session, const nlohmann::json& message
) {
  constexpr auto type = protocol::kRefreshToken;
  auto token = optionalString(message, "token");
  if (!token || !*token || (*token)->empty()) {
    return validationError("New token required for refresh", type);
  }

  auto credential = authenticator_.verify(**token);
  if (!credential.has_value()) {
    return protocol::errorMessage(credential.error(), "Invalid refresh token", type);
  }
  if (credential->principal.user_id != session.principal.user_id) {
    warn() << "client " << session.client_id << " tried to refresh with a credential for "
           << credential->principal.user_id;
    return protocol::errorMessage(
      CtxError::PermissionDenied, "Refresh token belongs to a different user", type
    );
  }
  registry_.setCredentialExpiry(session.client_id, credential->expires_at);
  info() << "token refreshed for user " << session.principal.user_id << " (client "
         << session.client_id << ")";

  auto reply = protocol::makeMessage(protocol::kTokenRefreshed);
  reply["success"] = true;
  if (credential->expires_at) {
    reply["expires_at"] = protocol::isoTimestamp(*credential->expires_at);
  }
  return reply;
}

nlohmann::json MessageRouter::handlePing(const Session&, const nlohmann::json&) {
  return protocol::makeMessage(protocol::kPong);
}

nlohmann::json MessageRouter::handleAuthenticate(const Session&, const nlohmann::json&) {
  return validationError("Connection is already authenticated", protocol::kAuthenticate);
}

}  // namespace ctxsync
