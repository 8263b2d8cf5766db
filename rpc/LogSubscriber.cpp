#include "LogSubscriber.h"
#include "../lib/Utilities.h"

#include <httplib.h>

namespace ppi {
namespace rpc {

LogSubscriber::LogSubscriber() : Module("rpc.ws") {}

LogSubscriber::~LogSubscriber() { close(); }

Roe<void> LogSubscriber::init(const Config &config) {
  std::string scheme;
  std::string host;
  uint16_t port = 0;
  std::string path;
  if (!utl::parseUrl(config.url, scheme, host, port, path)) {
    return Error(E_CONFIG, "Invalid WebSocket url: " + config.url);
  }
  if (scheme != "ws" && scheme != "wss") {
    return Error(E_CONFIG, "Unsupported WebSocket scheme: " + scheme);
  }
  config_ = config;
  return {};
}

nlohmann::json LogSubscriber::makeSubscribeRequest(const std::string &programId,
                                                   const std::string &commitment) {
  nlohmann::json filter;
  filter["mentions"] = nlohmann::json::array({programId});
  nlohmann::json options;
  options["commitment"] = commitment;

  nlohmann::json request;
  request["jsonrpc"] = "2.0";
  request["id"] = SUBSCRIBE_REQUEST_ID;
  request["method"] = "logsSubscribe";
  request["params"] = nlohmann::json::array({filter, options});
  return request;
}

Roe<void> LogSubscriber::subscribe(const std::string &programId) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (config_.url.empty()) {
    return Error(E_CONFIG, "WebSocket url not configured");
  }

  if (pClient_) {
    pClient_->close();
  }
  closed_ = false;
  subscriptionId_ = -1;
  pClient_ = std::make_unique<httplib::ws::WebSocketClient>(config_.url);
  if (!pClient_->is_valid()) {
    return Error(E_CONFIG, "Unusable WebSocket url: " + config_.url);
  }
  pClient_->set_read_timeout(config_.readTimeoutSec, 0);
  if (!pClient_->connect()) {
    return Error(E_CONNECT, "Failed to connect to " + config_.url);
  }
  if (!pClient_->send(makeSubscribeRequest(programId, config_.commitment).dump())) {
    return Error(E_SUBSCRIBE, "Failed to send logsSubscribe");
  }
  auto *pClient = pClient_.get();
  lock.unlock();

  for (int i = 0; i < MAX_CONFIRM_MESSAGES; ++i) {
    std::string text;
    if (closed_ || pClient->read(text) == httplib::ws::Fail) {
      return Error(E_DISCONNECTED, "Connection lost before subscription was confirmed");
    }

    nlohmann::json message;
    try {
      message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception &e) {
      log().warning << "Ignoring malformed message: " << e.what();
      continue;
    }

    if (!message.is_object() || !message.contains("id") ||
        message["id"] != SUBSCRIBE_REQUEST_ID) {
      continue;
    }
    if (message.contains("error")) {
      return Error(E_SUBSCRIBE, "logsSubscribe rejected: " + message["error"].dump());
    }
    if (!message.contains("result") || !message["result"].is_number_integer()) {
      return Error(E_SUBSCRIBE, "Unexpected logsSubscribe response: " + message.dump());
    }
    subscriptionId_ = message["result"].get<int64_t>();
    log().info << "Subscribed to logs of " << programId << " (subscription "
               << subscriptionId_.load() << ")";
    return {};
  }
  return Error(E_SUBSCRIBE, "No logsSubscribe confirmation received");
}

std::optional<LogNotification> LogSubscriber::parseNotification(const nlohmann::json &message) {
  if (!message.is_object() || message.value("method", "") != "logsNotification") {
    return std::nullopt;
  }

  try {
    const auto &result = message.at("params").at("result");
    const auto &value = result.at("value");

    LogNotification notification;
    notification.signature = value.at("signature").get<std::string>();
    notification.slot = result.at("context").at("slot").get<uint64_t>();
    notification.failed = value.contains("err") && !value["err"].is_null();
    if (value.contains("logs") && value["logs"].is_array()) {
      notification.logs = value["logs"].get<std::vector<std::string>>();
    }
    return notification;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

Roe<LogNotification> LogSubscriber::next() {
  httplib::ws::WebSocketClient *pClient = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pClient = pClient_.get();
  }
  if (pClient == nullptr || subscriptionId_ < 0) {
    return Error(E_DISCONNECTED, "Not subscribed");
  }

  while (!closed_) {
    std::string text;
    if (pClient->read(text) == httplib::ws::Fail) {
      return Error(E_DISCONNECTED, "WebSocket connection lost");
    }

    nlohmann::json message;
    try {
      message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception &e) {
      log().warning << "Ignoring malformed message: " << e.what();
      continue;
    }

    auto notification = parseNotification(message);
    if (notification) {
      return *notification;
    }
    log().debug << "Ignoring message: " << text.substr(0, 200);
  }
  return Error(E_DISCONNECTED, "Log stream closed");
}

void LogSubscriber::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  if (!pClient_) {
    return;
  }
  if (pClient_->is_open() && subscriptionId_ >= 0) {
    nlohmann::json request;
    request["jsonrpc"] = "2.0";
    request["id"] = SUBSCRIBE_REQUEST_ID + 1;
    request["method"] = "logsUnsubscribe";
    request["params"] = nlohmann::json::array({subscriptionId_.load()});
    if (!pClient_->send(request.dump())) {
      log().debug << "logsUnsubscribe could not be sent";
    }
  }
  pClient_->close();
}

} // namespace rpc
} // namespace ppi
