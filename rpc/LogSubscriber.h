#ifndef PP_INDEXER_LOG_SUBSCRIBER_H
#define PP_INDEXER_LOG_SUBSCRIBER_H

#include "../interface/ILogStream.hpp"
#include "../lib/Module.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace httplib {
namespace ws {
class WebSocketClient;
}
} // namespace httplib

namespace ppi {
namespace rpc {

/**
 * Program log stream over the Solana PubSub WebSocket (logsSubscribe).
 *
 * subscribe() and next() are called from the consuming thread only;
 * close() may be called from any thread to unblock a pending next().
 */
class LogSubscriber : public ILogStream, public Module {
public:
  struct Config {
    std::string url;
    std::string commitment{ "confirmed" };
    int readTimeoutSec{ 60 };
  };

  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_CONNECT = -2;
  static constexpr const int32_t E_SUBSCRIBE = -3;
  static constexpr const int32_t E_DISCONNECTED = -4;

  static constexpr const int SUBSCRIBE_REQUEST_ID = 2;
  // Messages read while waiting for the subscription confirmation
  static constexpr const int MAX_CONFIRM_MESSAGES = 16;

  LogSubscriber();
  ~LogSubscriber() override;

  Roe<void> init(const Config &config);

  Roe<void> subscribe(const std::string &programId) override;
  Roe<LogNotification> next() override;
  void close() override;

  static nlohmann::json makeSubscribeRequest(const std::string &programId,
                                             const std::string &commitment);

  /**
   * Interpret one message from the socket.
   * @return the notification, nullopt for messages that are not log notifications
   */
  static std::optional<LogNotification> parseNotification(const nlohmann::json &message);

private:
  Config config_;
  std::mutex mutex_;
  std::unique_ptr<httplib::ws::WebSocketClient> pClient_;
  std::atomic<bool> closed_{ false };
  std::atomic<int64_t> subscriptionId_{ -1 };
};

} // namespace rpc
} // namespace ppi

#endif // PP_INDEXER_LOG_SUBSCRIBER_H
