#include "../indexer/Indexer.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../rpc/LogSubscriber.h"
#include "../rpc/RpcClient.h"
#include "../store/SqliteCheckpointStore.h"
#include "../store/SqliteDb.h"
#include "../store/SqliteEventStore.h"

#include <CLI/CLI.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace {
std::atomic<bool> g_running{true};
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}

const std::string CONFIG_FILE = "config.json";
const std::string LOG_FILE = "indexer.log";

std::string resolvePath(const std::string &workDir, const std::string &path) {
  std::filesystem::path p(path);
  if (p.is_absolute() || path == ":memory:") {
    return path;
  }
  return (std::filesystem::path(workDir) / p).string();
}

/**
 * POST each notification as JSON to the configured URL.
 * The client is only used from the notifier thread.
 */
class WebhookSink {
public:
  ppi::Roe<void> init(const std::string &url) {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    if (!ppi::utl::parseUrl(url, scheme, host, port, path_)) {
      return ppi::Error(1, "Invalid notify url: " + url);
    }
    if (scheme != "http" && scheme != "https") {
      return ppi::Error(1, "Unsupported notify scheme: " + scheme);
    }
    pClient_ = std::make_unique<httplib::Client>(scheme + "://" + host + ":" +
                                                 std::to_string(port));
    pClient_->set_connection_timeout(5, 0);
    pClient_->set_read_timeout(10, 0);
    return {};
  }

  ppi::Roe<void> send(const ppi::Notifier::Notification &notification) {
    nlohmann::json body;
    body["kind"] = notification.kind;
    body["signature"] = notification.signature;
    body["slot"] = notification.slot;
    body["event"] = notification.payload;

    auto res = pClient_->Post(path_, body.dump(), "application/json");
    if (!res) {
      return ppi::Error(2, "Webhook request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
      return ppi::Error(3, "Webhook returned HTTP " + std::to_string(res->status));
    }
    return {};
  }

private:
  std::string path_;
  std::unique_ptr<httplib::Client> pClient_;
};

int runInit(const std::string &workDir) {
  auto logger = ppi::logging::getLogger("ppi");
  std::string configPath = resolvePath(workDir, CONFIG_FILE);

  ppi::Indexer::Config config;
  auto result = ppi::utl::writeToNewFile(configPath, config.ltsToJson().dump(2));
  if (!result) {
    logger.error << "Failed to write " << configPath << ": " << result.error().message;
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }

  std::cout << "Default configuration written to " << configPath << "\n";
  std::cout << "Set \"programId\" before starting: pp-indexer -d " << workDir << "\n";
  return 0;
}

/** Handlers for all kinds until the domain rules are wired in */
void registerDefaultHandlers(ppi::Indexer &indexer) {
  auto logger = ppi::logging::getLogger("ppi.handlers");
  for (auto kind : ppi::ALL_EVENT_KINDS) {
    indexer.registerHandler(
        kind, [logger](ppi::IEventStore::Transaction &, const ppi::ParsedEvent &event) mutable
        -> ppi::Roe<void> {
          logger.debug << ppi::getKindName(event.kind) << " " << event.signature << " #"
                       << event.instructionIndex << "." << event.eventIndex << " "
                       << event.fieldsToJson().dump();
          return {};
        });
  }
}

struct RunOptions {
  bool debugMode{false};
  bool printStatus{false};
  bool reindexMode{false};
  uint64_t reindexFrom{0};
  uint64_t reindexTo{0};
  std::string signature;
};

int runIndexer(const std::string &workDir, const RunOptions &options) {
  auto logger = ppi::logging::getLogger("ppi");

  auto roeJson = ppi::utl::loadJsonFile(resolvePath(workDir, CONFIG_FILE));
  if (!roeJson) {
    std::cerr << "Error: Failed to load " << CONFIG_FILE << ": " << roeJson.error().message
              << "\n";
    std::cerr << "Create one with: pp-indexer -d " << workDir << " --init\n";
    return 1;
  }

  ppi::Indexer::Config config;
  auto roeConfig = config.ltsFromJson(roeJson.value());
  if (!roeConfig) {
    std::cerr << "Error: Invalid configuration: " << roeConfig.error().message << "\n";
    return 1;
  }

  ppi::logging::Level level = ppi::logging::Level::INFO;
  ppi::logging::parseLevel(config.logLevel, level);
  if (options.debugMode) {
    level = ppi::logging::Level::DEBUG;
  }
  auto rootLogger = ppi::logging::getRootLogger();
  rootLogger.setLevel(level);
  rootLogger.addFileHandler(resolvePath(workDir, LOG_FILE), level);

  logger.info << "Running indexer with work directory: " << workDir;
  logger.info << "Program " << config.programId << ", commitment " << config.commitment;

  auto spDb = std::make_shared<ppi::SqliteDb>();
  spDb->redirectLogger("ppi");
  auto roeDb = spDb->open(resolvePath(workDir, config.database));
  if (!roeDb) {
    logger.error << "Failed to open database: " << roeDb.error().message;
    return 1;
  }

  auto spStore = std::make_shared<ppi::SqliteEventStore>(spDb);
  spStore->redirectLogger("ppi");
  auto spCheckpoint = std::make_shared<ppi::SqliteCheckpointStore>(spDb);
  spCheckpoint->redirectLogger("ppi");

  auto spRpc = std::make_shared<ppi::rpc::RpcClient>();
  spRpc->redirectLogger("ppi");
  ppi::rpc::RpcClient::Config rpcConfig;
  rpcConfig.url = config.rpcUrl;
  rpcConfig.programId = config.programId;
  rpcConfig.commitment = config.commitment;
  auto roeRpc = spRpc->init(rpcConfig);
  if (!roeRpc) {
    logger.error << "Failed to set up RPC client: " << roeRpc.error().message;
    return 1;
  }

  std::shared_ptr<ppi::rpc::LogSubscriber> spStream;
  if (!config.wsUrl.empty() && config.source.useLive) {
    spStream = std::make_shared<ppi::rpc::LogSubscriber>();
    spStream->redirectLogger("ppi");
    ppi::rpc::LogSubscriber::Config wsConfig;
    wsConfig.url = config.wsUrl;
    wsConfig.commitment = config.commitment;
    auto roeWs = spStream->init(wsConfig);
    if (!roeWs) {
      logger.warning << "Live stream disabled: " << roeWs.error().message;
      spStream.reset();
    }
  }

  ppi::Indexer indexer;
  indexer.redirectLogger("ppi");

  ppi::Indexer::Collaborators collaborators;
  collaborators.spRpc = spRpc;
  collaborators.spStream = spStream;
  collaborators.spStore = spStore;
  collaborators.spCheckpoint = spCheckpoint;

  registerDefaultHandlers(indexer);

  auto spWebhook = std::make_shared<WebhookSink>();
  if (!config.notifyUrl.empty()) {
    auto roeWebhook = spWebhook->init(config.notifyUrl);
    if (!roeWebhook) {
      logger.error << roeWebhook.error().message;
      return 1;
    }
    indexer.setNotificationSink([spWebhook](const ppi::Notifier::Notification &notification) {
      return spWebhook->send(notification);
    });
  }

  auto roeInit = indexer.init(config, collaborators);
  if (!roeInit) {
    logger.error << "Failed to initialize indexer: " << roeInit.error().message;
    return 1;
  }

  if (!options.signature.empty()) {
    auto roeReprocess = indexer.reprocess(options.signature);
    if (!roeReprocess) {
      logger.error << "Reprocess failed: " << roeReprocess.error().message;
      std::cerr << "Error: Reprocess failed: " << roeReprocess.error().message << "\n";
      return 1;
    }
    const auto &outcome = roeReprocess.value();
    std::cout << "Transaction " << options.signature << ": " << outcome.inserted
              << " new event(s), " << outcome.duplicates << " already stored"
              << (outcome.skipped ? " (skipped)" : "") << "\n";
    return 0;
  }

  if (options.reindexMode) {
    auto roeReindex = indexer.reindex(options.reindexFrom, options.reindexTo);
    if (!roeReindex) {
      logger.error << "Reindex failed: " << roeReindex.error().message;
      std::cerr << "Error: Reindex failed: " << roeReindex.error().message << "\n";
      return 1;
    }
    std::cout << "Replayed " << roeReindex.value() << " transaction(s)\n";
    std::cout << indexer.getStatus().toJson().dump(2) << "\n";
    return 0;
  }

  auto roeStart = indexer.start();
  if (!roeStart) {
    logger.error << "Failed to start indexer: " << roeStart.error().message;
    std::cerr << "Error: Failed to start indexer: " << roeStart.error().message << "\n";
    return 1;
  }

  std::cout << "Indexer running\n";
  std::cout << "Work directory: " << workDir << "\n";
  std::cout << "Press Ctrl+C to stop the indexer...\n";
  if (options.printStatus) {
    std::cout << indexer.getStatus().toJson().dump(2) << "\n";
  }

  // Wake up for the health line; an errored indexer is restarted from there
  auto interval = std::chrono::seconds(config.healthLogIntervalSec);
  while (g_running.load()) {
    {
      std::unique_lock<std::mutex> lock(g_mutex);
      if (config.healthLogIntervalSec == 0) {
        g_cv.wait(lock, [] { return !g_running.load(); });
      } else if (g_cv.wait_for(lock, interval, [] { return !g_running.load(); })) {
        break;
      }
    }
    if (!g_running.load()) {
      break;
    }

    indexer.logHealth();
    if (indexer.getState() == ppi::Indexer::State::ERRORED) {
      logger.warning << "Restarting errored indexer";
      auto roeRestart = indexer.start();
      if (!roeRestart) {
        logger.error << "Restart failed: " << roeRestart.error().message;
      }
    }
  }

  auto roeStop = indexer.stop();
  if (!roeStop) {
    logger.error << "Failed to stop indexer: " << roeStop.error().message;
  }
  if (options.printStatus) {
    std::cout << indexer.getStatus().toJson().dump(2) << "\n";
  }
  logger.info << "Indexer stopped";
  return indexer.getState() == ppi::Indexer::State::STOPPED ? 0 : 1;
}
} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"pp-indexer - Event indexer for the pp program"};

  std::string workDir;
  app.add_option("-d,--work-dir", workDir, "Work directory (required)")->required();

  bool initMode = false;
  app.add_flag("--init", initMode, "Write a default config.json and exit");

  RunOptions options;
  app.add_flag("--debug", options.debugMode, "Enable debug logging (overrides logLevel)");

  auto *optFrom = app.add_option("--reindex-from", options.reindexFrom,
                                 "Replay from this slot and exit (requires --reindex-to)");
  auto *optTo = app.add_option("--reindex-to", options.reindexTo, "Last slot to replay");
  optFrom->needs(optTo);
  optTo->needs(optFrom);

  auto *optSignature = app.add_option("--signature", options.signature,
                                      "Process this one transaction and exit");
  optSignature->excludes(optFrom);
  optSignature->excludes(optTo);

  app.add_flag("--status", options.printStatus, "Print the status JSON after start and on exit");

  app.footer("Example:\n"
             "  pp-indexer -d /path/to/work-dir --init\n"
             "  pp-indexer -d /path/to/work-dir [--debug] [--status]\n"
             "  pp-indexer -d /path/to/work-dir --reindex-from 1000 --reindex-to 2000\n"
             "  pp-indexer -d /path/to/work-dir --signature <transaction signature>\n"
             "\n"
             "The work directory holds config.json, indexer.log and the event database.\n");

  CLI11_PARSE(app, argc, argv);

  if (initMode) {
    return runInit(workDir);
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  options.reindexMode = optFrom->count() > 0;
  return runIndexer(workDir, options);
}
