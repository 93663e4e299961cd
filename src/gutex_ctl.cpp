#include "cache/sparse_cache.h"
#include "fetcher/cached_fetcher.h"
#include "mirror/mirror_upstream.h"
#include "mirror/origin_racer.h"
#include "navigator/navigator.h"
#include "utilities/config.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <json/json.h>
#include <memory>
#include <string>
#include <vector>

using namespace gutex;

namespace {

struct Services {
  std::shared_ptr<OriginRacer> racer;
  std::shared_ptr<SparseCache> cache;
};

Services makeServices(const Config &config) {
  Services s;
  s.racer = std::make_shared<OriginRacer>(std::make_shared<HttpTransport>(),
                                          config.racer);
  s.cache = std::make_shared<SparseCache>(
      std::make_shared<MirrorUpstream>(s.racer), config.cache);
  return s;
}

void printJson(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  std::cout << Json::writeString(builder, value) << std::endl;
}

void usage() {
  std::cout << "Usage: gutex_ctl [--config FILE] <command>\n"
            << "  mirrors\n"
            << "  size <id>\n"
            << "  range <id> <start> <end>\n"
            << "  read <id> <percent> [chunkSize] [pages]\n"
            << "  stats <id>\n"
            << "  validate <id>\n"
            << "  invalidate <id>\n"
            << "  prune <keep>\n"
            << "  metrics\n";
}

int mirrorsCommand(const Services &s) {
  s.racer->initialize();
  auto status = s.racer->getStatus();
  std::cout << "Mirror\tProvider\tLocation\tOK\tFail\tAvgMs" << std::endl;
  for (const auto &entry : status.mirrors) {
    std::cout << entry.mirror.baseUrl << '\t' << entry.mirror.provider << '\t'
              << entry.mirror.location << '\t';
    if (entry.stats) {
      std::cout << entry.stats->successes << '\t' << entry.stats->failures
                << '\t';
      if (entry.stats->avgResponseTimeMs)
        std::cout << std::fixed << std::setprecision(1)
                  << *entry.stats->avgResponseTimeMs;
      else
        std::cout << '-';
    } else {
      std::cout << "0\t0\t-";
    }
    std::cout << std::endl;
  }
  std::cout << status.mirrorCount << " mirrors" << std::endl;
  return 0;
}

int readCommand(const Services &s, const Config &config,
                const std::vector<std::string> &args) {
  auto fetcher = std::make_shared<CachedFetcher>(args[1], s.cache, config.fetcher);
  NavigatorOptions options = config.navigator;
  if (args.size() >= 4)
    options.chunkSize = std::stoul(args[3]);
  const int pages = args.size() >= 5 ? std::stoi(args[4]) : 1;

  Navigator navigator(fetcher, wholeResource(fetcher->getFileSize()), options);
  Position position = navigator.goToPercent(std::stod(args[2]));
  for (int page = 0; page < pages; ++page) {
    if (page > 0) {
      Position next = navigator.moveForward(position);
      if (next.byteStart == position.byteStart)
        break;
      position = next;
    }
    std::cout << "--- word " << position.wordIndex << ", bytes "
              << position.byteStart << "-" << position.byteEnd << " ("
              << position.percent << "%) ---\n"
              << position.formattedText << "\n";
  }
  std::cout.flush();
  return 0;
}

int run(const std::vector<std::string> &args, const Config &config) {
  const std::string &cmd = args[0];
  Services s = makeServices(config);

  if (cmd == "mirrors")
    return mirrorsCommand(s);
  if (cmd == "metrics") {
    s.racer->initialize();
    std::cout << MetricsRegistry::instance().toPrometheus();
    return 0;
  }
  if (cmd == "prune" && args.size() >= 2) {
    auto removed = s.cache->pruneByLRU(std::stoul(args[1]));
    for (const auto &id : removed)
      std::cout << "Removed " << id << std::endl;
    std::cout << removed.size() << " resources pruned" << std::endl;
    return 0;
  }
  if (args.size() < 2) {
    usage();
    return 1;
  }

  const std::string &id = args[1];
  if (cmd == "size") {
    std::cout << s.cache->getFileSize(id) << std::endl;
    return 0;
  }
  if (cmd == "range" && args.size() >= 4) {
    std::string bytes =
        s.cache->getRange(id, std::stoll(args[2]), std::stoll(args[3]));
    std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    std::cout.flush();
    return 0;
  }
  if (cmd == "read" && args.size() >= 3)
    return readCommand(s, config, args);
  if (cmd == "stats") {
    Json::Value out;
    auto stats = s.cache->getResourceStats(id);
    out["resource"] = stats ? stats->toJson() : Json::Value(Json::nullValue);
    out["cache"] = s.cache->getStats().toJson();
    printJson(out);
    return 0;
  }
  if (cmd == "validate") {
    bool valid = s.cache->forceValidation(id);
    std::cout << (valid ? "Cache valid" : "Cache invalidated or empty")
              << std::endl;
    return valid ? 0 : 2;
  }
  if (cmd == "invalidate") {
    s.cache->invalidate(id);
    std::cout << "Invalidated " << id << std::endl;
    return 0;
  }
  usage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string configPath;
  if (args.size() >= 2 && args[0] == "--config") {
    configPath = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage();
    return 1;
  }

  Config config;
  try {
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
    config = loadConfig(configPath);
    applyCacheRoot(config);
    const std::string logFile = logFilePath(config);
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(logFile).parent_path(), ec);
    Logger::init(logFile, config.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  try {
    return run(args, config);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Invalid argument: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
