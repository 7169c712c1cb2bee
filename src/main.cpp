#include "alerts/alert_evaluator.hpp"
#include "alerts/alert_scheduler.hpp"
#include "analysis/feed_query.hpp"
#include "analysis/neo_feed_service.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/notification_manager.hpp"
#include "io/feed/feed_fetcher.hpp"
#include "io/feed/http_feed_client.hpp"
#include "io/rules/json_file_rule_repository.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

// Global atomic flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

namespace {

struct CommandLine {
  std::string config_path = "config.ini";
  std::optional<std::string> start_date;
  std::optional<std::string> end_date;
  bool watch = false;
  std::optional<double> upcoming_ld;
  std::optional<std::string> search_query;
  std::optional<size_t> top_hazardous;
  bool hazardous_only = false;
  std::optional<FeedQuery::PageRequest> page;
};

void print_usage(const char *program) {
  std::cout
      << "Usage: " << program << " [config.ini] [options]\n"
      << "  --start YYYY-MM-DD   First day of the feed range (default: today)\n"
      << "  --end YYYY-MM-DD     Last day of the feed range (default: start)\n"
      << "  --hazardous          Only potentially hazardous objects\n"
      << "  --upcoming LD        List close approaches within LD lunar "
         "distances\n"
      << "  --page N --size M    Print one page of the scored objects\n"
      << "  --search TEXT        Find objects by name or id\n"
      << "  --top N              The N highest-risk hazardous objects\n"
      << "  --watch              Run the alert scheduler until interrupted\n";
}

std::optional<CommandLine> parse_command_line(int argc, char *argv[]) {
  CommandLine cmd;
  FeedQuery::PageRequest page;
  bool has_page = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc)
        return std::nullopt;
      return std::string(argv[++i]);
    };

    if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    } else if (arg == "--watch") {
      cmd.watch = true;
    } else if (arg == "--hazardous") {
      cmd.hazardous_only = true;
    } else if (arg == "--start" || arg == "--end" || arg == "--upcoming" ||
               arg == "--page" || arg == "--size" || arg == "--search" ||
               arg == "--top") {
      auto value = next_value();
      if (!value) {
        std::cerr << "Missing value for " << arg << std::endl;
        return std::nullopt;
      }
      if (arg == "--start") {
        cmd.start_date = *value;
      } else if (arg == "--end") {
        cmd.end_date = *value;
      } else if (arg == "--search") {
        cmd.search_query = *value;
      } else if (arg == "--upcoming") {
        auto ld = Utils::string_to_number<double>(*value);
        if (!ld || *ld < 0.0) {
          std::cerr << "Invalid lunar distance: " << *value << std::endl;
          return std::nullopt;
        }
        cmd.upcoming_ld = *ld;
      } else {
        auto number = Utils::string_to_number<size_t>(*value);
        if (!number) {
          std::cerr << "Invalid number for " << arg << ": " << *value
                    << std::endl;
          return std::nullopt;
        }
        if (arg == "--top") {
          cmd.top_hazardous = *number;
        } else {
          (arg == "--page" ? page.page : page.size) = *number;
          has_page = true;
        }
      }
    } else if (!arg.empty() && arg.front() != '-') {
      cmd.config_path = std::string(arg);
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return std::nullopt;
    }
  }

  if (has_page)
    cmd.page = page;
  return cmd;
}

int print_feed(NeoFeedService &service, const CommandLine &cmd) {
  SnapshotPtr snapshot;
  if (cmd.start_date)
    snapshot = service.fetch_feed(*cmd.start_date,
                                  cmd.end_date.value_or(*cmd.start_date));
  else
    snapshot = service.fetch_today();

  if (cmd.upcoming_ld) {
    auto approaches = FeedQuery::upcoming_close_approaches(
        *snapshot, *cmd.upcoming_ld, cmd.hazardous_only);
    std::cout << JsonFormatter::close_approaches_to_json_object(approaches)
                     .dump(2)
              << std::endl;
    return 0;
  }

  if (cmd.search_query) {
    auto results = FeedQuery::search(*snapshot, *cmd.search_query,
                                     FeedQuery::MAX_SEARCH_LIMIT);
    std::cout << JsonFormatter::page_to_json_object(FeedQuery::paginate(
                     results, cmd.page.value_or(FeedQuery::PageRequest{
                                  1, FeedQuery::MAX_PAGE_SIZE})))
                     .dump(2)
              << std::endl;
    return 0;
  }

  if (cmd.top_hazardous) {
    auto top = FeedQuery::top_hazardous(*snapshot, *cmd.top_hazardous);
    std::cout << JsonFormatter::page_to_json_object(FeedQuery::paginate(
                     top, FeedQuery::PageRequest{1, FeedQuery::MAX_PAGE_SIZE}))
                     .dump(2)
              << std::endl;
    return 0;
  }

  if (cmd.page || cmd.hazardous_only) {
    FeedQuery::FeedFilter filter;
    filter.hazardous_only = cmd.hazardous_only;
    auto objects = FeedQuery::filter(*snapshot, filter);
    auto page = FeedQuery::paginate(
        objects, cmd.page.value_or(FeedQuery::PageRequest{1, FeedQuery::MAX_PAGE_SIZE}));
    std::cout << JsonFormatter::page_to_json_object(page).dump(2) << std::endl;
    return 0;
  }

  std::cout << JsonFormatter::format_snapshot_to_json(*snapshot, 2)
            << std::endl;
  return 0;
}

int run_watch(NeoFeedService &service, const Config::AppConfig &config) {
  if (!config.alerts.enabled) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "--watch requested but [Alerts] enabled = false");
    return 1;
  }

  auto repository =
      std::make_shared<JsonFileAlertRuleRepository>(config.alerts.rules_path);
  auto notifier = std::make_shared<NotificationManager>(config.notifications);

  AlertEvaluator::Options options;
  options.cooldown = std::chrono::seconds(config.alerts.cooldown_seconds);
  auto evaluator = std::make_shared<AlertEvaluator>(
      [&service]() { return service.fetch_today(); }, repository, notifier,
      options);

  AlertScheduler scheduler(
      evaluator, std::chrono::seconds(config.alerts.check_interval_seconds));
  scheduler.start();

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Watching for alert conditions every "
          << config.alerts.check_interval_seconds
          << "s. Press Ctrl+C to stop.");
  while (!g_shutdown_requested)
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  scheduler.stop();
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  auto cmd = parse_command_line(argc, argv);
  if (!cmd) {
    print_usage(argv[0]);
    return 1;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  config_manager.load_configuration(cmd->config_path);
  Config::AppConfig config = *config_manager.get_config();
  if (config.logging.log_levels.empty())
    Config::apply_default_log_levels(config.logging);

  if (const char *env_key = std::getenv("NASA_API_KEY");
      env_key != nullptr && *env_key != '\0')
    config.feed.api_key = env_key;

  // --- Initialize Logging ---
  LogManager::instance().configure(config.logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "NEO Watch starting up...");
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  // --- Wire Core Components ---
  auto client = std::make_shared<HttpFeedClient>(
      config.feed.base_url,
      std::chrono::seconds(config.feed.request_timeout_seconds));

  PayloadCache::Config cache_config;
  cache_config.max_entries = config.cache.max_entries;
  auto payload_cache = std::make_shared<PayloadCache>(cache_config);

  FeedFetcher::Options fetch_options;
  fetch_options.api_key = config.feed.api_key;
  fetch_options.cache_ttl = std::chrono::seconds(config.feed.cache_ttl_seconds);
  fetch_options.max_range_days = config.feed.max_range_days;
  fetch_options.use_fallback_samples = config.feed.use_fallback_samples;

  auto fetcher =
      std::make_shared<FeedFetcher>(client, payload_cache, fetch_options);

  NeoFeedService::SnapshotCache::Config snapshot_cache_config;
  snapshot_cache_config.max_entries = config.cache.max_entries;
  NeoFeedService service(fetcher, snapshot_cache_config);

  try {
    if (cmd->watch)
      return run_watch(service, config);
    return print_feed(service, *cmd);
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE, "Invalid request: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const FeedUnavailableError &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Feed unavailable (" << upstream_error_to_string(e.kind())
                             << "): " << e.what());
    return 3;
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Unhandled error: " << e.what());
    return 4;
  }
}
