#include <boost/asio.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "sentinel/audit/AuditJournal.hpp"
#include "sentinel/config/PipelineConfig.hpp"
#include "sentinel/core/Errors.hpp"
#include "sentinel/runtime/Pipeline.hpp"
#include "sentinel/runtime/ReplayFeed.hpp"
#include "sentinel/runtime/Scheduler.hpp"

namespace asio = boost::asio;
using namespace sentinel;

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config <file.json>] [--replay <events.jsonl>] [--once]" << std::endl;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string replay_path;
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--replay" && i + 1 < argc) {
            replay_path = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    std::cout << "=========================================================\n";
    std::cout << "  SENTINEL - decision safety pipeline\n";
    std::cout << "=========================================================" << std::endl;

    try {
        config::PipelineConfig cfg = config_path.empty()
            ? config::PipelineConfig()
            : config::loadPipelineConfig(config_path);
        config::applyEnvironment(cfg);

        if (!cfg.runtime.data_dir.empty()) {
            std::filesystem::create_directories(cfg.runtime.data_dir);
        }

        auto journal = std::make_unique<audit::FileAuditJournal>(
            config::dataPath(cfg, cfg.audit.journal_file)
        );
        runtime::Pipeline pipeline(cfg, std::move(journal));

        if (!replay_path.empty()) {
            runtime::ReplayFeed feed(replay_path);
            for (const runtime::FeedEvent& ev : feed.load()) {
                pipeline.apply(ev);
            }
        }
        if (once) {
            std::cout << temporal::formatTemporalSummary(pipeline.complianceSummary("24h")) << std::endl;
            return 0;
        }

        asio::io_context ioc;
        runtime::Scheduler scheduler(ioc);

        scheduler.every("health", std::chrono::milliseconds(cfg.scheduler.staleness_ms), [&] {
            pipeline.onBrokerHeartbeat();
            pipeline.checkStaleness();
        });
        scheduler.every("cycle", std::chrono::milliseconds(cfg.scheduler.cycle_ms), [&] {
            pipeline.runCycle();
        });
        scheduler.every("rebalance", std::chrono::milliseconds(cfg.scheduler.rebalance_ms), [&] {
            capital::RebalanceResult r = pipeline.rebalance(capital::RebalanceMode::EXECUTE);
            std::cout << "[PIPELINE] rebalance " << capital::toString(r.status)
                      << " bucket=" << r.bucket << " cap=" << r.pool_cap << std::endl;
        });

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            std::cout << "\n[SENTINEL] signal " << sig << ", shutting down" << std::endl;
            scheduler.stop();
        });

        ioc.run();

        std::cout << temporal::formatTemporalSummary(pipeline.complianceSummary("24h")) << std::endl;
        std::cout << "[SENTINEL] audit records=" << pipeline.store().size()
                  << " dropped=" << pipeline.store().droppedWrites() << std::endl;
    } catch (const ConfigError& e) {
        std::cerr << "[SENTINEL] " << e.what() << std::endl;
        return 2;
    } catch (const StoreError& e) {
        std::cerr << "[SENTINEL] " << e.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[SENTINEL] data dir: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
