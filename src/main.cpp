#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "broker/ConnectionHealth.h"
#include "broker/PaperBroker.h"
#include "broker/ResilientBrokerGateway.h"
#include "engine/TradingEngine.h"
#include "journal/EventJournalJsonl.h"
#include "monitor/SnapshotPublisher.h"
#include "monitor/StatusMonitor.h"
#include "common/PathUtils.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace trendpilot;

namespace {

// 시그널 핸들러에서는 플래그만 세운다
std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

void printUsage() {
    std::cout << "Usage: trendpilot [--config <path>] [--cycles <n>]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    int cycles_override = -1;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--cycles" && i + 1 < argc) {
            try {
                cycles_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --cycles value: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    std::cout << "\n";
    std::cout << "=============================================\n";
    std::cout << "       TrendPilot v1.0\n";
    std::cout << "       레짐 적응형 진입/포지션 관리 엔진\n";
    std::cout << "=============================================\n\n";

    auto& config = Config::getInstance();
    config.load(config_path);

    TradingConfig trading = config.getTradingConfig();
    if (cycles_override >= 0) {
        trading.engine.max_cycles = cycles_override;
        config.setTradingConfig(trading);
    }

    Logger::getInstance().initialize(trading.log_dir, trading.log_level);

    try {
        auto paper = std::make_shared<broker::PaperBroker>(trading.paper);
        for (const auto& symbol : trading.engine.symbols) {
            try {
                paper->loadSymbolFile(symbol);
            } catch (const DataUnavailable& e) {
                LOG_WARN("{}", e.what());
            }
        }

        auto health = std::make_shared<broker::ConnectionHealth>();
        auto gateway = std::make_shared<broker::ResilientBrokerGateway>(paper, trading.broker, health);
        auto journal = std::make_shared<journal::EventJournalJsonl>(
            utils::PathUtils::resolveRelativePath(trading.engine.journal_path));
        auto publisher = std::make_shared<monitor::SnapshotPublisher>();

        std::unique_ptr<monitor::StatusMonitor> status_monitor;
        if (trading.monitor.enabled) {
            status_monitor = std::make_unique<monitor::StatusMonitor>(trading.monitor, publisher);
            status_monitor->start();
        }

        engine::TradingEngine engine(trading, gateway, health, publisher, journal);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!engine.start()) {
            LOG_ERROR("Engine failed to start");
            return 1;
        }

        while (!g_stop_requested && engine.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (g_stop_requested) {
            LOG_INFO("Shutdown signal received");
        }
        engine.stop();

        if (status_monitor) {
            status_monitor->stop();
        }

        const auto& stats = engine.positions().stats();
        LOG_INFO("Orders placed {}, rejected {}, SL moves {}, TP moves {}, closes {}, time exits {}, scalp exits {}",
                 stats.orders_placed, stats.orders_rejected, stats.stop_modifications,
                 stats.tp_modifications, stats.closes, stats.time_exits, stats.scalp_exits);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
