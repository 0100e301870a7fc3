// src/coordinator/main.cpp
#include "coordinator/handlers/multisig/include/MultiSigMessageRouter.hpp"
#include "coordinator/network/multisig_server/include/MultiSigHttpsServer.hpp"
#include "common/env/EnvManager.hpp"
#include "common/utils/clock/Clock.hpp"
#include "common/utils/logger/Logger.hpp"
#include "multisig/audit/include/LogAuditSink.hpp"
#include "multisig/execution/include/ChainConfig.hpp"
#include "multisig/execution/include/ChainRegistry.hpp"
#include "multisig/service/include/MultiSigService.hpp"
#include "multisig/service/include/MultiSigSettings.hpp"
#include "multisig/storage/include/MultiSigStoreFactory.hpp"
#include <signal.h>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace multisig_engine;
using namespace multisig_engine::env;
using namespace multisig_engine::multisig;
using namespace multisig_engine::coordinator::handlers;
using namespace multisig_engine::coordinator::network::multisig_server;

static std::atomic<bool> g_shutdown_requested{false};
static std::condition_variable g_shutdown_cv;
static std::mutex g_shutdown_mutex;

void SignalHandler(int signal)
{
    (void)signal;
    g_shutdown_requested.store(true);
    g_shutdown_cv.notify_one();
}

void PrintUsage(const char* program_name)
{
    MSIG_LOG_INFOF("MultiSigCoordinator", "Usage: %s [ENVIRONMENT]", program_name);
    MSIG_LOG_INFOF("MultiSigCoordinator", "       %s --env [ENVIRONMENT]", program_name);
    MSIG_LOG_INFOF("MultiSigCoordinator", "       %s --config [FILE]", program_name);
    MSIG_LOG_INFO("MultiSigCoordinator", "Environment: local (default), dev, qa, production -> env/.env.<name>");
}

int main(int argc, char* argv[])
{
    utils::Logger::Instance().Initialize(std::getenv("MSIG_LOG_FILE"));
    MSIG_LOG_INFO("MultiSigCoordinator", "=== MultiSig Engine Coordinator ===");

    std::string env_type = "local";
    std::string config_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--env" && i + 1 < argc) {
            env_type = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else {
            env_type = arg;
            break;
        }
    }

    bool loaded = config_file.empty()
        ? EnvManager::Instance().Initialize(env_type)
        : EnvManager::Instance().InitializeFromFile(config_file);
    if (!loaded) {
        MSIG_LOG_ERRORF("MultiSigCoordinator", "Failed to load environment: %s",
            config_file.empty() ? env_type.c_str() : config_file.c_str());
        return 1;
    }

    try {
        const EnvConfig& config = Config::Get();

        // ========================================
        // 1. 설정 로드
        // ========================================
        config.ValidateRequired({
            "TLS_CERT_PATH",
            "TLS_CERT_CA",
            "TLS_CERT_SERVER",
            "TLS_KEY_SERVER"
        });

        MultiSigSettings settings = LoadMultiSigSettings(config);
        OnChainSettings onchain = LoadOnChainSettings(config);
        HttpsServerConfig server_config = LoadHttpsServerConfig(config);

        MSIG_LOG_INFOF("MultiSigCoordinator", "Proposal TTL: %u hours", settings.proposal_ttl_hours);
        MSIG_LOG_INFOF("MultiSigCoordinator", "Store: %s", settings.store_type.c_str());
        MSIG_LOG_INFOF("MultiSigCoordinator", "On-chain execution: %s (%zu chains)",
            onchain.enabled ? "enabled" : "disabled", onchain.chains.size());

        // ========================================
        // 2. 서비스 구성
        // ========================================
        std::unique_ptr<IMultiSigStore> store = MultiSigStoreFactory::Create(settings.store_type, settings.store_path);
        std::unique_ptr<ChainRegistry> chains = ChainRegistry::FromSettings(onchain);
        LogAuditSink audit;
        utils::SystemClock clock;

        MultiSigService service(*store, *chains, audit, clock, settings);
        MultiSigMessageRouter router(service);

        // ========================================
        // 3. HTTPS 서버
        // ========================================
        MultiSigHttpsServer server(server_config, router);

        signal(SIGINT, SignalHandler);
        signal(SIGTERM, SignalHandler);

        if (!server.Initialize()) {
            MSIG_LOG_ERROR("MultiSigCoordinator", "Failed to initialize HTTPS server");
            return 1;
        }

        if (!server.Start()) {
            MSIG_LOG_ERROR("MultiSigCoordinator", "Failed to start HTTPS server");
            return 1;
        }

        MSIG_LOG_INFOF("MultiSigCoordinator", "Serving POST %s on %s:%u",
            MULTISIG_TARGET, server_config.bind_address.c_str(), server_config.bind_port);

        {
            std::unique_lock<std::mutex> lock(g_shutdown_mutex);
            // 시그널 핸들러에서는 잠금을 잡지 않으므로 주기적으로 재확인
            while (!g_shutdown_cv.wait_for(lock, std::chrono::seconds(1), [] { return g_shutdown_requested.load(); })) {
            }
        }

        MSIG_LOG_INFO("MultiSigCoordinator", "Shutdown initiated...");
        server.Stop();

        MSIG_LOG_INFO("MultiSigCoordinator", "Stopped cleanly");
        return 0;

    } catch (const ConfigMissingException& e) {
        MSIG_LOG_ERRORF("MultiSigCoordinator", "Configuration error: %s", e.what());
        MSIG_LOG_ERRORF("MultiSigCoordinator", "Please check your env/.env.%s file.", env_type.c_str());
        return 1;
    } catch (const ConfigFormatException& e) {
        MSIG_LOG_ERRORF("MultiSigCoordinator", "Configuration error: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        MSIG_LOG_FATALF("MultiSigCoordinator", "Fatal error: %s", e.what());
        return 1;
    }
}
