#include <print>
#include <atomic>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <filesystem>

// Third-party
#include <nlohmann/json.hpp>

// Internal Modules
#include "../common/config.hpp"
#include "../common/catalog.hpp"
#include "balancer.hpp"
#include "cancellation_registry.hpp"
#include "local_job_scheduler.hpp"
#include "task_queue_manager.hpp"
#include "transfer.hpp"
#include "transfer_runner.hpp"
#include "zmq_chunk_store.hpp"
#include "ipc_server.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::atomic<bool> quit_requested{false};

void on_signal(int) {
    quit_requested = true;
}

} // namespace

// --- Main ---

int main(int argc, char* argv[]) {
    std::println("=========================================");
    std::println("        COMB TRANSFER DAEMON             ");
    std::println("=========================================");

    // 1. Config
    fs::path config_path = argc > 1 ? argv[1] : "comb.json";
    auto config = comb::load_config(config_path);
    if (!config) {
        std::println(stderr, "[Main] Cannot load {}: {}", config_path.string(), comb::to_string(config.error()));
        return 1;
    }
    if (config->credentials.empty()) {
        std::println(stderr, "[Main] No credentials configured in {}", config_path.string());
        return 1;
    }

    std::error_code ec;
    fs::create_directories(config->download_dir, ec);
    if (ec) {
        std::println(stderr, "[Main] Cannot create {}: {}", config->download_dir.string(), ec.message());
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // 2. Core services
    comb::CredentialBalancer balancer(comb::BalancerOptions{
        .cooldown = std::chrono::milliseconds(config->balancer.cooldown_ms),
        .max_operations = static_cast<int>(config->balancer.max_operations),
        .contention_step = std::chrono::milliseconds(config->balancer.contention_step_ms),
        .busy_backoff = std::chrono::milliseconds(config->balancer.busy_backoff_ms),
    });
    comb::CancellationRegistry cancellations;

    comb::Catalog catalog;
    if (auto opened = catalog.open(config->catalog_path.string()); !opened) {
        std::println(stderr, "[Main] {}: {}", config->catalog_path.string(), comb::to_string(opened.error()));
        return 1;
    }

    comb::ZmqChunkStore store(config->gateway_endpoint, config->channel_id);
    comb::ChunkedUploader uploader(balancer, store, config->credentials);
    comb::ChunkedDownloader downloader(balancer, store, config->credentials);

    // The runner needs the manager, the manager needs the scheduler; jobs only
    // arrive once the manager exists, by which time the runner is set.
    std::atomic<comb::TransferRunner*> runner_ptr{nullptr};
    comb::LocalJobScheduler scheduler(config->scheduler_workers,
        [&runner_ptr](const cell::JobDescriptor& job, std::stop_token st) {
            if (auto* runner = runner_ptr.load()) runner->run(job, st);
        });

    comb::TaskQueueManager manager(scheduler, cancellations, comb::ManagerOptions{
        .max_concurrent_uploads = config->max_concurrent_uploads,
        .max_concurrent_downloads = config->max_concurrent_downloads,
    });

    comb::TransferRunner runner(manager, cancellations, uploader, downloader, config->chunk_size);
    runner_ptr = &runner;

    // 3. IPC
    comb::IPCServer ipc(config->ipc_endpoint);
    ipc.set_services(&manager, &balancer, &catalog, config->download_dir.string());
    ipc.on_quit = [] { quit_requested = true; };

    runner.set_manifest_callback([&ipc, &catalog](const std::string& task_id, const comb::UploadResult& result) {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        if (auto saved = catalog.save_file(comb::to_catalog_file(result, now)); !saved) {
            std::println(stderr, "[Main] Catalog entry for {} not saved: {}", result.name, comb::to_string(saved.error()));
        }

        json payload = comb::to_json(result);
        payload["task_id"] = task_id;
        ipc.broadcast_event("upload_manifest", payload);
    });

    ipc.start();

    json info;
    info["credentials"] = config->credentials.size();
    info["gateway"] = config->gateway_endpoint;
    ipc.broadcast_event("ready", info);

    std::println("[Main] {} credentials, gateway {}", config->credentials.size(), config->gateway_endpoint);
    std::println("[Main] Daemon Running.");

    // Keep alive
    while (!quit_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // 4. Shutdown: stop taking commands, stop the jobs, then let the rest unwind
    std::println("[Main] Shutting down...");
    ipc.stop();
    scheduler.shutdown();
    runner_ptr = nullptr;
    manager.dispose();

    std::println("[Main] Bye.");
    return 0;
}
