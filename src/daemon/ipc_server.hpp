#pragma once
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <zmq.hpp>
#include <nlohmann/json.hpp>

#include "../common/catalog.hpp"
#include "task_queue_manager.hpp"
#include "transfer.hpp"

namespace comb {

    class CredentialBalancer;

    using json = nlohmann::json;

    // --- JSON mapping shared by the server and its clients ---

    json to_json(const Task& task);
    json to_json(const TaskProgress& progress);
    json to_json(const UploadResult& result);
    json to_json(const CatalogFile& file);

    // payload: {"files": [{"path": ..., "name": ..., "size": ...}]}
    std::vector<UploadRequest> parse_upload_requests(const json& payload);
    // payload: {"files": [{"file_name", "message_id", "size", "target_path", "chunks": [...]}]}
    // A missing target_path lands in download_dir under the file name.
    std::vector<DownloadRequest> parse_download_requests(const json& payload, const std::string& download_dir);

    // --- Catalog mapping ---

    CatalogFile to_catalog_file(const UploadResult& result, int64_t uploaded_at);
    DownloadRequest to_download_request(const CatalogFile& file, const std::string& download_dir);

    // Local control socket (ROUTER). Commands come in as JSON, everything goes
    // back out as events to the last client that spoke.
    class IPCServer {
    public:
        explicit IPCServer(std::string endpoint);
        ~IPCServer();

        void start();
        void stop();

        void set_services(TaskQueueManager* manager, CredentialBalancer* balancer,
                          Catalog* catalog, std::string download_dir);
        void broadcast_event(const std::string& type, const json& payload);

        void handle_command(const json& cmd);

        std::function<void()> on_quit;

    private:
        void loop();
        void pump_manager_events();

        std::string endpoint_;

        TaskQueueManager* manager_ = nullptr;
        CredentialBalancer* balancer_ = nullptr;
        Catalog* catalog_ = nullptr;
        std::string download_dir_;

        std::shared_ptr<EventChannel<TaskProgress>::Subscription> progress_sub_;
        std::shared_ptr<EventChannel<Task>::Subscription> completed_sub_;
        TaskQueueManager::SubscriptionId tasks_sub_ = 0;
        std::atomic<bool> tasks_dirty_{false};
        std::chrono::steady_clock::time_point last_tasks_push_{};

        std::atomic<bool> running_{false};
        std::jthread thread_;

        std::mutex queue_mutex_;
        std::queue<std::string> event_queue_;
        zmq::context_t ctx_;

        std::string last_client_id_;
    };

} // namespace comb
