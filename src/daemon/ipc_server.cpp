//
// Created by cv2 on 23.12.2025.
//

#include "ipc_server.hpp"
#include "balancer.hpp"
#include <print>
#include <format>
#include <filesystem>

namespace comb {

namespace {

constexpr auto TASKS_PUSH_INTERVAL = std::chrono::milliseconds(500);

// Remote names are untrusted: keep only the last component so the file lands in download_dir
std::string download_target(const std::string& download_dir, const std::string& name) {
    auto leaf = std::filesystem::path(name).filename();
    if (leaf.empty() || leaf == "." || leaf == "..") leaf = "download";
    return (std::filesystem::path(download_dir) / leaf).string();
}

} // namespace

// --- JSON mapping ---

json to_json(const Task& task) {
    json j;
    j["id"] = task.id;
    j["category"] = to_string(task.category());
    j["status"] = to_string(task.status);
    j["progress"] = task.progress;
    j["name"] = task.display_name;
    j["size"] = task.size_bytes;
    if (task.error) j["error"] = *task.error;
    return j;
}

json to_json(const TaskProgress& progress) {
    json j;
    j["id"] = progress.task_id;
    j["category"] = to_string(progress.category);
    j["progress"] = progress.progress;
    j["name"] = progress.display_name;
    return j;
}

json to_json(const UploadResult& result) {
    json j;
    j["file_id"] = result.file_id;
    j["name"] = result.name;
    j["size"] = result.size_bytes;
    j["total_chunks"] = result.total_chunks;
    j["chunks"] = json::array();
    for (const auto& c : result.chunks) {
        json chunk;
        chunk["index"] = c.index;
        chunk["message_id"] = c.message_id;
        chunk["remote_file_id"] = c.remote_file_id;
        chunk["digest"] = c.digest;
        chunk["size"] = c.size_bytes;
        j["chunks"].push_back(chunk);
    }
    return j;
}

std::vector<UploadRequest> parse_upload_requests(const json& payload) {
    std::vector<UploadRequest> out;
    for (const auto& f : payload.value("files", json::array())) {
        UploadRequest r;
        r.source_path = f.value("path", "");
        if (r.source_path.empty()) continue;
        r.display_name = f.value("name", std::filesystem::path(r.source_path).filename().string());
        r.size_bytes = f.value("size", uint64_t{0});
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<DownloadRequest> parse_download_requests(const json& payload, const std::string& download_dir) {
    std::vector<DownloadRequest> out;
    for (const auto& f : payload.value("files", json::array())) {
        DownloadRequest r;
        r.file_name = f.value("file_name", "");
        if (r.file_name.empty()) continue;
        r.message_id = f.value("message_id", int64_t{0});
        r.size_bytes = f.value("size", uint64_t{0});
        r.target_path = f.value("target_path", download_target(download_dir, r.file_name));
        for (const auto& c : f.value("chunks", json::array())) {
            r.chunks.push_back(RemoteChunk{
                c.value("remote_file_id", ""),
                c.value("digest", ""),
                c.value("size", uint64_t{0}),
            });
        }
        out.push_back(std::move(r));
    }
    return out;
}

json to_json(const CatalogFile& file) {
    json j;
    j["file_id"] = file.file_id;
    j["name"] = file.name;
    j["size"] = file.size_bytes;
    j["uploaded_at"] = file.uploaded_at;
    j["total_chunks"] = file.chunks.size();
    return j;
}

// --- Catalog mapping ---

CatalogFile to_catalog_file(const UploadResult& result, int64_t uploaded_at) {
    CatalogFile file;
    file.file_id = result.file_id;
    file.name = result.name;
    file.size_bytes = result.size_bytes;
    file.uploaded_at = uploaded_at;
    for (const auto& c : result.chunks) {
        file.chunks.push_back(CatalogChunk{static_cast<uint32_t>(c.index), c.message_id,
                                           c.remote_file_id, c.digest, c.size_bytes});
    }
    return file;
}

DownloadRequest to_download_request(const CatalogFile& file, const std::string& download_dir) {
    DownloadRequest r;
    r.file_name = file.name;
    r.size_bytes = file.size_bytes;
    r.message_id = file.chunks.empty() ? 0 : file.chunks.front().message_id;
    r.target_path = download_target(download_dir, file.name);
    for (const auto& c : file.chunks) {
        r.chunks.push_back(RemoteChunk{c.remote_file_id, c.digest, c.size_bytes});
    }
    return r;
}

// --- Server ---

IPCServer::IPCServer(std::string endpoint) : endpoint_(std::move(endpoint)) {}

IPCServer::~IPCServer() {
    stop();
    if (manager_ && tasks_sub_ != 0) manager_->unsubscribe_all_tasks(tasks_sub_);
}

void IPCServer::set_services(TaskQueueManager* manager, CredentialBalancer* balancer,
                             Catalog* catalog, std::string download_dir) {
    manager_ = manager;
    balancer_ = balancer;
    catalog_ = catalog;
    download_dir_ = std::move(download_dir);

    if (manager_) {
        progress_sub_ = manager_->progress_updates().subscribe();
        completed_sub_ = manager_->completed_events().subscribe();
        tasks_sub_ = manager_->subscribe_all_tasks([this](const std::vector<Task>&) {
            tasks_dirty_ = true;
        });
    }
}

void IPCServer::start() {
    running_ = true;
    thread_ = std::jthread([this] { loop(); });
}

void IPCServer::stop() {
    running_ = false;
    // Context shutdown breaks the blocking poll
    ctx_.shutdown();
    if (thread_.joinable()) thread_.join();
}

void IPCServer::broadcast_event(const std::string& type, const json& payload) {
    json j;
    j["type"] = "event";
    j["event"] = type;
    j["payload"] = payload;

    std::string serialized = j.dump();

    {
        std::lock_guard lock(queue_mutex_);
        event_queue_.push(serialized);
    }
}

void IPCServer::pump_manager_events() {
    if (progress_sub_) {
        for (const auto& p : progress_sub_->drain()) broadcast_event("progress", to_json(p));
    }
    if (completed_sub_) {
        for (const auto& t : completed_sub_->drain()) broadcast_event("task_completed", to_json(t));
    }

    // The merged view changes on every progress tick; push it at a slower pace
    auto now = std::chrono::steady_clock::now();
    if (manager_ && tasks_dirty_ && now - last_tasks_push_ >= TASKS_PUSH_INTERVAL) {
        tasks_dirty_ = false;
        last_tasks_push_ = now;
        json payload;
        payload["tasks"] = json::array();
        for (const auto& t : manager_->all_tasks()) payload["tasks"].push_back(to_json(t));
        broadcast_event("tasks", payload);
    }
}

void IPCServer::loop() {
    try {
        zmq::socket_t socket(ctx_, zmq::socket_type::router);
        socket.bind(endpoint_);

        std::println("[IPC] Server listening (ROUTER) on {}", endpoint_);

        while (running_) {
            zmq::pollitem_t items[] = {
                { static_cast<void*>(socket), 0, ZMQ_POLLIN, 0 }
            };
            zmq::poll(items, 1, std::chrono::milliseconds(20));

            // 1. Handle incoming command
            if (items[0].revents & ZMQ_POLLIN) {
                std::vector<zmq::message_t> frames;

                // Read until RCVMORE is 0
                while (true) {
                    zmq::message_t& frame = frames.emplace_back();
                    if (!socket.recv(frame, zmq::recv_flags::none)) {
                        frames.pop_back();
                        break;
                    }
                    if (!socket.get(zmq::sockopt::rcvmore)) break;
                }

                if (frames.size() >= 2) {
                    // Frame 0: identity (always added by ROUTER)
                    const auto& id_frame = frames[0];
                    last_client_id_.assign(static_cast<const char*>(id_frame.data()), id_frame.size());

                    // Payload is the last frame, delimiters may sit in between
                    const auto& payload_frame = frames.back();
                    std::string payload_str(static_cast<const char*>(payload_frame.data()), payload_frame.size());

                    try {
                        auto j = json::parse(payload_str);
                        if (j.contains("command")) {
                            handle_command(j);
                        }
                    } catch (const json::exception& e) {
                        std::println(stderr, "[IPC] Bad command: {}", e.what());
                        json err; err["msg"] = e.what();
                        broadcast_event("error", err);
                    }
                } else {
                    std::println(stderr, "[IPC] Dropping message with {} frame(s), expected identity and payload", frames.size());
                }
            }

            // 2. Collect manager events
            pump_manager_events();

            // 3. Flush outgoing events
            std::queue<std::string> outgoing;
            {
                std::lock_guard lock(queue_mutex_);
                outgoing.swap(event_queue_);
            }

            // Only send if there is a client to route to
            if (!last_client_id_.empty()) {
                while (!outgoing.empty()) {
                    std::string s = std::move(outgoing.front());
                    outgoing.pop();

                    // ROUTER send: [identity] [payload]
                    socket.send(zmq::buffer(last_client_id_), zmq::send_flags::sndmore);
                    socket.send(zmq::buffer(s), zmq::send_flags::dontwait);
                }
            }
        }
    } catch (const zmq::error_t& e) {
        // ETERM is the regular way out after stop()
        if (e.num() != ETERM) std::println(stderr, "[IPC] Error: {}", e.what());
    }
}

void IPCServer::handle_command(const json& j) {
    std::string cmd = j.at("command").get<std::string>();
    const json payload = j.value("payload", json::object());

    if (cmd == "quit") {
        std::println("[IPC] Quit requested");
        running_ = false;
        if (on_quit) on_quit();
        return;
    }

    if (!manager_) {
        json err; err["msg"] = "Daemon is not ready";
        broadcast_event("error", err);
        return;
    }

    if (cmd == "add_uploads") {
        auto ids = manager_->add_upload_tasks(parse_upload_requests(payload));
        json evt; evt["category"] = "upload"; evt["ids"] = ids;
        broadcast_event("tasks_added", evt);
    }
    else if (cmd == "add_downloads") {
        auto ids = manager_->add_download_tasks(parse_download_requests(payload, download_dir_));
        json evt; evt["category"] = "download"; evt["ids"] = ids;
        broadcast_event("tasks_added", evt);
    }
    else if (cmd == "files") {
        if (!catalog_) return;
        auto files = catalog_->list_files();
        if (!files) {
            json err; err["msg"] = std::string(to_string(files.error()));
            broadcast_event("error", err);
            return;
        }
        json evt;
        evt["files"] = json::array();
        for (const auto& f : *files) evt["files"].push_back(to_json(f));
        broadcast_event("files", evt);
    }
    else if (cmd == "download_files") {
        // payload: {"file_ids": [...]}, resolved through the catalog
        if (!catalog_) return;
        std::vector<DownloadRequest> requests;
        for (const auto& id : payload.value("file_ids", std::vector<std::string>{})) {
            auto file = catalog_->get_file(id);
            if (!file) {
                json err; err["msg"] = std::format("{}: {}", id, to_string(file.error()));
                broadcast_event("error", err);
                continue;
            }
            requests.push_back(to_download_request(*file, download_dir_));
        }
        auto ids = manager_->add_download_tasks(std::move(requests));
        json evt; evt["category"] = "download"; evt["ids"] = ids;
        broadcast_event("tasks_added", evt);
    }
    else if (cmd == "pause") {
        manager_->pause_task(payload.value("task_id", ""));
    }
    else if (cmd == "resume") {
        manager_->resume_task(payload.value("task_id", ""));
    }
    else if (cmd == "cancel") {
        manager_->cancel_task(payload.value("task_id", ""));
    }
    else if (cmd == "clear") {
        auto which = payload.value("queue", "");
        if (which == "upload") manager_->clear_upload_queue();
        else if (which == "download") manager_->clear_download_queue();
    }
    else if (cmd == "list") {
        json evt;
        evt["tasks"] = json::array();
        for (const auto& t : manager_->all_tasks()) evt["tasks"].push_back(to_json(t));
        broadcast_event("tasks", evt);
    }
    else if (cmd == "stats") {
        json evt;
        evt["active_tasks"] = manager_->active_tasks_count();
        evt["queued_tasks"] = manager_->queued_tasks_count();
        if (balancer_) {
            auto s = balancer_->stats();
            evt["total_requests"] = s.total_requests;
            evt["waiting_requests"] = s.waiting_requests;
            evt["credentials_seen"] = s.active_credentials_seen;
            evt["active_operations"] = balancer_->active_operations();
        }
        broadcast_event("stats", evt);
    }
    else {
        json err; err["msg"] = "Unknown command: " + cmd;
        broadcast_event("error", err);
    }
}

} // namespace comb
