//
// Created by cv2 on 22.01.2026.
//

#include <gtest/gtest.h>

#include "ipc_server.hpp"

using namespace comb;

TEST(IpcMapping, UploadRequestsNeedAPath) {
    auto requests = parse_upload_requests(json::parse(R"({
        "files": [
            {"path": "/home/u/Pictures/cat.jpg", "size": 2048},
            {"name": "orphan"},
            {"path": "/tmp/a.bin", "name": "renamed.bin", "size": 1}
        ]
    })"));

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].source_path, "/home/u/Pictures/cat.jpg");
    EXPECT_EQ(requests[0].display_name, "cat.jpg");
    EXPECT_EQ(requests[0].size_bytes, 2048u);
    EXPECT_EQ(requests[1].display_name, "renamed.bin");
}

TEST(IpcMapping, MissingFilesKeyMeansNoRequests) {
    EXPECT_TRUE(parse_upload_requests(json::object()).empty());
    EXPECT_TRUE(parse_download_requests(json::object(), "/dl").empty());
}

TEST(IpcMapping, DownloadRequestsDefaultIntoDownloadDir) {
    auto requests = parse_download_requests(json::parse(R"({
        "files": [
            {
                "file_name": "clip.mp4",
                "message_id": 4242,
                "size": 150,
                "chunks": [
                    {"remote_file_id": "r0", "digest": "00112233445566ff", "size": 100},
                    {"remote_file_id": "r1", "digest": "ffeeddccbbaa9988", "size": 50}
                ]
            },
            {"file_name": "elsewhere.txt", "target_path": "/mnt/x/elsewhere.txt", "chunks": []},
            {"message_id": 1}
        ]
    })"), "/dl");

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].message_id, 4242);
    EXPECT_EQ(requests[0].size_bytes, 150u);
    EXPECT_EQ(requests[0].target_path, "/dl/clip.mp4");
    ASSERT_EQ(requests[0].chunks.size(), 2u);
    EXPECT_EQ(requests[0].chunks[1].remote_file_id, "r1");
    EXPECT_EQ(requests[0].chunks[1].size_bytes, 50u);
    EXPECT_EQ(requests[1].target_path, "/mnt/x/elsewhere.txt");
}

TEST(IpcMapping, TaskJsonCarriesStatusAndError) {
    auto task = make_task(UploadRequest{"/x/y.bin", "y.bin", 99});
    task.status = TaskStatus::Failed;
    task.error = "rate limited";

    auto j = to_json(task);
    EXPECT_EQ(j["id"], task.id);
    EXPECT_EQ(j["category"], "upload");
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["name"], "y.bin");
    EXPECT_EQ(j["size"], 99);
    EXPECT_EQ(j["error"], "rate limited");

    task.error.reset();
    EXPECT_FALSE(to_json(task).contains("error"));
}

TEST(IpcMapping, UploadResultFeedsCatalogAndDownload) {
    UploadResult result;
    result.file_id = "abc";
    result.name = "archive.tar";
    result.size_bytes = 150;
    result.total_chunks = 2;
    result.chunks.push_back(UploadedChunk{0, 11, "r0", "aaaaaaaaaaaaaaaa", "token-a", 100});
    result.chunks.push_back(UploadedChunk{1, 12, "r1", "bbbbbbbbbbbbbbbb", "token-b", 50});

    auto manifest = to_json(result);
    EXPECT_EQ(manifest["chunks"].size(), 2u);
    EXPECT_EQ(manifest["chunks"][1]["remote_file_id"], "r1");
    EXPECT_FALSE(manifest["chunks"][0].contains("credential"));

    auto file = to_catalog_file(result, 1700000000);
    EXPECT_EQ(file.uploaded_at, 1700000000);
    ASSERT_EQ(file.chunks.size(), 2u);
    EXPECT_EQ(file.chunks[1].index, 1u);
    EXPECT_EQ(file.chunks[1].message_id, 12);

    auto request = to_download_request(file, "/dl");
    EXPECT_EQ(request.file_name, "archive.tar");
    EXPECT_EQ(request.message_id, 11);
    EXPECT_EQ(request.target_path, "/dl/archive.tar");
    ASSERT_EQ(request.chunks.size(), 2u);
    EXPECT_EQ(request.chunks[0].digest, "aaaaaaaaaaaaaaaa");

    auto listed = to_json(file);
    EXPECT_EQ(listed["total_chunks"], 2);
    EXPECT_EQ(listed["file_id"], "abc");
}

TEST(IpcMapping, RemoteNamesStayInsideDownloadDir) {
    CatalogFile file;
    file.file_id = "evil";
    file.name = "../../etc/cron.d/job";
    EXPECT_EQ(to_download_request(file, "/dl").target_path, "/dl/job");

    file.name = "/abs/path/photo.jpg";
    EXPECT_EQ(to_download_request(file, "/dl").target_path, "/dl/photo.jpg");

    file.name = "..";
    EXPECT_EQ(to_download_request(file, "/dl").target_path, "/dl/download");

    auto requests = parse_download_requests(json::parse(R"({
        "files": [{"file_name": "../outside.txt", "chunks": []}]
    })"), "/dl");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].target_path, "/dl/outside.txt");
    EXPECT_EQ(requests[0].file_name, "../outside.txt");
}
