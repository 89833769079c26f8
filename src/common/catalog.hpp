//
// Created by cv2 on 20.01.2026.
//

#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <sqlite3.h>

namespace comb {

    enum class CatalogError {
        OpenFailed,
        QueryFailed,
        NotFound
    };

    std::string_view to_string(CatalogError e);

    struct CatalogChunk {
        uint32_t index = 0;
        int64_t message_id = 0;
        std::string remote_file_id;
        std::string digest;
        uint64_t size_bytes = 0;
    };

    // A file that finished uploading, with everything needed to fetch it back
    struct CatalogFile {
        std::string file_id;
        std::string name;
        uint64_t size_bytes = 0;
        int64_t uploaded_at = 0; // unix seconds
        std::vector<CatalogChunk> chunks; // ordered by index
    };

    // SQLite catalog of stored files. Thread-safe.
    class Catalog {
    public:
        Catalog();
        ~Catalog();

        Catalog(const Catalog&) = delete;
        Catalog& operator=(const Catalog&) = delete;

        // Opens (or creates) the DB. ":memory:" works for a throwaway catalog.
        std::expected<void, CatalogError> open(const std::string& filepath);
        void close();

        // Replaces any previous entry with the same file id
        std::expected<void, CatalogError> save_file(const CatalogFile& file);
        std::expected<CatalogFile, CatalogError> get_file(const std::string& file_id);
        // Newest first
        std::expected<std::vector<CatalogFile>, CatalogError> list_files();
        std::expected<void, CatalogError> remove_file(const std::string& file_id);

    private:
        bool init_tables();
        bool exec(const char* sql);
        std::expected<std::vector<CatalogChunk>, CatalogError> load_chunks(const std::string& file_id);

        sqlite3* db_ = nullptr;
        std::mutex mutex_;
    };

} // namespace comb
