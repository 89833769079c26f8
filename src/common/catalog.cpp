//
// Created by cv2 on 20.01.2026.
//

#include "catalog.hpp"
#include <print>

namespace comb {

namespace {

// Finalizes the statement on every exit path
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() { if (stmt) sqlite3_finalize(stmt); }
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

std::string_view to_string(CatalogError e) {
    switch (e) {
        case CatalogError::OpenFailed:  return "catalog cannot be opened";
        case CatalogError::QueryFailed: return "catalog query failed";
        case CatalogError::NotFound:    return "file not in catalog";
    }
    return "unknown";
}

Catalog::Catalog() = default;

Catalog::~Catalog() {
    close();
}

void Catalog::close() {
    std::lock_guard lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::expected<void, CatalogError> Catalog::open(const std::string& filepath) {
    std::lock_guard lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    if (sqlite3_open(filepath.c_str(), &db_) != SQLITE_OK) {
        std::println(stderr, "[Catalog] Failed to open DB: {}", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return std::unexpected(CatalogError::OpenFailed);
    }

    // WAL so the IPC thread can read while transfers write
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");

    if (!init_tables()) return std::unexpected(CatalogError::OpenFailed);
    return {};
}

bool Catalog::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "[Catalog] SQL error: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool Catalog::init_tables() {
    return exec(R"(
        CREATE TABLE IF NOT EXISTS files (
            file_id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            size_bytes INTEGER NOT NULL,
            uploaded_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS chunks (
            file_id TEXT NOT NULL REFERENCES files(file_id) ON DELETE CASCADE,
            chunk_index INTEGER NOT NULL,
            message_id INTEGER,
            remote_file_id TEXT NOT NULL,
            digest TEXT,
            size_bytes INTEGER NOT NULL,
            PRIMARY KEY (file_id, chunk_index)
        );
    )");
}

std::expected<void, CatalogError> Catalog::save_file(const CatalogFile& file) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(CatalogError::QueryFailed);

    if (!exec("BEGIN;")) return std::unexpected(CatalogError::QueryFailed);

    auto rollback = [this] {
        exec("ROLLBACK;");
        return std::unexpected(CatalogError::QueryFailed);
    };

    {
        Statement del;
        if (sqlite3_prepare_v2(db_, "DELETE FROM files WHERE file_id = ?", -1, &del.stmt, nullptr) != SQLITE_OK) return rollback();
        sqlite3_bind_text(del.stmt, 1, file.file_id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(del.stmt) != SQLITE_DONE) return rollback();
    }

    {
        Statement ins;
        const char* sql = "INSERT INTO files (file_id, name, size_bytes, uploaded_at) VALUES (?, ?, ?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &ins.stmt, nullptr) != SQLITE_OK) return rollback();
        sqlite3_bind_text(ins.stmt, 1, file.file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins.stmt, 2, file.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(ins.stmt, 3, static_cast<sqlite3_int64>(file.size_bytes));
        sqlite3_bind_int64(ins.stmt, 4, file.uploaded_at);
        if (sqlite3_step(ins.stmt) != SQLITE_DONE) {
            std::println(stderr, "[Catalog] Insert of {} failed: {}", file.file_id, sqlite3_errmsg(db_));
            return rollback();
        }
    }

    for (const auto& c : file.chunks) {
        Statement ins;
        const char* sql = "INSERT INTO chunks (file_id, chunk_index, message_id, remote_file_id, digest, size_bytes) "
                          "VALUES (?, ?, ?, ?, ?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &ins.stmt, nullptr) != SQLITE_OK) return rollback();
        sqlite3_bind_text(ins.stmt, 1, file.file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(ins.stmt, 2, static_cast<int>(c.index));
        sqlite3_bind_int64(ins.stmt, 3, c.message_id);
        sqlite3_bind_text(ins.stmt, 4, c.remote_file_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins.stmt, 5, c.digest.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(ins.stmt, 6, static_cast<sqlite3_int64>(c.size_bytes));
        if (sqlite3_step(ins.stmt) != SQLITE_DONE) return rollback();
    }

    if (!exec("COMMIT;")) return rollback();
    return {};
}

std::expected<std::vector<CatalogChunk>, CatalogError> Catalog::load_chunks(const std::string& file_id) {
    Statement q;
    const char* sql = "SELECT chunk_index, message_id, remote_file_id, digest, size_bytes "
                      "FROM chunks WHERE file_id = ? ORDER BY chunk_index";
    if (sqlite3_prepare_v2(db_, sql, -1, &q.stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(CatalogError::QueryFailed);
    }
    sqlite3_bind_text(q.stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<CatalogChunk> chunks;
    int rc;
    while ((rc = sqlite3_step(q.stmt)) == SQLITE_ROW) {
        CatalogChunk c;
        c.index = static_cast<uint32_t>(sqlite3_column_int(q.stmt, 0));
        c.message_id = sqlite3_column_int64(q.stmt, 1);
        c.remote_file_id = column_text(q.stmt, 2);
        c.digest = column_text(q.stmt, 3);
        c.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(q.stmt, 4));
        chunks.push_back(std::move(c));
    }
    if (rc != SQLITE_DONE) return std::unexpected(CatalogError::QueryFailed);
    return chunks;
}

std::expected<CatalogFile, CatalogError> Catalog::get_file(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(CatalogError::QueryFailed);

    CatalogFile file;
    {
        Statement q;
        const char* sql = "SELECT file_id, name, size_bytes, uploaded_at FROM files WHERE file_id = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &q.stmt, nullptr) != SQLITE_OK) {
            return std::unexpected(CatalogError::QueryFailed);
        }
        sqlite3_bind_text(q.stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(q.stmt);
        if (rc == SQLITE_DONE) return std::unexpected(CatalogError::NotFound);
        if (rc != SQLITE_ROW) return std::unexpected(CatalogError::QueryFailed);

        file.file_id = column_text(q.stmt, 0);
        file.name = column_text(q.stmt, 1);
        file.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(q.stmt, 2));
        file.uploaded_at = sqlite3_column_int64(q.stmt, 3);
    }

    auto chunks = load_chunks(file_id);
    if (!chunks) return std::unexpected(chunks.error());
    file.chunks = std::move(*chunks);
    return file;
}

std::expected<std::vector<CatalogFile>, CatalogError> Catalog::list_files() {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(CatalogError::QueryFailed);

    std::vector<CatalogFile> files;
    {
        Statement q;
        const char* sql = "SELECT file_id, name, size_bytes, uploaded_at FROM files ORDER BY uploaded_at DESC, name";
        if (sqlite3_prepare_v2(db_, sql, -1, &q.stmt, nullptr) != SQLITE_OK) {
            return std::unexpected(CatalogError::QueryFailed);
        }

        int rc;
        while ((rc = sqlite3_step(q.stmt)) == SQLITE_ROW) {
            CatalogFile f;
            f.file_id = column_text(q.stmt, 0);
            f.name = column_text(q.stmt, 1);
            f.size_bytes = static_cast<uint64_t>(sqlite3_column_int64(q.stmt, 2));
            f.uploaded_at = sqlite3_column_int64(q.stmt, 3);
            files.push_back(std::move(f));
        }
        if (rc != SQLITE_DONE) return std::unexpected(CatalogError::QueryFailed);
    }

    for (auto& f : files) {
        auto chunks = load_chunks(f.file_id);
        if (!chunks) return std::unexpected(chunks.error());
        f.chunks = std::move(*chunks);
    }
    return files;
}

std::expected<void, CatalogError> Catalog::remove_file(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(CatalogError::QueryFailed);

    Statement del;
    if (sqlite3_prepare_v2(db_, "DELETE FROM files WHERE file_id = ?", -1, &del.stmt, nullptr) != SQLITE_OK) {
        return std::unexpected(CatalogError::QueryFailed);
    }
    sqlite3_bind_text(del.stmt, 1, file_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(del.stmt) != SQLITE_DONE) return std::unexpected(CatalogError::QueryFailed);
    if (sqlite3_changes(db_) == 0) return std::unexpected(CatalogError::NotFound);
    return {};
}

} // namespace comb
