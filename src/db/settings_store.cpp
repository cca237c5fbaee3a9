#include <db/settings_store.h>
#include <db/sqlite_connection.h>
#include <sqlite3.h>
#include <memory>
#include <stdexcept>

namespace wsm {
namespace db {
namespace {
struct SQLiteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using unique_sqlite_stmt_ptr = std::unique_ptr<sqlite3_stmt, SQLiteStmtDeleter>;
} // end anonymous namespace

SettingsStore::SettingsStore(SQLiteConnection& db_conn) : m_db_conn(db_conn) {}

void SettingsStore::saveSetting(const std::string& key, const std::string& value) {
    const char* sql = "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)";
    sqlite3* handle = m_db_conn.getDbHandle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare saveSetting statement: " + std::string(sqlite3_errmsg(handle)));
    }
    unique_sqlite_stmt_ptr stmt_guard(stmt);
    if (sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind key in saveSetting: " + std::string(sqlite3_errmsg(handle)));
    }
    if (sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind value in saveSetting: " + std::string(sqlite3_errmsg(handle)));
    }
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error("saveSetting failed: " + std::string(sqlite3_errmsg(handle)));
    }
}

std::optional<std::string> SettingsStore::loadSetting(const std::string& key) {
    const char* sql = "SELECT value FROM settings WHERE key = ?";
    sqlite3* handle = m_db_conn.getDbHandle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare loadSetting statement: " + std::string(sqlite3_errmsg(handle)));
    }
    unique_sqlite_stmt_ptr stmt_guard(stmt);
    if (sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind key in loadSetting: " + std::string(sqlite3_errmsg(handle)));
    }

    std::optional<std::string> result = std::nullopt;
    int step_result = sqlite3_step(stmt);
    if (step_result == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        if (text) {
            result = reinterpret_cast<const char*>(text);
        }
    } else if (step_result != SQLITE_DONE) {
        throw std::runtime_error("loadSetting failed: " + std::string(sqlite3_errmsg(handle)));
    }
    return result;
}

void SettingsStore::saveSettings(const std::map<std::string, std::string>& values) {
    m_db_conn.exec("BEGIN TRANSACTION;");
    try {
        for (const auto& [key, value] : values) {
            saveSetting(key, value);
        }
        m_db_conn.exec("COMMIT;");
    } catch (const std::runtime_error&) {
        m_db_conn.exec("ROLLBACK;");
        throw;
    }
}

void SettingsStore::removeSetting(const std::string& key) {
    const char* sql = "DELETE FROM settings WHERE key = ?";
    sqlite3* handle = m_db_conn.getDbHandle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare removeSetting statement: " + std::string(sqlite3_errmsg(handle)));
    }
    unique_sqlite_stmt_ptr stmt_guard(stmt);
    if (sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind key in removeSetting: " + std::string(sqlite3_errmsg(handle)));
    }
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error("removeSetting failed: " + std::string(sqlite3_errmsg(handle)));
    }
}

} // namespace db
} // namespace wsm
