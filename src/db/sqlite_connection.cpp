#include <db/sqlite_connection.h>
#include <core/filesystem_utils.h>

#include <sqlite3.h>
#include <stdexcept>
#include <iostream>

namespace wsm {
namespace db {

std::filesystem::path SQLiteConnection::defaultDatabasePath() {
    std::filesystem::path app_dir = utils::get_app_data_directory();
    if (app_dir.empty()) {
        std::cerr << "Warning: Could not use the home directory. Using current directory for database." << std::endl;
        return "ws_manager.db";
    }
    return app_dir / "ws_manager.db";
}

SQLiteConnection::SQLiteConnection() {
    open(defaultDatabasePath().string());
}

SQLiteConnection::SQLiteConnection(const std::string& path) {
    open(path);
}

void SQLiteConnection::open(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err_msg = "Database connection failed: ";
        if (db) {
            err_msg += sqlite3_errmsg(db);
            sqlite3_close(db);
            db = nullptr;
        } else {
            err_msg += "Could not allocate memory for database handle.";
        }
        throw std::runtime_error(err_msg);
    }
    createSchema();
}

void SQLiteConnection::createSchema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY NOT NULL,
            value TEXT
        );
    )";
    this->exec(schema);
}

SQLiteConnection::~SQLiteConnection() {
    if (db) {
        sqlite3_close(db);
    }
}

void SQLiteConnection::exec(const char* sql) {
    char* err_msg_ptr = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg_ptr) != SQLITE_OK) {
        std::string error_message_str = "SQL error executing '";
        error_message_str += sql;
        error_message_str += "': ";
        if (err_msg_ptr) {
            error_message_str += err_msg_ptr;
            sqlite3_free(err_msg_ptr);
        } else {
            error_message_str += "Unknown SQLite error (no specific message provided by sqlite3_exec)";
        }
        throw std::runtime_error(error_message_str);
    }
}

void SQLiteConnection::exec(const std::string& sql) {
    exec(sql.c_str());
}

sqlite3* SQLiteConnection::getDbHandle() {
    return db;
}

} // namespace db
} // namespace wsm
