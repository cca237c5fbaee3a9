#pragma once

#include <filesystem>
#include <string>

struct sqlite3;      // Forward declaration for SQLite database handle

namespace wsm {
namespace db {

/*
 * Low-level RAII wrapper around a SQLite database connection.
 * All public methods forward to the underlying C API while enforcing
 * exception-based error handling and ownership semantics.
 */
class SQLiteConnection {
public:
    // Opens ~/.ws-manager/ws_manager.db (falls back to the working directory).
    SQLiteConnection();
    // Opens the given path; ":memory:" gives a private in-memory database.
    explicit SQLiteConnection(const std::string& path);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Execute one or more SQL statements separated by semicolons.
    void exec(const std::string& sql);
    void exec(const char* sql);

    // Return the raw sqlite3* handle (use with care).
    sqlite3* getDbHandle();

    // Default on-disk location of the settings database.
    static std::filesystem::path defaultDatabasePath();

private:
    void open(const std::string& path);
    void createSchema();

    sqlite3* db = nullptr;
};

} // namespace db
} // namespace wsm
