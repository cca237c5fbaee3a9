#pragma once

#include <db/database_fwd.h>
#include <map>
#include <optional>
#include <string>

namespace wsm {
namespace db {

/*
 * Manages persistence for application settings.
 * This class handles all key-value operations on the `settings` table.
 */
class SettingsStore {
public:
    /// Constructs a SettingsStore using an existing database connection.
    explicit SettingsStore(SQLiteConnection& db_conn);

    /// Saves a key-value setting to the database.
    void saveSetting(const std::string& key, const std::string& value);

    /// Writes all pairs in one transaction; nothing is written if one fails.
    void saveSettings(const std::map<std::string, std::string>& values);

    /// Loads a setting's value by its key.
    std::optional<std::string> loadSetting(const std::string& key);

    /// Deletes a setting. Missing keys are not an error.
    void removeSetting(const std::string& key);

private:
    SQLiteConnection& m_db_conn;
};

} // namespace db
} // namespace wsm
