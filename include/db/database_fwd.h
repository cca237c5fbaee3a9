#pragma once

namespace wsm {
namespace db {

class SQLiteConnection;
class SettingsStore;

} // namespace db
} // namespace wsm
