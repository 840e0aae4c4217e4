#include "Database.h"
#include <sqlite3.h>
#include <cstdio>
#include <mutex>

namespace Parley {

    namespace {

        std::string ColumnText(sqlite3_stmt* stmt, int col) {
            const unsigned char* t = sqlite3_column_text(stmt, col);
            return t ? reinterpret_cast<const char*>(t) : std::string();
        }

        void BindText(sqlite3_stmt* stmt, int idx, const std::string& s) {
            sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
        }

        void LogSqlError(sqlite3* db, const char* where) {
            std::fprintf(stderr, "[Parley Server] sqlite %s: %s\n", where, db ? sqlite3_errmsg(db) : "no connection");
        }

        constexpr char kChannelColumns[] =
            "SELECT id, code, name, owner_login, COALESCE(NULLIF(text_min_role,''),'member'), "
            "COALESCE(NULLIF(voice_min_role,''),'member') FROM channels ";

    } // namespace

    Database::Database(const std::string& path) {
        if (sqlite3_open_v2(path.c_str(), &m_Db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
            LogSqlError(m_Db, "open");
            sqlite3_close(m_Db);
            m_Db = nullptr;
            return;
        }
        sqlite3_busy_timeout(m_Db, 5000);
        Exec("PRAGMA journal_mode=WAL;");
        Exec("PRAGMA synchronous=NORMAL;");

        const char* sql =
            "CREATE TABLE IF NOT EXISTS users (login TEXT PRIMARY KEY, password TEXT NOT NULL, nickname TEXT NOT NULL);"
            "CREATE TABLE IF NOT EXISTS sessions (token TEXT PRIMARY KEY, login TEXT NOT NULL, created_at INTEGER NOT NULL, "
            "last_seen INTEGER NOT NULL, expires_at INTEGER NOT NULL);"
            "CREATE INDEX IF NOT EXISTS idx_sessions_login ON sessions(login);"
            "CREATE TABLE IF NOT EXISTS friend_requests (from_user TEXT, to_user TEXT, PRIMARY KEY(from_user, to_user));"
            "CREATE TABLE IF NOT EXISTS friends (user_login TEXT, friend_login TEXT, PRIMARY KEY(user_login, friend_login));"
            "CREATE TABLE IF NOT EXISTS channels (id INTEGER PRIMARY KEY AUTOINCREMENT, code TEXT UNIQUE, name TEXT, "
            "owner_login TEXT, text_min_role TEXT DEFAULT 'member', voice_min_role TEXT DEFAULT 'member', created_at INTEGER);"
            "CREATE TABLE IF NOT EXISTS channel_members (channel_id INTEGER, login TEXT, role TEXT DEFAULT 'member', "
            "joined_at INTEGER, PRIMARY KEY(channel_id, login));"
            "CREATE TABLE IF NOT EXISTS channel_voice_presence (channel_id INTEGER, login TEXT, speaking INTEGER DEFAULT 0, "
            "last_seen INTEGER, PRIMARY KEY(channel_id, login));";
        Exec(sql);
    }

    Database::~Database() {
        if (m_Db) sqlite3_close(m_Db);
    }

    bool Database::Exec(const char* sql) {
        if (!m_Db) return false;
        char* err = nullptr;
        if (sqlite3_exec(m_Db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::fprintf(stderr, "[Parley Server] sqlite exec: %s\n", err ? err : "unknown");
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    // ---------------------------------------------------------------------------
    // Users
    // ---------------------------------------------------------------------------

    bool Database::CreateUser(const std::string& login, const std::string& passwordHash, const std::string& nickname) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "INSERT OR IGNORE INTO users (login, password, nickname) VALUES (?, ?, ?);", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, login);
            BindText(stmt, 2, passwordHash);
            BindText(stmt, 3, nickname);
            ok = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(m_Db) > 0;
        }
        else LogSqlError(m_Db, "CreateUser");
        sqlite3_finalize(stmt);
        return ok;
    }

    std::optional<UserRecord> Database::GetUser(const std::string& login) {
        if (!m_Db) return std::nullopt;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        std::optional<UserRecord> out;
        if (sqlite3_prepare_v2(m_Db, "SELECT login, nickname, password FROM users WHERE login = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, login);
            if (sqlite3_step(stmt) == SQLITE_ROW)
                out = UserRecord{ ColumnText(stmt, 0), ColumnText(stmt, 1), ColumnText(stmt, 2) };
        }
        else LogSqlError(m_Db, "GetUser");
        sqlite3_finalize(stmt);
        return out;
    }

    bool Database::UserExists(const std::string& login) {
        return GetUser(login).has_value();
    }

    bool Database::UpdatePassword(const std::string& login, const std::string& passwordHash) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "UPDATE users SET password = ? WHERE login = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, passwordHash);
            BindText(stmt, 2, login);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "UpdatePassword");
        sqlite3_finalize(stmt);
        return ok;
    }

    // ---------------------------------------------------------------------------
    // Friends
    // ---------------------------------------------------------------------------

    bool Database::AddFriendRequest(const std::string& from, const std::string& to) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "INSERT OR IGNORE INTO friend_requests (from_user, to_user) VALUES (?, ?);", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, from);
            BindText(stmt, 2, to);
            ok = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(m_Db) > 0;
        }
        else LogSqlError(m_Db, "AddFriendRequest");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::AcceptFriendRequest(const std::string& from, const std::string& to) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool consumed = false;
        if (sqlite3_prepare_v2(m_Db, "DELETE FROM friend_requests WHERE from_user = ? AND to_user = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, from);
            BindText(stmt, 2, to);
            consumed = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(m_Db) > 0;
        }
        else LogSqlError(m_Db, "AcceptFriendRequest");
        sqlite3_finalize(stmt);
        if (!consumed) return false;

        stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "INSERT OR IGNORE INTO friends (user_login, friend_login) VALUES (?, ?);", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, from);
            BindText(stmt, 2, to);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_reset(stmt);
            BindText(stmt, 1, to);
            BindText(stmt, 2, from);
            ok = (sqlite3_step(stmt) == SQLITE_DONE) && ok;
        }
        else LogSqlError(m_Db, "AcceptFriendRequest");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::AreFriends(const std::string& a, const std::string& b) {
        if (!m_Db || a.empty() || b.empty() || a == b) return false;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool res = false;
        const char* sql = "SELECT 1 FROM friends WHERE (user_login = ? AND friend_login = ?) "
            "OR (user_login = ? AND friend_login = ?) LIMIT 1;";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, a);
            BindText(stmt, 2, b);
            BindText(stmt, 3, b);
            BindText(stmt, 4, a);
            res = sqlite3_step(stmt) == SQLITE_ROW;
        }
        else LogSqlError(m_Db, "AreFriends");
        sqlite3_finalize(stmt);
        return res;
    }

    // ---------------------------------------------------------------------------
    // Channels
    // ---------------------------------------------------------------------------

    std::optional<ChannelRecord> Database::ReadChannel(const char* where, int64_t id, const std::string* code) {
        if (!m_Db) return std::nullopt;
        const std::string sql = std::string(kChannelColumns) + where;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        std::optional<ChannelRecord> out;
        if (sqlite3_prepare_v2(m_Db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
            if (code) BindText(stmt, 1, *code);
            else sqlite3_bind_int64(stmt, 1, id);
            if (sqlite3_step(stmt) == SQLITE_ROW) {
                ChannelRecord c;
                c.id = sqlite3_column_int64(stmt, 0);
                c.code = ColumnText(stmt, 1);
                c.name = ColumnText(stmt, 2);
                c.ownerLogin = ColumnText(stmt, 3);
                c.textMinRole = ColumnText(stmt, 4);
                c.voiceMinRole = ColumnText(stmt, 5);
                out = std::move(c);
            }
        }
        else LogSqlError(m_Db, "ReadChannel");
        sqlite3_finalize(stmt);
        return out;
    }

    std::optional<ChannelRecord> Database::CreateChannel(const std::string& owner, const std::string& name,
        const std::string& code, int64_t nowMs)
    {
        if (!m_Db) return std::nullopt;
        int64_t id = 0;
        {
            std::unique_lock lock(m_RwMutex);
            sqlite3_stmt* stmt = nullptr;
            const char* sql = "INSERT INTO channels (code, name, owner_login, text_min_role, voice_min_role, created_at) "
                "VALUES (?, ?, ?, 'member', 'member', ?);";
            if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
                BindText(stmt, 1, code);
                BindText(stmt, 2, name);
                BindText(stmt, 3, owner);
                sqlite3_bind_int64(stmt, 4, nowMs);
                if (sqlite3_step(stmt) == SQLITE_DONE) id = sqlite3_last_insert_rowid(m_Db);
                else LogSqlError(m_Db, "CreateChannel");
            }
            else LogSqlError(m_Db, "CreateChannel");
            sqlite3_finalize(stmt);
        }
        if (id <= 0) return std::nullopt;
        // The owner's stored role is admin; ownership itself comes from owner_login.
        if (!AddChannelMember(id, owner, "admin", nowMs)) return std::nullopt;
        return GetChannel(id);
    }

    std::optional<ChannelRecord> Database::GetChannel(int64_t channelId) {
        return ReadChannel("WHERE id = ?;", channelId, nullptr);
    }

    std::optional<ChannelRecord> Database::FindChannelByCode(const std::string& code) {
        return ReadChannel("WHERE UPPER(code) = UPPER(?);", 0, &code);
    }

    bool Database::AddChannelMember(int64_t channelId, const std::string& login, const std::string& role, int64_t nowMs) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "INSERT OR IGNORE INTO channel_members (channel_id, login, role, joined_at) VALUES (?, ?, ?, ?);", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, channelId);
            BindText(stmt, 2, login);
            BindText(stmt, 3, role);
            sqlite3_bind_int64(stmt, 4, nowMs);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "AddChannelMember");
        sqlite3_finalize(stmt);
        return ok;
    }

    std::optional<std::string> Database::GetMemberRole(int64_t channelId, const std::string& login) {
        if (!m_Db) return std::nullopt;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        std::optional<std::string> out;
        if (sqlite3_prepare_v2(m_Db, "SELECT COALESCE(NULLIF(role,''),'member') FROM channel_members WHERE channel_id = ? AND login = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, channelId);
            BindText(stmt, 2, login);
            if (sqlite3_step(stmt) == SQLITE_ROW) out = ColumnText(stmt, 0);
        }
        else LogSqlError(m_Db, "GetMemberRole");
        sqlite3_finalize(stmt);
        return out;
    }

    bool Database::SetMemberRole(int64_t channelId, const std::string& login, const std::string& role) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "UPDATE channel_members SET role = ? WHERE channel_id = ? AND login = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, role);
            sqlite3_bind_int64(stmt, 2, channelId);
            BindText(stmt, 3, login);
            ok = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(m_Db) > 0;
        }
        else LogSqlError(m_Db, "SetMemberRole");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::SetVoiceMinRole(int64_t channelId, const std::string& role) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "UPDATE channels SET voice_min_role = ? WHERE id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, role);
            sqlite3_bind_int64(stmt, 2, channelId);
            ok = sqlite3_step(stmt) == SQLITE_DONE && sqlite3_changes(m_Db) > 0;
        }
        else LogSqlError(m_Db, "SetVoiceMinRole");
        sqlite3_finalize(stmt);
        return ok;
    }

    // ---------------------------------------------------------------------------
    // Sessions
    // ---------------------------------------------------------------------------

    bool Database::InsertSession(const SessionRecord& s) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        const char* sql = "INSERT OR REPLACE INTO sessions (token, login, created_at, last_seen, expires_at) VALUES (?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, s.token);
            BindText(stmt, 2, s.login);
            sqlite3_bind_int64(stmt, 3, s.createdAt);
            sqlite3_bind_int64(stmt, 4, s.lastSeen);
            sqlite3_bind_int64(stmt, 5, s.expiresAt);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "InsertSession");
        sqlite3_finalize(stmt);
        return ok;
    }

    std::optional<SessionRecord> Database::FindSession(const std::string& token) {
        if (!m_Db) return std::nullopt;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        std::optional<SessionRecord> out;
        if (sqlite3_prepare_v2(m_Db, "SELECT token, login, created_at, last_seen, expires_at FROM sessions WHERE token = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, token);
            if (sqlite3_step(stmt) == SQLITE_ROW) {
                SessionRecord s;
                s.token = ColumnText(stmt, 0);
                s.login = ColumnText(stmt, 1);
                s.createdAt = sqlite3_column_int64(stmt, 2);
                s.lastSeen = sqlite3_column_int64(stmt, 3);
                s.expiresAt = sqlite3_column_int64(stmt, 4);
                out = std::move(s);
            }
        }
        else LogSqlError(m_Db, "FindSession");
        sqlite3_finalize(stmt);
        return out;
    }

    bool Database::DeleteExpiredSessions(int64_t nowMs) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "DELETE FROM sessions WHERE expires_at < ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, nowMs);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "DeleteExpiredSessions");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::UpdateSessionLastSeen(const std::string& token, int64_t lastSeenMs) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "UPDATE sessions SET last_seen = ? WHERE token = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, lastSeenMs);
            BindText(stmt, 2, token);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "UpdateSessionLastSeen");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::DeleteSession(const std::string& token) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "DELETE FROM sessions WHERE token = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, token);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "DeleteSession");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::HasSessionActiveSince(const std::string& login, int64_t sinceMs, int64_t nowMs) {
        if (!m_Db || login.empty()) return false;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool res = false;
        const char* sql = "SELECT 1 FROM sessions WHERE login = ? AND expires_at >= ? "
            "AND (last_seen >= ? OR created_at >= ?) LIMIT 1;";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            BindText(stmt, 1, login);
            sqlite3_bind_int64(stmt, 2, nowMs);
            sqlite3_bind_int64(stmt, 3, sinceMs);
            sqlite3_bind_int64(stmt, 4, sinceMs);
            res = sqlite3_step(stmt) == SQLITE_ROW;
        }
        else LogSqlError(m_Db, "HasSessionActiveSince");
        sqlite3_finalize(stmt);
        return res;
    }

    // ---------------------------------------------------------------------------
    // Channel voice presence
    // ---------------------------------------------------------------------------

    bool Database::UpsertVoicePresence(int64_t channelId, const std::string& login, bool speaking, int64_t nowMs) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        const char* sql = "INSERT INTO channel_voice_presence (channel_id, login, speaking, last_seen) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(channel_id, login) DO UPDATE SET speaking = excluded.speaking, last_seen = excluded.last_seen;";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, channelId);
            BindText(stmt, 2, login);
            sqlite3_bind_int(stmt, 3, speaking ? 1 : 0);
            sqlite3_bind_int64(stmt, 4, nowMs);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "UpsertVoicePresence");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::DeleteVoicePresence(int64_t channelId, const std::string& login) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "DELETE FROM channel_voice_presence WHERE channel_id = ? AND login = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, channelId);
            BindText(stmt, 2, login);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "DeleteVoicePresence");
        sqlite3_finalize(stmt);
        return ok;
    }

    bool Database::PruneVoicePresence(int64_t channelId, int64_t cutoffMs) {
        if (!m_Db) return false;
        std::unique_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        bool ok = false;
        if (sqlite3_prepare_v2(m_Db, "DELETE FROM channel_voice_presence WHERE channel_id = ? AND last_seen < ?;", -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, channelId);
            sqlite3_bind_int64(stmt, 2, cutoffMs);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
        }
        else LogSqlError(m_Db, "PruneVoicePresence");
        sqlite3_finalize(stmt);
        return ok;
    }

    std::vector<VoicePresenceRow> Database::ListVoicePresence(int64_t channelId, int64_t cutoffMs) {
        std::vector<VoicePresenceRow> rows;
        if (!m_Db) return rows;
        std::shared_lock lock(m_RwMutex);
        sqlite3_stmt* stmt = nullptr;
        const char* sql =
            "SELECT p.login, COALESCE(u.nickname, p.login), COALESCE(NULLIF(m.role,''),'member'), p.speaking, p.last_seen "
            "FROM channel_voice_presence p "
            "LEFT JOIN users u ON u.login = p.login "
            "LEFT JOIN channel_members m ON m.channel_id = p.channel_id AND m.login = p.login "
            "WHERE p.channel_id = ? AND p.last_seen >= ? "
            "ORDER BY p.speaking DESC, LOWER(COALESCE(u.nickname, p.login)) ASC, LOWER(p.login) ASC;";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(stmt, 1, channelId);
            sqlite3_bind_int64(stmt, 2, cutoffMs);
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                VoicePresenceRow r;
                r.login = ColumnText(stmt, 0);
                r.nickname = ColumnText(stmt, 1);
                r.role = ColumnText(stmt, 2);
                r.speaking = sqlite3_column_int(stmt, 3) != 0;
                r.lastSeen = sqlite3_column_int64(stmt, 4);
                rows.push_back(std::move(r));
            }
        }
        else LogSqlError(m_Db, "ListVoicePresence");
        sqlite3_finalize(stmt);
        return rows;
    }

} // namespace Parley
