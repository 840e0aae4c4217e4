#pragma once
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace Parley {

    struct UserRecord {
        std::string login;
        std::string nickname;
        std::string passwordHash;
    };

    struct SessionRecord {
        std::string token;
        std::string login;
        int64_t     createdAt = 0;
        int64_t     lastSeen = 0;
        int64_t     expiresAt = 0;
    };

    struct ChannelRecord {
        int64_t     id = 0;
        std::string code;
        std::string name;
        std::string ownerLogin;
        std::string textMinRole;
        std::string voiceMinRole;
    };

    struct VoicePresenceRow {
        std::string login;
        std::string nickname;
        std::string role;       // as stored; callers normalize
        bool        speaking = false;
        int64_t     lastSeen = 0;
    };

    // SQLite store behind the control plane. All timestamps are epoch ms.
    // One connection opened in serialized mode; m_RwMutex keeps multi-statement
    // writes from interleaving with reads.
    class Database {
    public:
        explicit Database(const std::string& path);
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        bool IsOpen() const { return m_Db != nullptr; }

        // --- Users -------------------------------------------------------------
        bool CreateUser(const std::string& login, const std::string& passwordHash, const std::string& nickname);
        std::optional<UserRecord> GetUser(const std::string& login);
        bool UserExists(const std::string& login);
        bool UpdatePassword(const std::string& login, const std::string& passwordHash);

        // --- Friends -----------------------------------------------------------
        bool AddFriendRequest(const std::string& from, const std::string& to);
        bool AcceptFriendRequest(const std::string& from, const std::string& to);
        bool AreFriends(const std::string& a, const std::string& b);

        // --- Channels ----------------------------------------------------------
        std::optional<ChannelRecord> CreateChannel(const std::string& owner, const std::string& name,
            const std::string& code, int64_t nowMs);
        std::optional<ChannelRecord> GetChannel(int64_t channelId);
        std::optional<ChannelRecord> FindChannelByCode(const std::string& code);
        bool AddChannelMember(int64_t channelId, const std::string& login, const std::string& role, int64_t nowMs);
        std::optional<std::string> GetMemberRole(int64_t channelId, const std::string& login);
        bool SetMemberRole(int64_t channelId, const std::string& login, const std::string& role);
        bool SetVoiceMinRole(int64_t channelId, const std::string& role);

        // --- Sessions ----------------------------------------------------------
        bool InsertSession(const SessionRecord& s);
        std::optional<SessionRecord> FindSession(const std::string& token);
        bool DeleteExpiredSessions(int64_t nowMs);
        bool UpdateSessionLastSeen(const std::string& token, int64_t lastSeenMs);
        bool DeleteSession(const std::string& token);
        // Some unexpired session of login was seen or created at or after sinceMs.
        bool HasSessionActiveSince(const std::string& login, int64_t sinceMs, int64_t nowMs);

        // --- Channel voice presence ---------------------------------------------
        bool UpsertVoicePresence(int64_t channelId, const std::string& login, bool speaking, int64_t nowMs);
        bool DeleteVoicePresence(int64_t channelId, const std::string& login);
        bool PruneVoicePresence(int64_t channelId, int64_t cutoffMs);
        // Rows with last_seen >= cutoffMs, speaking first, then nickname.
        std::vector<VoicePresenceRow> ListVoicePresence(int64_t channelId, int64_t cutoffMs);

    private:
        bool Exec(const char* sql);
        std::optional<ChannelRecord> ReadChannel(const char* sql, int64_t id, const std::string* code);

        sqlite3* m_Db = nullptr;
        std::shared_mutex m_RwMutex;
    };

} // namespace Parley
