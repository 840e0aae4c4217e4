#include "Actions.h"

namespace Parley {

    const std::vector<ActionInfo>& AllActions() {
        // poll_events drains the outbox on read, so a retried poll would lose events.
        static const std::vector<ActionInfo> kActions = {
            { "register",                       false, false },
            { "login",                          false, false },
            { "resume_session",                 false, true  },
            { "find_user",                      false, true  },
            { "heartbeat",                      true,  true  },
            { "status",                         true,  true  },
            { "logout",                         true,  false },
            { "release_call_state",             true,  false },
            { "presence_offline",               true,  true  },
            { "call_user",                      true,  false },
            { "accept_call",                    true,  false },
            { "decline_call",                   true,  false },
            { "end_call",                       true,  false },
            { "poll_events",                    true,  false },
            { "set_channel_voice_presence",     true,  true  },
            { "leave_channel_voice",            true,  true  },
            { "get_channel_voice_participants", true,  true  },
            { "send_friend_request",            true,  false },
            { "accept_friend_request",          true,  false },
            { "create_channel",                 true,  false },
            { "join_channel",                   true,  false },
            { "set_channel_member_role",        true,  false },
            { "update_channel_voice_role",      true,  false },
        };
        return kActions;
    }

    const ActionInfo* FindAction(const std::string& name) {
        for (const auto& a : AllActions())
            if (name == a.name) return &a;
        return nullptr;
    }

} // namespace Parley
