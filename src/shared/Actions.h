#pragma once
#include <string>
#include <vector>

namespace Parley {

    // One row per control-channel action. The server gates authentication on
    // requiresAuth; the client only retries actions marked idempotent.
    struct ActionInfo {
        const char* name;
        bool        requiresAuth;
        bool        idempotent;
    };

    const std::vector<ActionInfo>& AllActions();

    // nullptr for an unknown action name.
    const ActionInfo* FindAction(const std::string& name);

} // namespace Parley
