#include "auth.hpp"
#include <vector>
#include <algorithm>

AuthResult Authenticator::authenticate(int64_t tg_user_id) const {
    AuthResult result;

    if (config_.is_admin(tg_user_id)) {
        result.role = UserRole::Admin;
        result.authorized = true;
        return result;
    }

    if (config_.is_allowed(tg_user_id)) {
        result.role = UserRole::User;
        result.authorized = true;
        return result;
    }

    result.role = UserRole::Unknown;
    result.authorized = false;
    result.message = "🚫 Access denied.";

    return result;
}

bool Authenticator::is_command_allowed(const std::string& cmd, UserRole role) const {
    if (role == UserRole::Admin) {
        return true;
    }

    if (role == UserRole::User) {
        return !is_admin_only_command(cmd);
    }

    return false;
}

bool Authenticator::is_admin_only_command(const std::string& cmd) {
    static const std::vector<std::string> admin_only = {
        "stats"
    };

    return std::find(admin_only.begin(), admin_only.end(), cmd) != admin_only.end();
}
