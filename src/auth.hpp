#pragma once

#include "config.hpp"
#include <string>
#include <cstdint>
#include <optional>

enum class UserRole {
    Admin,
    User,
    Unknown
};

struct AuthResult {
    UserRole role;
    bool authorized;
    std::optional<std::string> message;

    std::string role_string() const {
        switch (role) {
            case UserRole::Admin: return "admin";
            case UserRole::User: return "user";
            default: return "unknown";
        }
    }
};

class Authenticator {
public:
    explicit Authenticator(const Config& config) : config_(config) {}

    AuthResult authenticate(int64_t tg_user_id) const;
    bool is_command_allowed(const std::string& cmd, UserRole role) const;

private:
    const Config& config_;

    static bool is_admin_only_command(const std::string& cmd);
};
