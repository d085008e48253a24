/*
 * AdaTP - authorization boundary
 *
 * The core only sees an opaque {authorized, user_id, role} decision. Where
 * the credentials live (local store, HTTP callback) is the implementation's
 * business.
 */

#pragma once

#include "config.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace adatp {

struct AuthDecision {
    bool authorized = false;
    std::string user_id;
    std::string role;
};

class Authorizer {
public:
    virtual ~Authorizer() = default;

    virtual AuthDecision authorize(const std::string& username, const std::string& password) = 0;
};

// Credentials declared as `user.<name>` entries in the server config.
class StaticAuthorizer : public Authorizer {
public:
    explicit StaticAuthorizer(const std::map<std::string, UserRecord>& users);

    AuthDecision authorize(const std::string& username, const std::string& password) override;

    std::size_t user_count() const;

private:
    struct Entry {
        std::vector<uint8_t> password_digest;
        std::string role;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> users_;
};

} // namespace adatp
