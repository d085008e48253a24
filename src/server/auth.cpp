/*
 * AdaTP - authorization boundary implementation
 */

#include "auth.hpp"

#include "crypto.hpp"

namespace adatp {

namespace {
std::vector<uint8_t> digest_of(const std::string& password) {
    return sha256(std::vector<uint8_t>(password.begin(), password.end()));
}
} // namespace

StaticAuthorizer::StaticAuthorizer(const std::map<std::string, UserRecord>& users) {
    for (const auto& [name, record] : users) {
        users_[name] = Entry{digest_of(record.password), record.role};
    }
}

AuthDecision StaticAuthorizer::authorize(const std::string& username, const std::string& password) {
    // Digest first so unknown users cost the same as a wrong password.
    auto presented = digest_of(password);

    std::lock_guard<std::mutex> lock(mutex_);
    AuthDecision decision;
    auto it = users_.find(username);
    if (it == users_.end()) {
        return decision;
    }
    if (!constant_time_equal(presented, it->second.password_digest)) {
        return decision;
    }
    decision.authorized = true;
    decision.user_id = username;
    decision.role = it->second.role;
    return decision;
}

std::size_t StaticAuthorizer::user_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

} // namespace adatp
