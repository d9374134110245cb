#pragma once

#include "core/types.hpp"
#include <QObject>
#include <optional>
#include <string>

namespace tether::app {

struct AuthUser {
    EntityId id;
    std::string display_name;
    std::string email;

    bool operator==(const AuthUser&) const = default;
};

/**
 * AuthSession - What the stores know about authentication: who is signed
 * in, and a signal when that changes. The authentication provider itself
 * lives outside the library and drives this object.
 */
class AuthSession : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool signedIn READ signedIn NOTIFY userChanged)

public:
    explicit AuthSession(QObject* parent = nullptr);

    [[nodiscard]] const std::optional<AuthUser>& currentUser() const { return user_; }
    [[nodiscard]] bool signedIn() const { return user_.has_value(); }

    void setUser(AuthUser user);
    void clear();

signals:
    void userChanged();

private:
    std::optional<AuthUser> user_;
};

} // namespace tether::app
