#include "app/auth_session.hpp"

namespace tether::app {

AuthSession::AuthSession(QObject* parent)
    : QObject(parent) {
}

void AuthSession::setUser(AuthUser user) {
    if (user_ && *user_ == user) return;
    user_ = std::move(user);
    emit userChanged();
}

void AuthSession::clear() {
    if (!user_) return;
    user_.reset();
    emit userChanged();
}

} // namespace tether::app
