#include "store/scope_store_base.hpp"

#include "app/logging.hpp"

namespace tether::store {

ScopeStoreBase::ScopeStoreBase(ContextStore& context, QObject* parent)
    : QObject(parent),
      context_(context) {
}

ScopeStoreBase::~ScopeStoreBase() {
    disconnect(connection_);
}

void ScopeStoreBase::attach() {
    connection_ = connect(&context_, &ContextStore::contextChanged,
                          this, &ScopeStoreBase::onContextChanged);
    key_ = scopeFor(context_.context());
    if (key_) {
        issueLoad(*key_);
    }
}

bool ScopeStoreBase::loading() const {
    for (const auto* slice : slices_) {
        if (slice->loading()) return true;
    }
    return false;
}

bool ScopeStoreBase::persisting() const {
    for (const auto* slice : slices_) {
        if (slice->persisting()) return true;
    }
    return false;
}

std::optional<Error> ScopeStoreBase::lastError() const {
    for (const auto* slice : slices_) {
        if (slice->last_error()) return slice->last_error();
    }
    return std::nullopt;
}

QString ScopeStoreBase::errorMessage() const {
    auto error = lastError();
    return error ? QString::fromStdString(error->to_string()) : QString{};
}

void ScopeStoreBase::clearError() {
    for (auto* slice : slices_) {
        slice->clear_error();
    }
}

void ScopeStoreBase::reload() {
    if (key_) {
        issueLoad(*key_);
    }
}

void ScopeStoreBase::resetCache() {
    for (auto* slice : slices_) {
        slice->cancel_load();
        slice->clear();
    }
}

void ScopeStoreBase::onContextChanged(const ContextChange& change) {
    auto next = scopeFor(change.current);
    // Workspace-scoped data never outlives the identity it was loaded under.
    const bool identity_bound = change.identity_changed && next
        && next->field == ScopeField::Workspace;
    if (next != key_ || identity_bound) {
        qCDebug(tetherStoreLog) << metaObject()->className() << "scope"
                                << (key_ ? QString::fromStdString(key_->to_string()) : QStringLiteral("<none>"))
                                << "->"
                                << (next ? QString::fromStdString(next->to_string()) : QStringLiteral("<none>"));
        resetCache();
        key_ = std::move(next);
    } else {
        for (auto* slice : slices_) {
            slice->cancel_load();
        }
    }
    if (key_) {
        issueLoad(*key_);
    }
    contextUpdated(change);
}

void ScopeStoreBase::forward(StoreNotice notice) {
    switch (notice) {
        case StoreNotice::Changed: emit changed(); break;
        case StoreNotice::LoadingChanged: emit loadingChanged(); break;
        case StoreNotice::PersistingChanged: emit persistingChanged(); break;
        case StoreNotice::ErrorChanged: emit errorChanged(); break;
    }
}

} // namespace tether::store
