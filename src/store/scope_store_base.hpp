#pragma once

#include "core/context.hpp"
#include "core/entity.hpp"
#include "core/result.hpp"
#include "store/context_store.hpp"
#include "store/entity_store.hpp"
#include <QObject>
#include <QString>
#include <optional>
#include <vector>

namespace tether::store {

/**
 * ScopeStoreBase - A QObject owning one or more entity stores whose
 * contents are defined by the active context.
 *
 * On every context change the store cancels its in-flight load and, if
 * scopeFor(context) is defined, issues exactly one fresh load for it. When
 * the key changed, or the identity scope changed under a workspace key, the
 * caches are cleared synchronously first; otherwise the held data stays
 * until the fresh load replaces it.
 *
 * Subclasses register their entity stores with track() and call attach()
 * at the end of their constructor.
 */
class ScopeStoreBase : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool loading READ loading NOTIFY loadingChanged)
    Q_PROPERTY(bool persisting READ persisting NOTIFY persistingChanged)
    Q_PROPERTY(QString errorMessage READ errorMessage NOTIFY errorChanged)

public:
    ScopeStoreBase(ContextStore& context, QObject* parent = nullptr);
    ~ScopeStoreBase() override;

    [[nodiscard]] bool loading() const;
    [[nodiscard]] bool persisting() const;
    [[nodiscard]] std::optional<Error> lastError() const;
    [[nodiscard]] QString errorMessage() const;
    void clearError();

    /**
     * Key of the data currently held, empty when the context defines none.
     */
    [[nodiscard]] const std::optional<ScopeKey>& scopeKey() const { return key_; }

    /**
     * Re-issue the load for the current key without clearing the cache.
     */
    void reload();

signals:
    void changed();
    void loadingChanged();
    void persistingChanged();
    void errorChanged();

protected:
    template<typename E>
    void track(EntityStore<E>& store) {
        slices_.push_back(&store);
        store.set_listener([this](StoreNotice notice) { forward(notice); });
    }

    /**
     * Connect to the context store and load for the current context.
     */
    void attach();

    [[nodiscard]] virtual std::optional<ScopeKey> scopeFor(const Context& context) const = 0;
    virtual void issueLoad(const ScopeKey& key) = 0;

    /**
     * Drop everything held for the previous key. The default clears every
     * tracked entity store.
     */
    virtual void resetCache();

    /**
     * Called after the reload protocol ran, also when the key was unchanged.
     */
    virtual void contextUpdated(const ContextChange&) {}

    [[nodiscard]] const Context& currentContext() const { return context_.context(); }

    ContextStore& context_;

private:
    void onContextChanged(const ContextChange& change);
    void forward(StoreNotice notice);

    std::vector<EntityStoreBase*> slices_;
    std::optional<ScopeKey> key_;
    QMetaObject::Connection connection_;
};

} // namespace tether::store
