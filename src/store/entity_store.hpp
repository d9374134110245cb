#pragma once

#include "app/config.hpp"
#include "app/logging.hpp"
#include "core/entity.hpp"
#include "core/result.hpp"
#include "storage/repository.hpp"
#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tether::store {

/**
 * What changed in an entity store; forwarded by the owning scope store as
 * Qt signals.
 */
enum class StoreNotice {
    Changed,
    LoadingChanged,
    PersistingChanged,
    ErrorChanged
};

/**
 * EntityStoreBase - The type-independent face of an entity store, used by
 * scope stores to aggregate state over the stores they own.
 */
class EntityStoreBase {
public:
    virtual ~EntityStoreBase() = default;

    [[nodiscard]] virtual bool loading() const = 0;
    [[nodiscard]] virtual bool persisting() const = 0;
    [[nodiscard]] virtual const std::optional<Error>& last_error() const = 0;
    virtual void clear_error() = 0;
    virtual void cancel_load() = 0;
    virtual void clear() = 0;
    virtual void set_listener(std::function<void(StoreNotice)> listener) = 0;
};

/**
 * EntityStore<E> - Normalized id -> entity cache for one aggregate, with
 * optimistic mutations against a Repository<E>.
 *
 * Mutations apply locally before the port call and return the dispatch
 * outcome synchronously; a synchronous error means nothing was changed
 * and `done` will not be called. Once dispatched, `done` runs exactly once
 * when the port settles: success keeps the optimistic value (reconciled
 * with server-assigned fields for creates), failure restores the snapshot
 * taken before the mutation and records the error as last_error().
 *
 * A second mutation on an id whose previous mutation is still in flight is
 * rejected with ConflictError or queued, depending on the MutationPolicy.
 *
 * clear() starts a new epoch: settlements of mutations dispatched before it
 * still reach their callers but no longer touch the cache.
 */
template<typename E>
class EntityStore final : public EntityStoreBase {
public:
    using Traits = EntityTraits<E>;
    using Patch = typename Traits::Patch;
    using Port = storage::Repository<E>;
    using Listener = std::function<void(StoreNotice)>;
    using PatchBuilder = std::function<Result<Patch>(const E&)>;

    static constexpr std::string_view kProvisionalPrefix = "pending:";

    explicit EntityStore(Port& port, MutationPolicy policy = MutationPolicy::Reject)
        : port_(port), policy_(policy) {}

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    void set_listener(Listener listener) override { listener_ = std::move(listener); }

    [[nodiscard]] MutationPolicy policy() const { return policy_; }
    void set_policy(MutationPolicy policy) { policy_ = policy; }

    // ------------------------------------------------------------------
    // Reads
    // ------------------------------------------------------------------

    [[nodiscard]] const E* get(const EntityId& id) const {
        auto it = entities_.find(id);
        return it == entities_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool contains(const EntityId& id) const { return entities_.count(id) > 0; }
    [[nodiscard]] size_t size() const { return entities_.size(); }
    [[nodiscard]] bool empty() const { return entities_.empty(); }

    /**
     * All cached entities ordered by id.
     */
    [[nodiscard]] std::vector<E> values() const {
        std::vector<E> out;
        out.reserve(entities_.size());
        for (const auto& [id, entity] : entities_) out.push_back(entity);
        std::sort(out.begin(), out.end(),
            [](const E& a, const E& b) { return Traits::id(a) < Traits::id(b); });
        return out;
    }

    template<typename Pred>
    [[nodiscard]] std::vector<E> filter(Pred&& pred) const {
        std::vector<E> out;
        for (auto& e : values()) {
            if (pred(e)) out.push_back(std::move(e));
        }
        return out;
    }

    [[nodiscard]] bool loading() const override { return loading_; }
    [[nodiscard]] bool persisting() const override { return pending_mutations_ > 0; }
    [[nodiscard]] bool in_flight(const EntityId& id) const { return in_flight_.count(id) > 0; }
    [[nodiscard]] const std::optional<Error>& last_error() const override { return last_error_; }
    [[nodiscard]] const std::optional<ScopeKey>& scope() const { return scope_; }
    [[nodiscard]] uint64_t epoch() const { return epoch_; }

    [[nodiscard]] static bool is_provisional(const EntityId& id) {
        return id.rfind(kProvisionalPrefix, 0) == 0;
    }

    void clear_error() override {
        if (!last_error_) return;
        last_error_.reset();
        notify(StoreNotice::ErrorChanged);
    }

    // ------------------------------------------------------------------
    // Secondary indexes
    // ------------------------------------------------------------------

    /**
     * Add a cached entity to a named index (e.g. "starred"). Index
     * membership is local; it follows the entity through removal and
     * rollback but is never sent to the port.
     */
    bool mark(const std::string& index, const EntityId& id) {
        if (!contains(id)) return false;
        if (!indexes_[index].insert(id).second) return false;
        notify(StoreNotice::Changed);
        return true;
    }

    bool unmark(const std::string& index, const EntityId& id) {
        auto it = indexes_.find(index);
        if (it == indexes_.end() || it->second.erase(id) == 0) return false;
        notify(StoreNotice::Changed);
        return true;
    }

    [[nodiscard]] bool is_marked(const std::string& index, const EntityId& id) const {
        auto it = indexes_.find(index);
        return it != indexes_.end() && it->second.count(id) > 0;
    }

    [[nodiscard]] std::vector<E> indexed(const std::string& index) const {
        std::vector<E> out;
        auto it = indexes_.find(index);
        if (it == indexes_.end()) return out;
        for (const auto& id : it->second) {
            if (const auto* e = get(id)) out.push_back(*e);
        }
        return out;
    }

    // ------------------------------------------------------------------
    // Loading
    // ------------------------------------------------------------------

    /**
     * Replace the cache with the entities the port lists for `scope`.
     *
     * A newer load() or cancel_load() supersedes this one; its results are
     * then discarded and `done` receives ConflictError. On failure the
     * cache is left untouched and the error is recorded.
     */
    void load(const ScopeKey& scope, Completion<void> done = {}) {
        const auto generation = ++load_generation_;
        scope_ = scope;
        set_loading(true);
        qCDebug(tetherStoreLog) << name() << "load" << QString::fromStdString(scope.to_string());

        port_.list_by_scope(scope,
            [this, alive = std::weak_ptr<int>(alive_), generation, done = std::move(done)]
            (Result<std::vector<E>> result) {
                if (alive.expired()) return;
                if (generation != load_generation_) {
                    qCDebug(tetherStoreLog) << name() << "discarding superseded load" << generation;
                    settle(done, Result<void>::err(Error::conflict("load superseded")));
                    return;
                }
                set_loading(false);
                if (result.is_err()) {
                    const auto& error = result.unwrap_err();
                    qCWarning(tetherStoreLog) << name() << "load failed"
                                              << QString::fromStdString(error.to_string());
                    set_error(error);
                    settle(done, Result<void>::err(error));
                    return;
                }
                replace_all(std::move(result).unwrap());
                settle(done, Result<void>::ok());
            });
    }

    /**
     * Fetch one entity by id and merge it into the cache.
     */
    void fetch(const EntityId& id, Completion<E> done = {}) {
        port_.get_by_id(id,
            [this, alive = std::weak_ptr<int>(alive_), epoch = epoch_, done = std::move(done)]
            (Result<E> result) {
                if (alive.expired()) return;
                if (result.is_ok() && epoch == epoch_) {
                    const auto& entity = result.unwrap();
                    if (!in_flight(Traits::id(entity))) {
                        entities_[Traits::id(entity)] = entity;
                        notify(StoreNotice::Changed);
                    }
                }
                settle(done, std::move(result));
            });
    }

    void cancel_load() override {
        ++load_generation_;
        set_loading(false);
    }

    /**
     * Drop everything: entities, indexes, the error, in-flight bookkeeping
     * and queued mutations (whose callers receive ConflictError).
     */
    void clear() override {
        cancel_load();
        ++epoch_;
        scope_.reset();

        const bool had_entities = !entities_.empty();
        const bool was_persisting = persisting();
        entities_.clear();
        indexes_.clear();
        in_flight_.clear();
        pending_mutations_ = 0;

        auto queued = std::move(queued_);
        queued_.clear();
        for (auto& [id, items] : queued) {
            for (auto& item : items) {
                item.cancel(Error::conflict("store cleared before mutation could run"));
            }
        }

        if (had_entities) notify(StoreNotice::Changed);
        if (was_persisting) notify(StoreNotice::PersistingChanged);
        if (last_error_) {
            last_error_.reset();
            notify(StoreNotice::ErrorChanged);
        }
    }

    // ------------------------------------------------------------------
    // Optimistic mutations
    // ------------------------------------------------------------------

    /**
     * Insert `draft` under a provisional id ("pending:<uuid>") and ask the
     * port to create it. On success the provisional entry is replaced by
     * the stored entity. Returns the provisional id.
     */
    Result<EntityId> create(const E& draft, Completion<E> done = {}) {
        E local = draft;
        EntityId provisional = std::string(kProvisionalPrefix) + Uuid::generate().to_string();
        Traits::assign_id(local, provisional);
        entities_[provisional] = std::move(local);
        begin_mutation(provisional);
        notify(StoreNotice::Changed);

        port_.create(draft,
            [this, alive = std::weak_ptr<int>(alive_), epoch = epoch_, provisional,
             done = std::move(done)](Result<E> result) {
                if (alive.expired()) return;
                if (epoch != epoch_) {
                    settle(done, std::move(result));
                    return;
                }
                end_mutation(provisional);

                auto marks = take_index_memberships(provisional);
                entities_.erase(provisional);

                if (result.is_err()) {
                    rollback_notice("create", provisional, result.unwrap_err());
                    set_error(result.unwrap_err());
                    notify(StoreNotice::Changed);
                    cancel_queued(provisional, Error::not_found("created entity was rolled back"));
                    settle(done, std::move(result));
                    return;
                }

                const auto& stored = result.unwrap();
                const auto server_id = Traits::id(stored);
                entities_[server_id] = stored;
                for (const auto& index : marks) indexes_[index].insert(server_id);
                notify(StoreNotice::Changed);

                auto moved = queued_.find(provisional);
                if (moved != queued_.end()) {
                    auto items = std::move(moved->second);
                    queued_.erase(moved);
                    auto& target = queued_[server_id];
                    for (auto& item : items) target.push_back(std::move(item));
                }
                settle(done, std::move(result));
                drain(server_id);
            });

        return Result<EntityId>::ok(std::move(provisional));
    }

    Result<void> update(const EntityId& id, const Patch& patch, Completion<void> done = {}) {
        if (in_flight(id)) {
            return defer(id, [this, patch](const EntityId& target, Completion<void> cb) {
                return update(target, patch, std::move(cb));
            }, std::move(done));
        }
        if (!contains(id)) {
            return Result<void>::err(Error::not_found(std::string(Traits::name) + " " + id + " not cached"));
        }

        E snapshot = entities_.at(id);
        entities_[id] = Traits::apply(snapshot, patch);
        begin_mutation(id);
        notify(StoreNotice::Changed);

        port_.update(id, patch,
            [this, alive = std::weak_ptr<int>(alive_), epoch = epoch_, id,
             snapshot = std::move(snapshot), done = std::move(done)](Result<void> result) {
                if (alive.expired()) return;
                if (epoch != epoch_) {
                    settle(done, std::move(result));
                    return;
                }
                end_mutation(id);
                if (result.is_err()) {
                    rollback_notice("update", id, result.unwrap_err());
                    entities_[id] = snapshot;
                    set_error(result.unwrap_err());
                    notify(StoreNotice::Changed);
                }
                settle(done, std::move(result));
                drain(id);
            });

        return Result<void>::ok();
    }

    /**
     * Update with a patch computed from the entity as it stands when the
     * mutation runs. A queued call builds its patch only after the earlier
     * mutation settled, so it never carries over state that was rolled
     * back. Errors from `build` are returned when the call runs at once and
     * reported through `done` when it was queued.
     */
    Result<void> update_with(const EntityId& id, PatchBuilder build, Completion<void> done = {}) {
        if (in_flight(id)) {
            return defer(id, [this, build](const EntityId& target, Completion<void> cb) {
                return update_with(target, build, std::move(cb));
            }, std::move(done));
        }
        const auto* current = get(id);
        if (!current) {
            return Result<void>::err(Error::not_found(std::string(Traits::name) + " " + id + " not cached"));
        }
        auto patch = build(*current);
        if (patch.is_err()) return Result<void>::err(patch.unwrap_err());
        return update(id, patch.unwrap(), std::move(done));
    }

    /**
     * Remove the entity and its index memberships together. A failed port
     * call restores both.
     */
    Result<void> remove(const EntityId& id, Completion<void> done = {}) {
        if (in_flight(id)) {
            return defer(id, [this](const EntityId& target, Completion<void> cb) {
                return remove(target, std::move(cb));
            }, std::move(done));
        }
        if (!contains(id)) {
            return Result<void>::err(Error::not_found(std::string(Traits::name) + " " + id + " not cached"));
        }

        E snapshot = entities_.at(id);
        auto marks = take_index_memberships(id);
        entities_.erase(id);
        begin_mutation(id);
        notify(StoreNotice::Changed);

        port_.remove(id,
            [this, alive = std::weak_ptr<int>(alive_), epoch = epoch_, id,
             snapshot = std::move(snapshot), marks = std::move(marks),
             done = std::move(done)](Result<void> result) {
                if (alive.expired()) return;
                if (epoch != epoch_) {
                    settle(done, std::move(result));
                    return;
                }
                end_mutation(id);
                if (result.is_err()) {
                    rollback_notice("remove", id, result.unwrap_err());
                    entities_[id] = snapshot;
                    for (const auto& index : marks) indexes_[index].insert(id);
                    set_error(result.unwrap_err());
                    notify(StoreNotice::Changed);
                }
                settle(done, std::move(result));
                drain(id);
            });

        return Result<void>::ok();
    }

private:
    using Runner = std::function<Result<void>(const EntityId&, Completion<void>)>;

    struct Deferred {
        std::function<void(const EntityId&)> run;
        std::function<void(Error)> cancel;
    };

    static QLatin1String name() {
        return QLatin1String(Traits::name.data(), static_cast<qsizetype>(Traits::name.size()));
    }

    template<typename T>
    static void settle(const Completion<T>& done, Result<T> result) {
        if (done) done(std::move(result));
    }

    void notify(StoreNotice notice) {
        if (listener_) listener_(notice);
    }

    void set_loading(bool loading) {
        if (loading_ == loading) return;
        loading_ = loading;
        notify(StoreNotice::LoadingChanged);
    }

    void set_error(Error error) {
        last_error_ = std::move(error);
        notify(StoreNotice::ErrorChanged);
    }

    void rollback_notice(const char* op, const EntityId& id, const Error& error) {
        qCWarning(tetherStoreLog) << name() << op << "rolled back" << QString::fromStdString(id)
                                  << QString::fromStdString(error.to_string());
    }

    void begin_mutation(const EntityId& id) {
        in_flight_.insert(id);
        if (pending_mutations_++ == 0) notify(StoreNotice::PersistingChanged);
    }

    void end_mutation(const EntityId& id) {
        in_flight_.erase(id);
        if (pending_mutations_ > 0 && --pending_mutations_ == 0) {
            notify(StoreNotice::PersistingChanged);
        }
    }

    Result<void> defer(const EntityId& id, Runner runner, Completion<void> done) {
        if (policy_ == MutationPolicy::Reject) {
            qCWarning(tetherStoreLog) << name() << "rejecting mutation on in-flight"
                                      << QString::fromStdString(id);
            return Result<void>::err(Error::conflict(
                std::string(Traits::name) + " " + id + " has a mutation in flight"));
        }
        qCDebug(tetherStoreLog) << name() << "queueing mutation on" << QString::fromStdString(id);
        auto shared_done = std::make_shared<Completion<void>>(std::move(done));
        queued_[id].push_back(Deferred{
            [runner = std::move(runner), shared_done](const EntityId& target) {
                auto dispatched = runner(target, *shared_done);
                if (dispatched.is_err()) settle(*shared_done, std::move(dispatched));
            },
            [shared_done](Error error) {
                settle(*shared_done, Result<void>::err(std::move(error)));
            }
        });
        return Result<void>::ok();
    }

    // Run queued mutations for `id` until one of them is in flight again.
    void drain(const EntityId& id) {
        while (!in_flight(id)) {
            auto it = queued_.find(id);
            if (it == queued_.end()) return;
            auto item = std::move(it->second.front());
            it->second.pop_front();
            if (it->second.empty()) queued_.erase(it);
            item.run(id);
        }
    }

    void cancel_queued(const EntityId& id, const Error& error) {
        auto it = queued_.find(id);
        if (it == queued_.end()) return;
        auto items = std::move(it->second);
        queued_.erase(it);
        for (auto& item : items) item.cancel(error);
    }

    std::vector<std::string> take_index_memberships(const EntityId& id) {
        std::vector<std::string> marks;
        for (auto& [index, ids] : indexes_) {
            if (ids.erase(id) > 0) marks.push_back(index);
        }
        return marks;
    }

    /**
     * Install a loaded snapshot. Entities with a mutation in flight keep
     * their local state (present or removed) until the mutation settles;
     * index memberships survive for ids that are still present.
     */
    void replace_all(std::vector<E> loaded) {
        std::unordered_map<EntityId, std::optional<E>> overlay;
        for (const auto& id : in_flight_) {
            auto it = entities_.find(id);
            overlay[id] = it == entities_.end() ? std::nullopt : std::optional<E>(it->second);
        }

        entities_.clear();
        for (auto& e : loaded) {
            auto id = Traits::id(e);
            entities_[id] = std::move(e);
        }
        for (auto& [id, local] : overlay) {
            if (local) {
                entities_[id] = std::move(*local);
            } else {
                entities_.erase(id);
            }
        }
        for (auto& [index, ids] : indexes_) {
            for (auto it = ids.begin(); it != ids.end();) {
                it = entities_.count(*it) ? std::next(it) : ids.erase(it);
            }
        }
        qCDebug(tetherStoreLog) << name() << "loaded" << entities_.size() << "entities";
        notify(StoreNotice::Changed);
    }

    Port& port_;
    MutationPolicy policy_;
    Listener listener_;

    std::unordered_map<EntityId, E> entities_;
    std::map<std::string, std::set<EntityId>> indexes_;
    std::unordered_set<EntityId> in_flight_;
    std::unordered_map<EntityId, std::deque<Deferred>> queued_;
    int pending_mutations_ = 0;

    std::optional<ScopeKey> scope_;
    bool loading_ = false;
    uint64_t load_generation_ = 0;
    uint64_t epoch_ = 0;
    std::optional<Error> last_error_;

    // Port completions hold a weak reference and do nothing once it expires.
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

} // namespace tether::store
