#pragma once

#include "app/logging.hpp"
#include "storage/repository.hpp"
#include <QMetaObject>
#include <QObject>
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace tether::storage {

enum class RepositoryOp {
    GetById,
    ListByScope,
    Create,
    Update,
    Remove
};

/**
 * MemoryRepository<E> - In-process implementation of Repository<E>.
 *
 * Completions are posted to the event loop of the thread that owns the
 * repository, never invoked inline, so callers observe the same ordering
 * as with a remote backend. Pending completions are dropped if the
 * repository is destroyed first.
 *
 * Usage:
 *   MemoryRepository<Document> docs;
 *   docs.seed(create_document("w1", "Notes", DocumentType::File, "u1"));
 *   docs.fail_next(RepositoryOp::Update, Error::transport("offline", true));
 */
template<typename E>
class MemoryRepository final : public Repository<E> {
public:
    using Traits = EntityTraits<E>;
    using Patch = typename Traits::Patch;

    MemoryRepository() = default;
    MemoryRepository(const MemoryRepository&) = delete;
    MemoryRepository& operator=(const MemoryRepository&) = delete;

    void get_by_id(const EntityId& id, Completion<E> done) override {
        count(RepositoryOp::GetById);
        if (auto failure = take_failure(RepositoryOp::GetById)) {
            post(std::move(done), Result<E>::err(std::move(*failure)));
            return;
        }
        auto it = rows_.find(id);
        if (it == rows_.end()) {
            post(std::move(done), Result<E>::err(not_found(id)));
            return;
        }
        post(std::move(done), Result<E>::ok(it->second));
    }

    void list_by_scope(const ScopeKey& scope, Completion<std::vector<E>> done) override {
        count(RepositoryOp::ListByScope);
        qCDebug(tetherRepositoryLog) << entity_name() << "list"
                                     << QString::fromStdString(scope.to_string());
        if (auto failure = take_failure(RepositoryOp::ListByScope)) {
            post(std::move(done), Result<std::vector<E>>::err(std::move(*failure)));
            return;
        }
        std::vector<E> out;
        for (const auto& [id, row] : rows_) {
            if (Traits::in_scope(row, scope)) out.push_back(row);
        }
        post(std::move(done), Result<std::vector<E>>::ok(std::move(out)));
    }

    void create(const E& draft, Completion<E> done) override {
        count(RepositoryOp::Create);
        if (auto failure = take_failure(RepositoryOp::Create)) {
            post(std::move(done), Result<E>::err(std::move(*failure)));
            return;
        }
        E row = draft;
        Traits::assign_id(row, Uuid::generate().to_string());
        Traits::stamp(row, Timestamp::now(), true);
        rows_[Traits::id(row)] = row;
        qCDebug(tetherRepositoryLog) << entity_name() << "created"
                                     << QString::fromStdString(Traits::id(row));
        post(std::move(done), Result<E>::ok(std::move(row)));
    }

    void update(const EntityId& id, const Patch& patch, Completion<void> done) override {
        count(RepositoryOp::Update);
        if (auto failure = take_failure(RepositoryOp::Update)) {
            post(std::move(done), Result<void>::err(std::move(*failure)));
            return;
        }
        auto it = rows_.find(id);
        if (it == rows_.end()) {
            post(std::move(done), Result<void>::err(not_found(id)));
            return;
        }
        it->second = Traits::apply(std::move(it->second), patch);
        post(std::move(done), Result<void>::ok());
    }

    void remove(const EntityId& id, Completion<void> done) override {
        count(RepositoryOp::Remove);
        if (auto failure = take_failure(RepositoryOp::Remove)) {
            post(std::move(done), Result<void>::err(std::move(*failure)));
            return;
        }
        if (rows_.erase(id) == 0) {
            post(std::move(done), Result<void>::err(not_found(id)));
            return;
        }
        qCDebug(tetherRepositoryLog) << entity_name() << "removed" << QString::fromStdString(id);
        post(std::move(done), Result<void>::ok());
    }

    // Backend-side setup and inspection

    /**
     * Store an entity as-is. An entity without an id gets one assigned.
     * Returns the stored id.
     */
    EntityId seed(E entity) {
        if (Traits::id(entity).empty()) {
            Traits::assign_id(entity, Uuid::generate().to_string());
        }
        auto id = Traits::id(entity);
        rows_[id] = std::move(entity);
        return id;
    }

    void seed(const std::vector<E>& entities) {
        for (const auto& e : entities) seed(e);
    }

    [[nodiscard]] std::optional<E> find(const EntityId& id) const {
        auto it = rows_.find(id);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] size_t size() const { return rows_.size(); }

    /**
     * The next call of `op` fails with `error` instead of touching the rows.
     * Failures queue up per operation.
     */
    void fail_next(RepositoryOp op, Error error) {
        failures_[index(op)].push_back(std::move(error));
    }

    [[nodiscard]] int call_count(RepositoryOp op) const { return calls_[index(op)]; }

    [[nodiscard]] int mutation_count() const {
        return call_count(RepositoryOp::Create) + call_count(RepositoryOp::Update)
             + call_count(RepositoryOp::Remove);
    }

    void reset_counts() { calls_.fill(0); }

private:
    static constexpr size_t index(RepositoryOp op) { return static_cast<size_t>(op); }

    static QLatin1String entity_name() {
        return QLatin1String(Traits::name.data(), static_cast<qsizetype>(Traits::name.size()));
    }

    static Error not_found(const EntityId& id) {
        return Error::not_found(std::string(Traits::name) + " " + id + " not found");
    }

    void count(RepositoryOp op) { ++calls_[index(op)]; }

    std::optional<Error> take_failure(RepositoryOp op) {
        auto& pending = failures_[index(op)];
        if (pending.empty()) return std::nullopt;
        auto error = std::move(pending.front());
        pending.erase(pending.begin());
        qCWarning(tetherRepositoryLog) << entity_name() << "injected failure"
                                       << QString::fromStdString(error.to_string());
        return error;
    }

    template<typename T>
    void post(Completion<T> done, Result<T> result) {
        QMetaObject::invokeMethod(&loop_anchor_,
            [done = std::move(done), result = std::move(result)]() mutable {
                if (done) done(std::move(result));
            },
            Qt::QueuedConnection);
    }

    std::map<EntityId, E> rows_;
    std::array<int, 5> calls_{};
    std::array<std::vector<Error>, 5> failures_;
    // Receiver for queued completions; destroying it drops the pending ones.
    QObject loop_anchor_;
};

} // namespace tether::storage
