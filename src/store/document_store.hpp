#pragma once

#include "app/app_context.hpp"
#include "core/document.hpp"
#include "store/capability_gate.hpp"
#include "store/scope_store_base.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tether::store {

/**
 * DocumentStore - Documents of the current workspace.
 *
 * Starring is local state kept in the "starred" index; it is dropped
 * together with the document and restored if a removal rolls back.
 */
class DocumentStore : public ScopeStoreBase {
    Q_OBJECT

public:
    static constexpr auto kStarredIndex = "starred";

    DocumentStore(app::AppContext& app,
                  ContextStore& context,
                  const CapabilityGate& gate,
                  QObject* parent = nullptr);

    // Views
    [[nodiscard]] std::vector<Document> documents() const { return documents_.values(); }
    [[nodiscard]] std::optional<Document> document(const EntityId& id) const;
    [[nodiscard]] std::vector<Document> folders() const;
    [[nodiscard]] std::vector<Document> files() const;
    [[nodiscard]] std::vector<Document> links() const;
    [[nodiscard]] std::vector<Document> childrenOf(const std::optional<EntityId>& parent) const;
    [[nodiscard]] std::vector<Document> starred() const;
    [[nodiscard]] std::vector<Document> recent() const;
    [[nodiscard]] std::vector<Document> search(const std::string& query) const;
    [[nodiscard]] bool isStarred(const EntityId& id) const;

    // Mutations
    Result<EntityId> create(const std::string& name,
                            DocumentType type,
                            const std::optional<EntityId>& parent = std::nullopt,
                            Completion<Document> done = {});
    Result<EntityId> createLink(const std::string& name,
                                const std::string& url,
                                const std::optional<EntityId>& parent = std::nullopt,
                                Completion<Document> done = {});
    Result<void> rename(const EntityId& id, const std::string& name, Completion<void> done = {});
    Result<void> move(const EntityId& id, const std::optional<EntityId>& parent, Completion<void> done = {});
    Result<void> update(const EntityId& id, const DocumentPatch& patch, Completion<void> done = {});
    Result<void> remove(const EntityId& id, Completion<void> done = {});
    Result<void> recordAccess(const EntityId& id, Completion<void> done = {});

    bool star(const EntityId& id);
    bool unstar(const EntityId& id);

protected:
    [[nodiscard]] std::optional<ScopeKey> scopeFor(const Context& context) const override;
    void issueLoad(const ScopeKey& key) override;

private:
    [[nodiscard]] Result<void> gate(Capability capability) const;
    [[nodiscard]] Result<void> validateParent(const std::optional<EntityId>& parent,
                                              const EntityId& moving = {}) const;
    Result<EntityId> createDraft(Document draft, Completion<Document> done);

    const app::StoreConfig& config_;
    const CapabilityGate& gate_;
    EntityStore<Document> documents_;
};

} // namespace tether::store
