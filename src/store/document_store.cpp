#include "store/document_store.hpp"

#include "app/logging.hpp"

namespace tether::store {

DocumentStore::DocumentStore(app::AppContext& app,
                             ContextStore& context,
                             const CapabilityGate& gate,
                             QObject* parent)
    : ScopeStoreBase(context, parent),
      config_(app.config),
      gate_(gate),
      documents_(app.repositories.documents, app.config.mutation_policy) {
    track(documents_);
    attach();
}

std::optional<ScopeKey> DocumentStore::scopeFor(const Context& context) const {
    if (!context.scope || !context.workspace_id) return std::nullopt;
    return ScopeKey{ScopeField::Workspace, *context.workspace_id};
}

void DocumentStore::issueLoad(const ScopeKey& key) {
    documents_.load(key);
}

std::optional<Document> DocumentStore::document(const EntityId& id) const {
    if (const auto* d = documents_.get(id)) return *d;
    return std::nullopt;
}

std::vector<Document> DocumentStore::folders() const {
    return filter_by_type(documents_.values(), DocumentType::Folder);
}

std::vector<Document> DocumentStore::files() const {
    return filter_by_type(documents_.values(), DocumentType::File);
}

std::vector<Document> DocumentStore::links() const {
    return filter_by_type(documents_.values(), DocumentType::Link);
}

std::vector<Document> DocumentStore::childrenOf(const std::optional<EntityId>& parent) const {
    return children_of(documents_.values(), parent);
}

std::vector<Document> DocumentStore::starred() const {
    return documents_.indexed(kStarredIndex);
}

std::vector<Document> DocumentStore::recent() const {
    auto touched = documents_.filter([](const Document& d) { return d.type != DocumentType::Folder; });
    return most_recent(std::move(touched), static_cast<size_t>(config_.recent_documents_limit));
}

std::vector<Document> DocumentStore::search(const std::string& query) const {
    if (query.empty()) return {};
    return documents_.filter([&](const Document& d) { return name_matches(d, query); });
}

bool DocumentStore::isStarred(const EntityId& id) const {
    return documents_.is_marked(kStarredIndex, id);
}

bool DocumentStore::star(const EntityId& id) {
    return documents_.mark(kStarredIndex, id);
}

bool DocumentStore::unstar(const EntityId& id) {
    return documents_.unmark(kStarredIndex, id);
}

Result<void> DocumentStore::gate(Capability capability) const {
    const auto& ctx = currentContext();
    if (!ctx.workspace_id) {
        return Result<void>::err(Error::permission_denied("no active workspace"));
    }
    auto allowed = gate_.check(capability, *ctx.workspace_id);
    if (allowed.is_err()) {
        qCWarning(tetherStoreLog) << "document mutation denied:"
                                  << QString::fromStdString(allowed.unwrap_err().message);
    }
    return allowed;
}

Result<void> DocumentStore::validateParent(const std::optional<EntityId>& parent,
                                           const EntityId& moving) const {
    if (!parent) return Result<void>::ok();
    // Walk up from the new parent; meeting the moved document means a cycle.
    std::optional<EntityId> cursor = parent;
    bool first = true;
    size_t hops = 0;
    while (cursor && hops++ <= documents_.size()) {
        if (!moving.empty() && *cursor == moving) {
            return Result<void>::err(Error::validation("a folder cannot be moved into itself"));
        }
        const auto* doc = documents_.get(*cursor);
        if (!doc) {
            return Result<void>::err(Error::validation("parent " + *cursor + " is not a cached folder"));
        }
        if (first && doc->type != DocumentType::Folder) {
            return Result<void>::err(Error::validation("parent " + *cursor + " is not a folder"));
        }
        first = false;
        cursor = doc->parent_id;
    }
    return Result<void>::ok();
}

Result<EntityId> DocumentStore::createDraft(Document draft, Completion<Document> done) {
    if (auto allowed = gate(Capability::DocumentsCreate); allowed.is_err()) {
        return Result<EntityId>::err(allowed.unwrap_err());
    }
    if (auto valid = validate_document_name(draft.name); valid.is_err()) {
        return Result<EntityId>::err(valid.unwrap_err());
    }
    if (auto valid = validateParent(draft.parent_id); valid.is_err()) {
        return Result<EntityId>::err(valid.unwrap_err());
    }
    return documents_.create(draft, std::move(done));
}

Result<EntityId> DocumentStore::create(const std::string& name,
                                       DocumentType type,
                                       const std::optional<EntityId>& parent,
                                       Completion<Document> done) {
    const auto& ctx = currentContext();
    if (!ctx.workspace_id) {
        return Result<EntityId>::err(Error::permission_denied("no active workspace"));
    }
    return createDraft(create_document(*ctx.workspace_id, name, type, ctx.principal_id, parent),
                       std::move(done));
}

Result<EntityId> DocumentStore::createLink(const std::string& name,
                                           const std::string& url,
                                           const std::optional<EntityId>& parent,
                                           Completion<Document> done) {
    const auto& ctx = currentContext();
    if (!ctx.workspace_id) {
        return Result<EntityId>::err(Error::permission_denied("no active workspace"));
    }
    if (url.empty()) {
        return Result<EntityId>::err(Error::validation("link url must not be empty"));
    }
    auto draft = create_document(*ctx.workspace_id, name, DocumentType::Link, ctx.principal_id, parent);
    draft.link_url = url;
    return createDraft(std::move(draft), std::move(done));
}

Result<void> DocumentStore::rename(const EntityId& id, const std::string& name, Completion<void> done) {
    if (auto valid = validate_document_name(name); valid.is_err()) return valid;
    DocumentPatch patch;
    patch.name = name;
    return update(id, patch, std::move(done));
}

Result<void> DocumentStore::move(const EntityId& id,
                                 const std::optional<EntityId>& parent,
                                 Completion<void> done) {
    if (auto valid = validateParent(parent, id); valid.is_err()) return valid;
    DocumentPatch patch;
    patch.parent_id = parent;
    return update(id, patch, std::move(done));
}

Result<void> DocumentStore::update(const EntityId& id, const DocumentPatch& patch, Completion<void> done) {
    if (auto allowed = gate(Capability::DocumentsEdit); allowed.is_err()) return allowed;
    auto stamped = patch;
    stamped.updated_by = currentContext().principal_id;
    return documents_.update(id, stamped, std::move(done));
}

Result<void> DocumentStore::remove(const EntityId& id, Completion<void> done) {
    if (auto allowed = gate(Capability::DocumentsDelete); allowed.is_err()) return allowed;
    return documents_.remove(id, std::move(done));
}

Result<void> DocumentStore::recordAccess(const EntityId& id, Completion<void> done) {
    if (auto allowed = gate(Capability::DocumentsView); allowed.is_err()) return allowed;
    DocumentPatch patch;
    patch.last_accessed_at = Timestamp::now();
    return documents_.update(id, patch, std::move(done));
}

} // namespace tether::store
