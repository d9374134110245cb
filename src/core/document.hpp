#pragma once

#include "core/entity.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether {

enum class DocumentType {
    Folder,
    File,
    Link
};

[[nodiscard]] constexpr std::string_view document_type_name(DocumentType type) {
    switch (type) {
        case DocumentType::Folder: return "folder";
        case DocumentType::File: return "file";
        case DocumentType::Link: return "link";
    }
    return "unknown";
}

/**
 * Document - A file, folder or link inside a workspace.
 *
 * Folders form a tree through parent_id.
 */
struct Document {
    EntityId id;
    EntityId workspace_id;
    std::string name;
    DocumentType type{DocumentType::File};
    std::string mime_type;
    int64_t size{0};
    std::optional<EntityId> parent_id;
    std::string link_url;
    std::vector<std::string> tags;
    EntityId owner_id;
    EntityId created_by;
    EntityId updated_by;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<Timestamp> last_accessed_at;

    bool operator==(const Document&) const = default;
};

struct DocumentPatch {
    std::optional<std::string> name;
    std::optional<std::optional<EntityId>> parent_id;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> link_url;
    std::optional<EntityId> updated_by;
    std::optional<Timestamp> last_accessed_at;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Document create_document(EntityId workspace_id,
                                              std::string name,
                                              DocumentType type,
                                              EntityId created_by,
                                              std::optional<EntityId> parent_id = std::nullopt) {
    auto now = Timestamp::now();
    Document doc;
    doc.workspace_id = std::move(workspace_id);
    doc.name = std::move(name);
    doc.type = type;
    doc.parent_id = std::move(parent_id);
    doc.owner_id = created_by;
    doc.updated_by = created_by;
    doc.created_by = std::move(created_by);
    doc.created_at = now;
    doc.updated_at = now;
    return doc;
}

[[nodiscard]] inline Result<void> validate_document_name(std::string_view name) {
    if (name.empty()) {
        return Result<void>::err(Error::validation("document name must not be empty"));
    }
    if (name.find('/') != std::string_view::npos) {
        return Result<void>::err(Error::validation("document name must not contain '/'"));
    }
    return Result<void>::ok();
}

[[nodiscard]] inline Document apply_patch(Document doc, const DocumentPatch& patch) {
    if (patch.name) doc.name = *patch.name;
    if (patch.parent_id) doc.parent_id = *patch.parent_id;
    if (patch.tags) doc.tags = *patch.tags;
    if (patch.link_url) doc.link_url = *patch.link_url;
    if (patch.updated_by) doc.updated_by = *patch.updated_by;
    if (patch.last_accessed_at) {
        doc.last_accessed_at = *patch.last_accessed_at;
    } else {
        doc.updated_at = Timestamp::now();
    }
    return doc;
}

[[nodiscard]] inline std::vector<Document> filter_by_type(const std::vector<Document>& docs,
                                                          DocumentType type) {
    std::vector<Document> out;
    for (const auto& d : docs) {
        if (d.type == type) out.push_back(d);
    }
    return out;
}

/**
 * Children of a folder (or of the root when parent is empty), folders first,
 * then by name.
 */
[[nodiscard]] inline std::vector<Document> children_of(const std::vector<Document>& docs,
                                                       const std::optional<EntityId>& parent) {
    std::vector<Document> out;
    for (const auto& d : docs) {
        if (d.parent_id == parent) out.push_back(d);
    }
    std::sort(out.begin(), out.end(), [](const Document& a, const Document& b) {
        bool a_folder = a.type == DocumentType::Folder;
        bool b_folder = b.type == DocumentType::Folder;
        if (a_folder != b_folder) return a_folder;
        return a.name < b.name;
    });
    return out;
}

/**
 * Most recently touched first (access time, falling back to update time).
 */
[[nodiscard]] inline std::vector<Document> most_recent(std::vector<Document> docs, size_t limit) {
    auto touched = [](const Document& d) {
        return std::max(d.last_accessed_at.value_or(Timestamp{}), d.updated_at);
    };
    std::sort(docs.begin(), docs.end(), [&](const Document& a, const Document& b) {
        auto ta = touched(a);
        auto tb = touched(b);
        if (ta != tb) return ta > tb;
        return a.id < b.id;
    });
    if (docs.size() > limit) docs.resize(limit);
    return docs;
}

/**
 * Case-insensitive substring match on the name.
 */
[[nodiscard]] inline bool name_matches(const Document& doc, std::string_view query) {
    auto lower = [](std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    };
    return lower(doc.name).find(lower(query)) != std::string::npos;
}

template<>
struct EntityTraits<Document> {
    using Patch = DocumentPatch;
    static constexpr std::string_view name = "document";

    static const EntityId& id(const Document& d) { return d.id; }
    static void assign_id(Document& d, EntityId id) { d.id = std::move(id); }
    static void stamp(Document& d, Timestamp now, bool created) {
        if (created) d.created_at = now;
        d.updated_at = now;
    }
    static Document apply(Document d, const DocumentPatch& p) { return apply_patch(std::move(d), p); }
    static bool in_scope(const Document& d, const ScopeKey& key) {
        return key.field == ScopeField::Workspace && d.workspace_id == key.value;
    }
};

} // namespace tether
