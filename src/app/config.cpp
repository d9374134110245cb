#include "app/config.hpp"

#include "app/logging.hpp"

#include <QSettings>

namespace tether {

namespace {

constexpr auto kMutationPolicy = "stores/mutation_policy";
constexpr auto kRecentDocumentsLimit = "stores/recent_documents_limit";
constexpr auto kRecentWorkspacesLimit = "stores/recent_workspaces_limit";
constexpr auto kHistoryLimit = "context/history_limit";
constexpr auto kLogFilePath = "logging/file_path";

int read_int(QSettings& settings, const char* key, int fallback, int minimum) {
    const auto raw = settings.value(QString::fromLatin1(key));
    if (!raw.isValid()) return fallback;
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok || value < minimum) {
        qCWarning(tetherStoreLog) << "ignoring invalid" << key << "=" << raw.toString();
        return fallback;
    }
    return value;
}

} // namespace

std::string_view policy_name(MutationPolicy policy) {
    switch (policy) {
        case MutationPolicy::Reject: return "reject";
        case MutationPolicy::Queue: return "queue";
    }
    return "reject";
}

std::optional<MutationPolicy> parse_mutation_policy(std::string_view name) {
    if (name == "reject") return MutationPolicy::Reject;
    if (name == "queue") return MutationPolicy::Queue;
    return std::nullopt;
}

namespace app {

StoreConfig StoreConfig::load(QSettings& settings) {
    StoreConfig config;

    const auto policy = settings.value(QString::fromLatin1(kMutationPolicy)).toString();
    if (!policy.isEmpty()) {
        const auto utf8 = policy.trimmed().toLower().toStdString();
        if (auto parsed = parse_mutation_policy(utf8)) {
            config.mutation_policy = *parsed;
        } else {
            qCWarning(tetherStoreLog) << "unknown mutation policy" << policy << "- using reject";
        }
    }

    config.recent_documents_limit =
        read_int(settings, kRecentDocumentsLimit, config.recent_documents_limit, 1);
    config.recent_workspaces_limit =
        read_int(settings, kRecentWorkspacesLimit, config.recent_workspaces_limit, 1);
    config.history_limit = read_int(settings, kHistoryLimit, config.history_limit, 0);
    config.log_file_path = settings.value(QString::fromLatin1(kLogFilePath)).toString();
    return config;
}

void StoreConfig::save(QSettings& settings) const {
    settings.setValue(QString::fromLatin1(kMutationPolicy),
                      QString::fromLatin1(policy_name(mutation_policy).data()));
    settings.setValue(QString::fromLatin1(kRecentDocumentsLimit), recent_documents_limit);
    settings.setValue(QString::fromLatin1(kRecentWorkspacesLimit), recent_workspaces_limit);
    settings.setValue(QString::fromLatin1(kHistoryLimit), history_limit);
    settings.setValue(QString::fromLatin1(kLogFilePath), log_file_path);
}

} // namespace app
} // namespace tether
