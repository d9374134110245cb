#pragma once

#include <QString>
#include <optional>
#include <string_view>

class QSettings;

namespace tether {

/**
 * MutationPolicy - What an entity store does with a mutation on an id that
 * already has one in flight.
 */
enum class MutationPolicy {
    Reject,  // fail fast with ConflictError
    Queue    // dispatch once the earlier mutation settles
};

[[nodiscard]] std::string_view policy_name(MutationPolicy policy);
[[nodiscard]] std::optional<MutationPolicy> parse_mutation_policy(std::string_view name);

namespace app {

/**
 * StoreConfig - Tunables of the store graph, read from QSettings.
 *
 * Keys:
 *   stores/mutation_policy           reject | queue
 *   stores/recent_documents_limit    > 0
 *   stores/recent_workspaces_limit   > 0
 *   context/history_limit            >= 0
 *   logging/file_path                empty disables file logging
 *
 * Missing or unparsable values keep the defaults below.
 */
struct StoreConfig {
    MutationPolicy mutation_policy = MutationPolicy::Reject;
    int recent_documents_limit = 10;
    int recent_workspaces_limit = 5;
    int history_limit = 50;
    QString log_file_path;

    [[nodiscard]] static StoreConfig load(QSettings& settings);
    void save(QSettings& settings) const;
};

} // namespace app
} // namespace tether
