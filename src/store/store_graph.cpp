#include "store/store_graph.hpp"

#include "app/logging.hpp"

namespace tether::store {

StoreGraph::StoreGraph(app::AppContext& app, QObject* parent)
    : QObject(parent),
      context_(app),
      accounts_(app, context_),
      members_(app, context_),
      workspaces_(app, context_, members_),
      documents_(app, context_, members_),
      organizations_(app, context_, members_),
      bots_(app, context_),
      notifications_(app, context_) {
    qCDebug(tetherStoreLog) << "store graph ready";
}

StoreGraph::~StoreGraph() = default;

} // namespace tether::store
