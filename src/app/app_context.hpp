#pragma once

#include "app/auth_session.hpp"
#include "app/config.hpp"
#include "storage/repository.hpp"

namespace tether::store {
class EventBus;
}

namespace tether::app {

/**
 * AppContext - Everything a store needs from its surroundings, built once
 * by the embedding application and passed by reference to every store
 * constructor. Stores keep references only; the application owns the
 * referenced objects and must outlive the stores.
 */
struct AppContext {
    store::EventBus& bus;
    const StoreConfig& config;
    storage::Repositories repositories;
    AuthSession* auth = nullptr;
};

} // namespace tether::app
