#pragma once

#include "config/Config.hpp"
#include "store/Store.hpp"

#include <memory>

namespace gr::database {

// Opens the store named by config.store.backend.
std::shared_ptr<store::Store> openStore(const config::Config& config);

}
