#pragma once

#include "store/Txn.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace gr::store {

// Transactional persistence for grants and entity flags. Every mutation of
// the access tables runs inside exec() so that a failed check or a thrown
// exception leaves no partial effect.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual std::unique_ptr<Txn> begin(TxnMode mode) = 0;
    [[nodiscard]] virtual std::string name() const = 0;

    template <typename Func>
    auto exec(const std::string& ctx, const TxnMode mode, Func&& func) -> decltype(func(std::declval<Txn&>())) {
        const auto log = logging::LogRegistry::store();
        log->trace("[Store::exec] Starting transaction: {}", ctx);
        auto txn = begin(mode);

        try {
            if constexpr (std::is_void_v<decltype(func(*txn))>) {
                func(*txn);
                txn->commit();
                log->trace("[Store::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(*txn);
                txn->commit();
                log->trace("[Store::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (...) {
            log->debug("[Store::exec] Exception in transaction context '{}', rolling back", ctx);
            txn->rollback();
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<Txn&>()))>) {
            throw std::logic_error("Unreachable path in Store::exec");
        }
    }

    template <typename Func>
    auto read(const std::string& ctx, Func&& func) {
        return exec(ctx, TxnMode::ReadOnly, std::forward<Func>(func));
    }

    template <typename Func>
    auto write(const std::string& ctx, Func&& func) {
        return exec(ctx, TxnMode::ReadWrite, std::forward<Func>(func));
    }
};

} // namespace gr::store
