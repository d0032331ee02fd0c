#pragma once

#include "config.hpp"
#include "sender.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wrpzmq {

/**
 * Router maps a service name to the live Sender for it.
 *
 * - Unicast: the destination locator's service picks the Sender; an unknown
 *   service yields errc::not_handled so the Router can sit inside a chain.
 * - Broadcast: service-alive messages go to every Sender in a snapshot of the
 *   table, best effort.
 * - At most one Sender per name. A replaced Sender is closed; a Sender that
 *   closes removes its own entry, but never an entry that replaced it.
 *
 * The table is guarded by a reader/writer lock that is never held across a
 * dial, send or close.
 */
class Router {
public:
    using Factory = std::function<std::shared_ptr<Sender>(const ConnectionConfig&)>;

    // Builds real Connections.
    Router();

    explicit Router(Factory factory);

    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    std::error_code process(const Context& ctx, const Message& msg);

    // Dials a new Sender for `name` and installs it, replacing any previous
    // one, then sends it the authorization handshake. Dial errors are
    // returned and leave the table untouched.
    std::error_code upsert(const std::string& name, const ConnectionConfig& config);

    std::error_code remove(const std::string& name);

    std::error_code close();

    std::vector<std::string> services() const;

    size_t size() const;

private:
    struct Table {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<Sender>> entries;
    };

    static void remove_if_current(const std::weak_ptr<Table>& weak_table,
                                  const std::string& name,
                                  const Sender* sender);

    Factory factory_;
    std::shared_ptr<Table> table_;
};

} // namespace wrpzmq
