#include "router.hpp"
#include "connection.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "locator.hpp"
#include "logging.hpp"
#include <mutex>
#include <utility>

namespace wrpzmq {

namespace {

constexpr int64_t kAuthorizedStatus = 200;

std::shared_ptr<Sender> make_connection(const ConnectionConfig& config) {
    return Connection::create(config);
}

} // namespace

Router::Router()
    : Router(make_connection) {
}

Router::Router(Factory factory)
    : factory_(std::move(factory))
    , table_(std::make_shared<Table>()) {
}

Router::~Router() {
    if (auto ec = close()) {
        log_debug("router closed with: " + ec.message());
    }
}

std::error_code Router::process(const Context& ctx, const Message& msg) {
    if (msg.type == MessageType::service_alive) {
        std::vector<std::pair<std::string, std::shared_ptr<Sender>>> snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(table_->mutex);
            snapshot.assign(table_->entries.begin(), table_->entries.end());
        }
        for (const auto& entry : snapshot) {
            if (auto ec = entry.second->send(ctx, msg)) {
                log_debug("broadcast to " + entry.first + " failed: " + ec.message());
            }
        }
        return {};
    }

    Locator dest;
    if (auto ec = parse_locator(msg.to(), dest)) {
        return ec;
    }

    std::shared_ptr<Sender> target;
    {
        std::shared_lock<std::shared_mutex> lock(table_->mutex);
        auto it = table_->entries.find(dest.service);
        if (it != table_->entries.end()) {
            target = it->second;
        }
    }
    if (!target) {
        return errc::not_handled;
    }
    return target->send(ctx, msg);
}

std::error_code Router::upsert(const std::string& name, const ConnectionConfig& config) {
    std::shared_ptr<Sender> sender;
    try {
        sender = factory_(config);
    } catch (const std::system_error& e) {
        log_warn("cannot create sender for " + name + ": " + e.what());
        return e.code();
    }
    if (!sender) {
        return errc::invalid_config;
    }

    std::weak_ptr<Table> weak_table = table_;
    const Sender* identity = sender.get();
    sender->add_close_listener([weak_table, name, identity](const std::error_code& reason) {
        if (reason) {
            log_info("sender for " + name + " closed: " + reason.message());
        }
        remove_if_current(weak_table, name, identity);
    });

    if (auto ec = sender->dial()) {
        if (auto close_ec = sender->close()) {
            log_debug("closing undialed sender for " + name + ": " + close_ec.message());
        }
        return ec;
    }

    std::shared_ptr<Sender> previous;
    {
        std::unique_lock<std::shared_mutex> lock(table_->mutex);
        auto& slot = table_->entries[name];
        previous = std::exchange(slot, sender);
    }
    if (previous) {
        if (auto ec = previous->close()) {
            log_debug("closing replaced sender for " + name + ": " + ec.message());
        }
    }
    log_info("registered " + name + " at " + config.url);

    Message auth(MessageType::authorization);
    auth.status = kAuthorizedStatus;
    if (auto ec = sender->send(Context(), auth)) {
        log_warn("authorization handshake to " + name + " failed: " + ec.message());
    }
    return {};
}

std::error_code Router::remove(const std::string& name) {
    std::shared_ptr<Sender> sender;
    {
        std::unique_lock<std::shared_mutex> lock(table_->mutex);
        auto it = table_->entries.find(name);
        if (it == table_->entries.end()) {
            return {};
        }
        sender = std::move(it->second);
        table_->entries.erase(it);
    }
    return sender->close();
}

std::error_code Router::close() {
    std::unordered_map<std::string, std::shared_ptr<Sender>> entries;
    {
        std::unique_lock<std::shared_mutex> lock(table_->mutex);
        entries.swap(table_->entries);
    }
    std::error_code first;
    for (auto& entry : entries) {
        auto ec = entry.second->close();
        if (ec && !first) {
            first = ec;
        }
    }
    return first;
}

std::vector<std::string> Router::services() const {
    std::vector<std::string> names;
    std::shared_lock<std::shared_mutex> lock(table_->mutex);
    names.reserve(table_->entries.size());
    for (const auto& entry : table_->entries) {
        names.push_back(entry.first);
    }
    return names;
}

size_t Router::size() const {
    std::shared_lock<std::shared_mutex> lock(table_->mutex);
    return table_->entries.size();
}

void Router::remove_if_current(const std::weak_ptr<Table>& weak_table,
                               const std::string& name,
                               const Sender* sender) {
    auto table = weak_table.lock();
    if (!table) {
        return;
    }
    std::shared_ptr<Sender> stale;
    {
        std::unique_lock<std::shared_mutex> lock(table->mutex);
        auto it = table->entries.find(name);
        if (it == table->entries.end() || it->second.get() != sender) {
            return;
        }
        stale = std::move(it->second);
        table->entries.erase(it);
    }
    // Released outside the lock; this may be the last reference.
    stale.reset();
}

} // namespace wrpzmq
