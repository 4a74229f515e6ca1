#include "remote_store.hpp"
#include "local_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <atomic>
#include <future>
#include <memory>

namespace {

// One in-flight backend call. Shared between the waiting caller and the
// completion callback so a late completion never touches freed state.
template <typename T>
struct Pending {
    std::promise<T> promise;
    std::atomic<bool> settled{false};

    void settle(T value) {
        if (!settled.exchange(true)) {
            promise.set_value(std::move(value));
        }
    }
};

using DoneOutcome = std::optional<std::string>;
using ValueOutcome = std::pair<std::optional<std::string>, std::optional<std::string>>;
using KeysOutcome = std::pair<std::optional<std::string>, std::vector<std::string>>;

template <typename T>
bool wait_for(std::future<T>& future, std::chrono::milliseconds timeout) {
    return future.wait_for(timeout) == std::future_status::ready;
}

} // namespace

RemoteStore::RemoteStore(KvBackend* primary, LocalStore& fallback, int timeout_ms)
    : timeout_(timeout_ms) {
    if (primary && primary->is_available()) {
        backend_ = primary;
        is_fallback_ = false;
    } else {
        backend_ = &fallback;
        is_fallback_ = true;
    }
    cardsync_log(fmt::format("remote_store: using {} storage (timeout {}ms)",
                             storage_type(), timeout_ms));
}

size_t RemoteStore::max_value_size() const {
    return backend_->max_value_size();
}

Result<void> RemoteStore::set(const std::string& key, const std::string& value) {
    if (value.size() > backend_->max_value_size()) {
        return Result<void>::Err(fmt::format("value for {} is {} characters, limit is {}",
                                             key, value.size(), backend_->max_value_size()));
    }

    auto pending = std::make_shared<Pending<DoneOutcome>>();
    auto future = pending->promise.get_future();
    try {
        backend_->set_item(key, value, [pending](DoneOutcome error) {
            pending->settle(std::move(error));
        });
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("set {}: {}", key, e.what()));
    }

    if (!wait_for(future, timeout_)) {
        cardsync_log(fmt::format("remote_store: set {} timed out", key));
        return Result<void>::Err(fmt::format("set {} timed out after {}ms", key, timeout_.count()),
                                 ErrorKind::Timeout);
    }
    auto error = future.get();
    if (error) {
        return Result<void>::Err(fmt::format("set {}: {}", key, *error));
    }
    return Result<void>::Ok();
}

Result<std::optional<std::string>> RemoteStore::get(const std::string& key) {
    using R = Result<std::optional<std::string>>;

    auto pending = std::make_shared<Pending<ValueOutcome>>();
    auto future = pending->promise.get_future();
    try {
        backend_->get_item(key, [pending](std::optional<std::string> error,
                                          std::optional<std::string> value) {
            pending->settle({std::move(error), std::move(value)});
        });
    } catch (const std::exception& e) {
        return R::Err(fmt::format("get {}: {}", key, e.what()));
    }

    if (!wait_for(future, timeout_)) {
        cardsync_log(fmt::format("remote_store: get {} timed out", key));
        return R::Err(fmt::format("get {} timed out after {}ms", key, timeout_.count()),
                      ErrorKind::Timeout);
    }
    auto [error, value] = future.get();
    if (error) {
        return R::Err(fmt::format("get {}: {}", key, *error));
    }
    return R::Ok(std::move(value));
}

Result<void> RemoteStore::remove(const std::string& key) {
    auto pending = std::make_shared<Pending<DoneOutcome>>();
    auto future = pending->promise.get_future();
    try {
        backend_->remove_item(key, [pending](DoneOutcome error) {
            pending->settle(std::move(error));
        });
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("remove {}: {}", key, e.what()));
    }

    if (!wait_for(future, timeout_)) {
        cardsync_log(fmt::format("remote_store: remove {} timed out", key));
        return Result<void>::Err(fmt::format("remove {} timed out after {}ms", key, timeout_.count()),
                                 ErrorKind::Timeout);
    }
    auto error = future.get();
    if (error) {
        return Result<void>::Err(fmt::format("remove {}: {}", key, *error));
    }
    return Result<void>::Ok();
}

Result<std::vector<std::string>> RemoteStore::keys() {
    using R = Result<std::vector<std::string>>;

    auto pending = std::make_shared<Pending<KeysOutcome>>();
    auto future = pending->promise.get_future();
    try {
        backend_->get_keys([pending](std::optional<std::string> error,
                                     std::vector<std::string> keys) {
            pending->settle({std::move(error), std::move(keys)});
        });
    } catch (const std::exception& e) {
        return R::Err(fmt::format("get_keys: {}", e.what()));
    }

    if (!wait_for(future, timeout_)) {
        return R::Err(fmt::format("get_keys timed out after {}ms", timeout_.count()),
                      ErrorKind::Timeout);
    }
    auto [error, keys] = future.get();
    if (error) {
        return R::Err("get_keys: " + *error);
    }
    return R::Ok(std::move(keys));
}

Result<size_t> RemoteStore::clear() {
    auto listed = keys();
    if (listed.is_err()) {
        return Result<size_t>::Err(listed);
    }

    size_t removed = 0;
    size_t failed = 0;
    for (const auto& key : listed.value) {
        auto r = remove(key);
        if (r.is_ok()) {
            ++removed;
        } else {
            ++failed;
            cardsync_log("remote_store: clear could not remove " + key + ": " + r.error);
        }
    }
    if (failed > 0) {
        cardsync_log(fmt::format("remote_store: clear removed {} keys, {} failed", removed, failed));
    }
    return Result<size_t>::Ok(removed);
}
