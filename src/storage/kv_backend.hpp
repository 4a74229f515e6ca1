#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstddef>

// Asynchronous, size-limited key-value backend.
//
// Every call returns immediately; the completion callback fires exactly once,
// possibly on another thread, possibly never (the caller enforces deadlines).
// `error` is set when the operation failed.
class KvBackend {
public:
    using DoneCallback  = std::function<void(std::optional<std::string> error)>;
    using ValueCallback = std::function<void(std::optional<std::string> error,
                                             std::optional<std::string> value)>;
    using KeysCallback  = std::function<void(std::optional<std::string> error,
                                             std::vector<std::string> keys)>;

    virtual ~KvBackend() = default;

    virtual bool is_available() const = 0;

    // Largest value a single set_item accepts
    virtual size_t max_value_size() const = 0;

    virtual void set_item(const std::string& key, const std::string& value, DoneCallback done) = 0;
    virtual void get_item(const std::string& key, ValueCallback done) = 0;
    virtual void remove_item(const std::string& key, DoneCallback done) = 0;
    virtual void get_keys(KeysCallback done) = 0;
};
