#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "kv_backend.hpp"

// KvBackend over a shared YAML file (network mount, synced folder).
//
// Operations are queued and executed in order on a worker thread, which
// re-reads the file each time so writes from other processes are visible.
// Values above `max_value_size` are rejected like a real size-limited remote.
class FileBackend : public KvBackend {
public:
    FileBackend(const std::filesystem::path& path, size_t max_value_size);
    ~FileBackend() override;

    FileBackend(const FileBackend&) = delete;
    FileBackend& operator=(const FileBackend&) = delete;

    bool is_available() const override;
    size_t max_value_size() const override { return max_value_size_; }

    void set_item(const std::string& key, const std::string& value, DoneCallback done) override;
    void get_item(const std::string& key, ValueCallback done) override;
    void remove_item(const std::string& key, DoneCallback done) override;
    void get_keys(KeysCallback done) override;

private:
    void enqueue(std::function<void()> task);
    void worker_loop();

    std::filesystem::path path_;
    size_t max_value_size_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    std::atomic<bool> running_{true};
    std::thread worker_;
};
