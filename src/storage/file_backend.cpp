#include "file_backend.hpp"
#include "local_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

FileBackend::FileBackend(const fs::path& path, size_t max_value_size)
    : path_(path), max_value_size_(max_value_size) {
    worker_ = std::thread(&FileBackend::worker_loop, this);
}

FileBackend::~FileBackend() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool FileBackend::is_available() const {
    if (path_.empty()) return false;
    std::error_code ec;
    fs::path dir = path_.has_parent_path() ? path_.parent_path() : fs::current_path(ec);
    return !ec && fs::is_directory(dir, ec);
}

// ── Queue ──────────────────────────────────────────────────

void FileBackend::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

void FileBackend::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            // Drain pending work before exiting so no callback is lost
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            cardsync_log(fmt::format("file_backend: task failed: {}", e.what()));
        }
    }
}

// ── Operations ─────────────────────────────────────────────

void FileBackend::set_item(const std::string& key, const std::string& value, DoneCallback done) {
    if (value.size() > max_value_size_) {
        done(fmt::format("value for {} exceeds {} characters", key, max_value_size_));
        return;
    }
    enqueue([this, key, value, done = std::move(done)] {
        LocalStore store(path_);
        auto r = store.set(key, value);
        done(r.is_ok() ? std::nullopt : std::optional<std::string>(r.error));
    });
}

void FileBackend::get_item(const std::string& key, ValueCallback done) {
    enqueue([this, key, done = std::move(done)] {
        LocalStore store(path_);
        done(std::nullopt, store.get(key));
    });
}

void FileBackend::remove_item(const std::string& key, DoneCallback done) {
    enqueue([this, key, done = std::move(done)] {
        LocalStore store(path_);
        auto r = store.remove(key);
        done(r.is_ok() ? std::nullopt : std::optional<std::string>(r.error));
    });
}

void FileBackend::get_keys(KeysCallback done) {
    enqueue([this, done = std::move(done)] {
        LocalStore store(path_);
        done(std::nullopt, store.keys());
    });
}
