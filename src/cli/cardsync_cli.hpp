#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include <sync/sync_context.hpp>

// One-shot commands over a SyncContext built from the config file.
// Each run_* returns the process exit code.
class CardsyncCLI {
public:
    explicit CardsyncCLI(const fs::path& config_path = fs::path());

    int run_init();
    int run_status();
    int run_show();
    int run_save(const std::string& file);
    int run_push();
    int run_pull();
    int run_migrate();
    int run_reset();
    int run_selftest();

private:
    fs::path config_path_;
    std::unique_ptr<SyncContext> ctx_;

    bool open_context();
    void print_state(const RevisionState& state) const;
};
