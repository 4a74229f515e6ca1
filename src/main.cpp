#include <iostream>
#include <string>
#include "cli/cardsync_cli.hpp"
#include "cli/theme.hpp"

static void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    cardsync status" << theme::color::RESET
              << theme::color::DIM << "         Show revisions and sync state" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync show" << theme::color::RESET
              << theme::color::DIM << "           Load (local or remote) and print the deck" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync save " << theme::color::RESET
              << theme::color::BROWN << "<file>" << theme::color::RESET
              << theme::color::DIM << "    Save a deck and sync it" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync push" << theme::color::RESET
              << theme::color::DIM << "           Push local changes now" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync pull" << theme::color::RESET
              << theme::color::DIM << "           Replace local data with the remote copy" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync migrate" << theme::color::RESET
              << theme::color::DIM << "        Convert legacy remote layout" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync reset" << theme::color::RESET
              << theme::color::DIM << "          Clear revisions and remote data" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync selftest" << theme::color::RESET
              << theme::color::DIM << "       Round-trip payloads through the store" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    cardsync init" << theme::color::RESET
              << theme::color::DIM << "           Write the default config" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>          Use another config file\n"
              << "    cardsync --version       Show version\n"
              << "    cardsync --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        int argi = 1;
        std::string config_path;
        if (argc > 2 && std::string(argv[1]) == "--config") {
            config_path = argv[2];
            argi = 3;
        }

        if (argi >= argc) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[argi];
        std::string arg = argi + 1 < argc ? argv[argi + 1] : "";
        CardsyncCLI cli(config_path);

        if (cmd == "--version") {
            std::cout << theme::bold("cardsync") << theme::dim(" version 0.1.0") << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init") {
            return cli.run_init();
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "show") {
            return cli.run_show();
        } else if (cmd == "save") {
            if (arg.empty()) {
                std::cout << theme::fail("Missing file name.");
                std::cout << theme::step("Usage: cardsync save <file>");
                return 1;
            }
            return cli.run_save(arg);
        } else if (cmd == "push") {
            return cli.run_push();
        } else if (cmd == "pull") {
            return cli.run_pull();
        } else if (cmd == "migrate") {
            return cli.run_migrate();
        } else if (cmd == "reset") {
            return cli.run_reset();
        } else if (cmd == "selftest") {
            return cli.run_selftest();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const SyncError& e) {
        std::cout << theme::fail(std::string(error_kind_name(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
