#include <iostream>
#include <string>
#include <vector>
#include "errors.hpp"
#include "gateway.hpp"
#include "memory_cmd.hpp"
#include "status.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: polygate <command> [--config PATH] [options]\n\n"
              << "Commands:\n"
              << "  init                        Write a default config and data directories\n"
              << "  gateway [--host H] [--port P]\n"
              << "                              Start the HTTP gateway\n"
              << "  status                      Show current configuration\n"
              << "  sessions [list | show <id> | delete <id>]\n"
              << "                              Inspect journaled sessions\n"
              << "  memory search <query>       Search archival memory\n"
              << "  memory core [name [text]]   Show or replace core memory blocks\n"
              << "  memory history <id>         Show every version of a record\n"
              << "  memory stats                Memory database summary\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::string config_path = polygate::default_config_path();
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(a);
        }
    }

    try {
        if (cmd == "gateway") {
            std::string host;
            int port = 0;
            for (size_t i = 0; i < args.size(); i++) {
                if (args[i] == "--host" && i + 1 < args.size()) {
                    host = args[++i];
                } else if (args[i] == "--port" && i + 1 < args.size()) {
                    port = std::stoi(args[++i]);
                }
            }
            return polygate::cmd_gateway(config_path, host, port);
        }
        else if (cmd == "init") {
            return polygate::cmd_init(config_path);
        }
        else if (cmd == "status") {
            return polygate::cmd_status(config_path);
        }
        else if (cmd == "sessions") {
            std::string subcmd = args.empty() ? "list" : args[0];
            std::string arg = args.size() > 1 ? args[1] : "";
            return polygate::cmd_sessions(config_path, subcmd, arg);
        }
        else if (cmd == "memory") {
            return polygate::cmd_memory(config_path, args);
        }
        else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
    } catch (const polygate::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}
