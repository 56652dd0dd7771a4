#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "container/container_codec.hpp"
#include "store/gist_store.hpp"

namespace gistvault {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR ----
    CLI(store::GistStore& store, const container::ContainerCodec& codec,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one shell line; returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    store::GistStore& store_;
    const container::ContainerCodec& codec_;
    std::istream& in_;
    std::ostream& out_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    using Args = std::vector<std::string>;
    void process_command(const std::string& command, const Args& args);
    void handle_pack_command(const Args& args);
    void handle_unpack_command(const Args& args);
    void handle_create_command(const Args& args);
    void handle_info_command(const Args& args);
    void handle_get_command(const Args& args);
    void handle_update_command(const Args& args);
    void handle_delete_command(const Args& args);
    void handle_history_command(const Args& args);
    void handle_proof_command(const Args& args);
    void handle_gc_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace gistvault
