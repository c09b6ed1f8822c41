#include "cmd_check.h"
#include "cmd_trust.h"
#include "cmd_watch.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "scriptgate_cli <hash|check|trust|notes|files|flags|watch|audit> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "hash") return cmd_hash(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    if (cmd == "trust") return cmd_trust(argc, argv);
    if (cmd == "notes") return cmd_notes(argc, argv);
    if (cmd == "files") return cmd_files(argc, argv);
    if (cmd == "flags") return cmd_flags(argc, argv);
    if (cmd == "watch") return cmd_watch(argc, argv);
    if (cmd == "audit") return cmd_audit(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
