#include <iostream>
#include <optional>
#include <string>

#include "LedgerApp.hpp"

/**
 * Usage: idle_ledger [save-file]
 * Reads shell commands from stdin until EOF or Ctrl-C. With a save file the
 * ledger is restored from it at start-up and written back on exit.
 */
int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [save-file]" << std::endl;
        return 2;
    }

    std::optional<std::string> savePath;
    if (argc == 2) savePath = argv[1];

    LedgerApp app;
    app.run(std::cin, savePath);
    return 0;
}
