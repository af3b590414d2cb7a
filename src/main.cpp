#include "commands/CommandHandler.hpp"
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <command> <args>" << std::endl;
        std::cerr << "\nAvailable commands:" << std::endl;
        std::cerr << "    copy [options] <source> <destination>" << std::endl;
        std::cerr << "        -p, --parts <n>          number of slices (default 5)" << std::endl;
        std::cerr << "        -s, --slice-size <size>  target slice size, K/M/G suffixes" << std::endl;
        std::cerr << "        -j, --jobs <n>           concurrent slices (default 5)" << std::endl;
        std::cerr << "        -c, --chunk-size <size>  I/O chunk size (default 1M)" << std::endl;
        std::cerr << "        --keep-going             keep starting slices after a failure" << std::endl;
        std::cerr << "        --no-progress            no progress bar" << std::endl;
        std::cerr << "        --verify                 compare SHA-1 of source and destination" << std::endl;
        std::cerr << "        --report <file>          write the run result as JSON" << std::endl;
        std::cerr << "        --remove-partial         delete the destination if the copy failed" << std::endl;
        std::cerr << "    plan [-p <n> | -s <size>] <file>" << std::endl;
        std::cerr << "    digest <file>" << std::endl;
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    return CommandHandler::execute(command, args);
}
