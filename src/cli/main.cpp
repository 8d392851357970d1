#include "cli.h"

#include <iostream>

int main(int argc, char** argv) {
    try {
        ua::CLI cli;

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        return cli.execute(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ua::EXIT_UPLOAD_FAILED;
    }
}
