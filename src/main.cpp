// src/main.cpp
#include <iostream>

#include "cli.hpp"

int main(int argc, char** argv) {
    return run_disasm(argc, argv, std::cout, std::cerr);
}
