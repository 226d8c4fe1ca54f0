#include <iostream>

#include "aero_eval/aero_eval_cli.hpp"

int main(int argc, char** argv) {
    return aerobuild::runAeroEval(argc, argv, std::cout, std::cerr);
}
