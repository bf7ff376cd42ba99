#include "api/lifecyclectl.hpp"

int main(int argc, char** argv) {
    return api::run_lifecyclectl_main(argc, argv);
}
