#include "promptvault/cli/app.hpp"

int main(int argc, char** argv) {
    promptvault::cli::App app;
    return app.run(argc, argv);
}
