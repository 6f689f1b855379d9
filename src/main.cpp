#include "hearthfs/cli/app.hpp"

int main(int argc, char** argv) {
    hearthfs::cli::App app;
    return app.run(argc, argv);
}
