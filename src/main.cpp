#include "schedfmt/cli/app.hpp"

int main(int argc, char** argv) {
    schedfmt::cli::App app;
    return app.run(argc, argv);
}
