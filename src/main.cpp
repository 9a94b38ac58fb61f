#include "envfile/cli/app.hpp"

int main(int argc, char** argv) {
    envfile::cli::App app;
    return app.run(argc, argv);
}
