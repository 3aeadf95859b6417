#include "scriptsign/cli/app.hpp"

int main(int argc, char** argv) {
    scriptsign::cli::App app;
    return app.run(argc, argv);
}
