#include "docqa/cli/app.hpp"

int main(int argc, char** argv) {
    docqa::cli::App app;
    return app.run(argc, argv);
}
