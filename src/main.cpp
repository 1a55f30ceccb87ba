#include "lumen/app.hpp"

int main(int argc, char *argv[]) {
    lumen::App app;
    return app.run(argc, argv);
}
