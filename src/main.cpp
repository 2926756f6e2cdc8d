#include "shed/app.hpp"

int main(int argc, char *argv[]) {
    shed::App app;
    return app.run(argc, argv);
}
