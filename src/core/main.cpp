#include "rigd/core/application.hpp"

int main(int argc, char* argv[]) {
    rigd::core::Application app;
    return app.run(argc, argv);
}
