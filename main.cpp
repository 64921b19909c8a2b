#include "app/SortwellApp.hpp"

int main(int argc, char** argv) {
    sortwell::app::SortwellApp app;
    return app.Run(argc, argv);
}
