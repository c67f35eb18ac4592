#include "app/ControlMapperApp.hpp"

int main(int argc, char** argv) {
    controlmapper::app::ControlMapperApp app;
    return app.Run(argc, argv);
}
