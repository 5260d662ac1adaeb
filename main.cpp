#include "app/ShipwrightApp.hpp"

int main(int argc, char** argv) {
    shipwright::app::ShipwrightApp app;
    return app.Run(argc, argv);
}
