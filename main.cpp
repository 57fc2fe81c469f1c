#include "app/WebForgeApp.hpp"

int main(int argc, char** argv) {
    webforge::app::WebForgeApp app;
    return app.Run(argc, argv);
}
