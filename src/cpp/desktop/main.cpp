#include "siri_desktop/desktop_app.h"
#include <iostream>
#include <exception>

int main(int argc, char* argv[]) {
    try {
        siri_desktop::DesktopApp app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
