#include "pipali_shell/shell_app.h"
#include <iostream>
#include <exception>

// Console entry point
int main(int argc, char* argv[]) {
    try {
        pipali_shell::ShellApp app(argc, argv);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
