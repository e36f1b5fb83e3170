#include <string>
#include <vector>

#include "app/DialogApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    dialog::app::DialogApp app;
    return app.Run(args);
}
