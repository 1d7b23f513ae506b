#include <iostream>
#include <string>

#include "viewer/ViewerApp.hpp"

int main(int argc, char** argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "config/renderer.json";

    prism::viewer::ViewerApp app;
    if (!app.Initialize(configPath))
    {
        std::cerr << "Failed to start viewer.\n";
        return 1;
    }

    app.Run();
    return 0;
}
