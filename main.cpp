#include <string>

#include "app/DecodeDeskApp.hpp"

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "";
    decodedesk::app::DecodeDeskApp app(configPath);
    return app.Run();
}
