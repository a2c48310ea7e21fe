#include <iostream>
#include <stdexcept>

#include "app/OracleNetworkApp.hpp"

using namespace medoracle;

int main(int argc, char** argv) {
    app::AppOptions options;
    try {
        options = app::OracleNetworkApp::ParseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << app::OracleNetworkApp::Usage();
        return app::OracleNetworkApp::ExitError;
    }

    app::OracleNetworkApp application(std::move(options), std::cin);
    return application.Run();
}
