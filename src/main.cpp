#include <exception>
#include <iostream>

#include "app.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "signals.hpp"

int main(int argc, char** argv) {
    cen::install_signal_handlers();
    try {
        cen::AppConfig cfg = cen::parse_args(argc, argv);
        cen::App app(cfg);
        return app.run();
    } catch (const cen::ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    } catch (const cen::AuthError& e) {
        std::cerr << "[ERROR] Authorization failed: " << e.what() << std::endl;
        return 1;
    } catch (const cen::SendError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Unexpected failure: " << e.what() << std::endl;
        return 1;
    }
}
