#include "DemoApplication.hpp"

#include <ctrlc/core/ConfigLoader.hpp>
#include <ctrlc/core/Logger.hpp>
#include <ctrlc/core/LoggingConfig.hpp>

#include <exception>
#include <iostream>

int main(int argc, char **argv)
{
    int rc = 1;
    try
    {
        auto cfg = ctrlc::core::ConfigLoader::load(argc, argv);
        ctrlc::core::applyLoggingConfig(cfg.logging);

        demo::DemoApplication app(cfg.demo);
        rc = app.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ctrlc_demo] " << e.what() << std::endl;
    }

    ctrlc::core::shutdownLogger();
    return rc;
}
