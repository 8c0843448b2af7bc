#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "uplift/logging.hpp"

void run_shared_component_tests();
void run_worker_component_tests();
void run_manager_component_tests();

int main()
{
    try
    {
        uplift::configure_logging("uplift-tests", uplift::LoggingOptions{.level = spdlog::level::err});

        run_shared_component_tests();
        run_worker_component_tests();
        run_manager_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
