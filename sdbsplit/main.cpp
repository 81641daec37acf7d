#include <csignal>
#include <cstdlib>
#include <iostream>

#include <curl/curl.h>

#include <sdbsplit/app.hpp>
#include <sdbsplit/configuration.hpp>
#include <sdbsplit/util/color.hpp>

int main(int argc, char** argv)
{
    signal(SIGINT, [](int sig) { exit(1); });

    if (argc < 2)
    {
        std::cout << sdbsplit::App::usage();
        return 1;
    }

    curl_global_init(CURL_GLOBAL_ALL);

    int status(0);

    try
    {
        sdbsplit::Configuration config(argc, argv);
        sdbsplit::App app(config);
        app.run(std::cout);
    }
    catch (sdbsplit::ConfigError& e)
    {
        std::cerr << sdbsplit::color(e.what(), sdbsplit::Color::Red) <<
            std::endl << std::endl << sdbsplit::App::usage();
        status = 1;
    }
    catch (std::exception& e)
    {
        std::cerr << sdbsplit::color(e.what(), sdbsplit::Color::Red) <<
            std::endl;
        status = 1;
    }

    curl_global_cleanup();
    return status;
}
