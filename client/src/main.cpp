#include <iostream>

#include "chunkstitch/client/config.hpp"
#include "chunkstitch/client/logger.hpp"
#include "chunkstitch/client/uploader.hpp"

int main(int argc, char *argv[])
{
    try
    {
        auto config = chunkstitch::client::parse_arguments(argc, argv);
        chunkstitch::client::Logger logger(config.log_path);
        chunkstitch::client::Uploader uploader(std::move(config), std::move(logger));
        return uploader.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return 1;
    }
}
