#include <gtest/gtest.h>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

int main(int argc, char ** argv) {
    // Components look up the shared "logger" at construction.
    auto logger = std::make_shared<spdlog::logger>("logger", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::trace);
    spdlog::register_logger(logger);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
