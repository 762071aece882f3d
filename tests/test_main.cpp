#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

int main(int argc, char ** argv) {
    ::testing::InitGoogleMock(&argc, argv);

    auto logger = std::make_shared<spdlog::logger>("logger", std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::debug);
    spdlog::register_logger(logger);

    return RUN_ALL_TESTS();
}
