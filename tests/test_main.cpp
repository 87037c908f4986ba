#include <gtest/gtest.h>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/null_sink.h"

int main(int argc, char ** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Components fetch the shared "logger" when they are constructed.
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    spdlog::register_logger(std::make_shared<spdlog::logger>("logger", sink));

    return RUN_ALL_TESTS();
}
