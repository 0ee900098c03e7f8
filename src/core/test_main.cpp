// test_main.cpp
// GoogleTest entry point owning the QCoreApplication the bridge needs for
// its event loop, socket notifiers and peer processes.
#include <csignal>
#include <gtest/gtest.h>
#include <QCoreApplication>
#include "logging.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    std::signal(SIGPIPE, SIG_IGN);
    muxbridge::logging::install(false);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
