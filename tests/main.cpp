#include <iostream>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <QCoreApplication>

#include "PipelineEvent.h"
#include "PipelineTypes.h"
#include "logging.h"

int main(int argc, char *argv[])
{
    // Timers, queued signals and the network stack need an application object
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("QVoiceTyperTests");
    QCoreApplication::setApplicationName("qvt_tests");

    qRegisterMetaType<PipelineEvent>();
    qRegisterMetaType<PipelineState>();
    qRegisterMetaType<ToggleAck>();
    qRegisterMetaType<JobRecord>();

    if (qEnvironmentVariableIsSet("QVT_TEST_LOG")) {
        logfault::LogManager::Instance().AddHandler(
            std::make_unique<logfault::StreamHandler>(std::clog, logfault::LogLevel::TRACE));
    }

    return Catch::Session().run(argc, argv);
}
