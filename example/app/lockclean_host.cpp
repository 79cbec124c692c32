#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

#include <boost/asio/error.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include "lockclean/app/lock_controller.hpp"
#include "lockclean/config/app_config.hpp"
#include "lockclean/config/settings_store.hpp"
#include "lockclean/error/exception.hpp"
#include "lockclean/hotkey/trigger_store.hpp"
#include "lockclean/input/event_source.hpp"
#include "lockclean/input/permission.hpp"
#include "lockclean/log/log_setup.hpp"

namespace asio = boost::asio;
using namespace lockclean;

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "lockclean.json";

    config::AppConfig appConfig;
    try {
        appConfig = config::AppConfig::load(configPath);
    } catch (const error::InvalidConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    lockclean::log::initLogging({appConfig.logLevel, appConfig.logFile});

    if (!input::isProcessTrusted(true)) {
        spdlog::warn("Grant Accessibility access, then restart lockclean");
    }

    auto source = input::createPlatformEventSource();
    if (!source) {
        spdlog::critical("No input event source: {}",
                         source.error().message());
        return 1;
    }

    asio::io_context ioContext;
    auto work = asio::make_work_guard(ioContext);

    auto settings =
        std::make_shared<config::JsonFileSettingsStore>(appConfig.settingsPath);
    auto triggers = std::make_shared<hotkey::TriggerStore>(settings);
    app::LockController controller(*source, ioContext, triggers,
                                   appConfig.doublePressWindow);

    auto statusToken =
        controller.subscribeStatus([](const app::LockStatus& status) {
            std::cout << status.title << ": " << status.message << std::endl;
        });

    if (!controller.start()) {
        return 1;
    }

    int inputFd = ::dup(STDIN_FILENO);
    if (inputFd < 0) {
        spdlog::critical("Unable to read commands from stdin");
        controller.shutdown();
        return 1;
    }
    asio::posix::stream_descriptor input(ioContext, inputFd);
    std::string pending;

    asio::signal_set signals(ioContext, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            controller.shutdown();
            boost::system::error_code ignored;
            input.close(ignored);
            work.reset();
        }
    });

    std::cout << "k: lock keyboard, m: lock mouse, u: unlock, q: quit"
              << std::endl;
    std::cout << controller.unlockTriggerLabel() << std::endl;

    auto finish = [&] {
        controller.shutdown();
        signals.cancel();
        boost::system::error_code ignored;
        input.close(ignored);
        work.reset();
    };

    std::function<void()> readCommand = [&] {
        asio::async_read_until(
            input, asio::dynamic_buffer(pending), '\n',
            [&](const boost::system::error_code& ec, std::size_t length) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                if (ec) {
                    if (ec != asio::error::eof) {
                        spdlog::warn("Reading commands failed: {}",
                                     ec.message());
                    }
                    finish();
                    return;
                }
                std::string line = pending.substr(0, length - 1);
                pending.erase(0, length);

                if (line == "q") {
                    finish();
                    return;
                }

                error::Result<void> result;
                if (line == "k") {
                    result = controller.lock(blocker::LockMode::KEYBOARD);
                } else if (line == "m") {
                    result = controller.lock(blocker::LockMode::MOUSE);
                } else if (line == "u") {
                    controller.unlock();
                }
                if (!result) {
                    spdlog::warn("Lock failed: {}", result.error().message());
                }
                std::cout << controller.statusText() << std::endl;
                readCommand();
            });
    };
    readCommand();

    ioContext.run();

    controller.unsubscribeStatus(statusToken);
    return 0;
}
