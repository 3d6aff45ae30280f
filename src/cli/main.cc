#include <boost/asio.hpp>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/remote/gsutil_lister.h>
#include <core/transfer/gsutil_mechanism.h>
#include <core/util/config.h>
#include <core/util/error.h>
#include <core/util/logger.h>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stop_token>
#include <thread>

namespace net = boost::asio;

using namespace bucketpull;

namespace {

void applyOverrides(const cli::CliOptions& options) {
    if (options.max_parallel) {
        core::settings.max_parallel = *options.max_parallel;
    }
    if (options.threads) {
        core::settings.threads_per_transfer = *options.threads;
    }
    if (options.poll_interval_ms) {
        core::settings.poll_interval = std::chrono::milliseconds(*options.poll_interval_ms);
    }
    if (options.destination && options.save_config) {
        core::settings.destination = *options.destination;
    }
}

Logger::Level logLevelFor(const cli::CliOptions& options) {
    if (options.log_level) {
        return spdlog::level::from_str(*options.log_level);
    }
#ifdef BUCKETPULL_DEBUG
    return Logger::Level::debug;
#else
    return Logger::Level::info;
#endif
}

} // namespace

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const cli::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp(std::cerr);
        return cli::kExitFatal;
    }
    if (options.show_help) {
        cli::ArgumentParser::ShowHelp(std::cout);
        return cli::kExitOk;
    }

    LoggerOptions log_options{.level = logLevelFor(options),
                              .file = core::path::kLogDir / "bucketpull.log"};
    if (options.log_level) {
        log_options.console_level = log_options.level;
    }
    Logger logger(log_options);

    try {
        if (options.config_path) {
            core::InitConfig(std::filesystem::path(*options.config_path));
        } else {
            core::InitConfig();
        }
        applyOverrides(options);
        core::ValidateSettings(core::settings);
        if (options.save_config) {
            core::SaveConfig();
        }

        cli::Terminal terminal;

        core::GsutilMechanism mechanism(
            core::GsutilOptions{
                .tool = core::settings.tool,
                .sliced_download_threshold = core::settings.sliced_download_threshold,
            },
            core::ProcessRunner(core::settings.poll_interval));
        auto version = mechanism.ProbeTool();
        if (!version) {
            terminal.PrintError(core::settings.tool + " is not installed or not in your PATH.");
            terminal.PrintError("Please install the Google Cloud SDK and ensure gsutil is working.");
            terminal.PrintError("Installation guide: https://cloud.google.com/sdk/docs/install");
            return cli::kExitFatal;
        }
        terminal.PrintInfo("Using " + *version);

        core::GsutilLister lister(core::settings.tool, core::ProcessRunner(core::settings.poll_interval));

        std::stop_source stop_source;
        net::io_context ioc;
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        std::function<void(const boost::system::error_code&, int)> on_signal;
        on_signal = [&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            if (stop_source.stop_requested()) {
                // second signal: give up on a graceful shutdown
                spdlog::shutdown();
                std::_Exit(cli::kExitCancelled);
            }
            spdlog::warn("Received signal {}, cancelling the batch", signal_number);
            terminal.PrintWarning("Cancelling... press Ctrl-C again to abort immediately.");
            stop_source.request_stop();
            signals.async_wait(on_signal);
        };
        signals.async_wait(on_signal);
        std::jthread signal_thread([&ioc] { ioc.run(); });

        cli::CliManager manager(options, lister, mechanism, terminal, stop_source.get_token());
        int status = cli::kExitFatal;
        try {
            status = manager.Run();
        } catch (...) {
            ioc.stop();
            throw;
        }
        ioc.stop();
        return status;
    } catch (const core::ConfigError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return cli::kExitFatal;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return cli::kExitFatal;
    }
}
