// envkeeper
// Cache maintenance and supervised command execution

#include <unistd.h>

#include <chrono>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cache/backend.hpp"
#include "exec/askpass_listener.hpp"
#include "exec/command_runner.hpp"
#include "exec/print_progress_handler.hpp"
#include "exec/spinner_progress_handler.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/context.hpp"

namespace {

void print_usage()
{
    std::cerr << "Usage: envkeeper [OPTIONS] <command> [ARGS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config PATH       Path to config file (YAML)\n";
    std::cerr << "  --log-level LEVEL   debug, info, warn, error, none\n";
    std::cerr << "  --help, -h          Show this help\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  cleanup                                  Prune history, environments and installs\n";
    std::cerr << "  status                                   Show what the cache holds\n";
    std::cerr << "  run [--timeout S] [--askpass] -- CMD...  Run a command with a progress display\n";
    std::cerr << "  askpass --socket PATH [-- PROMPT...]     Ask the running envkeeper for a password\n";
}

int cmd_cleanup(const envkeeper::runtime::CoreConfig &config)
{
    envkeeper::common::Error error;
    auto context = envkeeper::runtime::Context::create(config, error);
    if (!context)
    {
        LOG_ERROR("Cache initialization failed: " << error.to_string());
        return 1;
    }

    if (!context->cache().cleanup(error))
    {
        LOG_ERROR("Cleanup failed: " << error.message);
        return 1;
    }
    LOG_INFO("Cleanup complete");
    return 0;
}

int cmd_status(const envkeeper::runtime::CoreConfig &config)
{
    envkeeper::common::Error error;
    auto context = envkeeper::runtime::Context::create(config, error);
    if (!context)
    {
        LOG_ERROR("Cache initialization failed: " << error.to_string());
        return 1;
    }

    std::cout << "Cache: " << config.cache.path << "\n";

    std::vector<envkeeper::cache::HistoryEntry> history;
    if (!context->cache().environments().list_history("", history, error))
    {
        LOG_ERROR("Failed to read history: " << error.message);
        return 1;
    }
    size_t open_entries = 0;
    for (const auto &entry : history)
    {
        if (entry.is_open())
        {
            ++open_entries;
        }
    }
    std::cout << "History: " << history.size() << " entries (" << open_entries << " active)\n";

    for (auto backend : envkeeper::cache::all_backends())
    {
        std::vector<envkeeper::cache::Artifact> artifacts;
        if (!context->cache().installed(backend).list_installed(artifacts, error))
        {
            LOG_ERROR("Failed to list " << envkeeper::cache::backend_to_string(backend) << ": " << error.message);
            return 1;
        }
        size_t unreferenced = 0;
        for (const auto &artifact : artifacts)
        {
            if (artifact.required_by.empty())
            {
                ++unreferenced;
            }
        }
        std::cout << "  " << envkeeper::cache::backend_to_string(backend) << ": " << artifacts.size()
                  << " installed, " << unreferenced << " unreferenced\n";
    }
    return 0;
}

int cmd_run(const envkeeper::runtime::CoreConfig &config, const std::vector<std::string> &args)
{
    envkeeper::exec::RunConfig run_config;
    run_config.askpass_options = config.askpass;

    size_t i = 0;
    for (; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--")
        {
            ++i;
            break;
        }
        if (arg == "--timeout" && i + 1 < args.size())
        {
            try
            {
                run_config.with_timeout(std::chrono::seconds(std::stol(args[++i])));
            }
            catch (const std::exception &)
            {
                std::cerr << "Invalid timeout: " << args[i] << "\n";
                return 1;
            }
        }
        else if (arg == "--askpass")
        {
            run_config.with_askpass();
        }
        else
        {
            break;
        }
    }

    envkeeper::exec::Command command(std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(i),
                                                              args.end()));
    if (command.argv.empty())
    {
        std::cerr << "run: missing command\n";
        return 1;
    }

    std::unique_ptr<envkeeper::exec::IProgressHandler> progress;
    if (isatty(STDERR_FILENO))
    {
        progress = std::make_unique<envkeeper::exec::SpinnerProgressHandler>(command.to_string());
    }
    else
    {
        progress = std::make_unique<envkeeper::exec::PrintProgressHandler>(command.to_string());
    }

    envkeeper::common::Error error;
    if (!envkeeper::exec::run_progress(command, *progress, run_config, error))
    {
        progress->error_with_message(error.message);
        return error.exit_code > 0 ? error.exit_code : 1;
    }
    progress->success();
    return 0;
}

int cmd_askpass(const std::vector<std::string> &args)
{
    std::string socket_path;
    std::string prompt;

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--socket" && i + 1 < args.size())
        {
            socket_path = args[++i];
        }
        else if (arg == "--")
        {
            continue;
        }
        else
        {
            if (!prompt.empty())
            {
                prompt += " ";
            }
            prompt += arg;
        }
    }

    if (socket_path.empty())
    {
        std::cerr << "askpass: --socket is required\n";
        return 1;
    }

    std::string answer;
    std::string error;
    envkeeper::exec::AskPassRequest request(prompt);
    if (!request.send(socket_path, answer, error))
    {
        std::cerr << "askpass: " << error << "\n";
        return 1;
    }
    std::cout << answer << "\n";
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    std::string config_path;
    std::string log_level;
    std::string command;
    std::vector<std::string> command_args;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (!command.empty())
        {
            command_args.push_back(arg);
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            log_level = argv[++i];
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
        else
        {
            command = arg;
        }
    }

    if (command.empty())
    {
        print_usage();
        return 1;
    }

    // The askpass client runs inside the child's sudo/ssh; keep it quiet
    if (command == "askpass")
    {
        envkeeper::logging::Logger::set_level(envkeeper::logging::Level::LVL_NONE);
        return cmd_askpass(command_args);
    }

    envkeeper::runtime::CoreConfig config = envkeeper::runtime::default_config();
    std::string error;

    if (!config_path.empty() && !envkeeper::runtime::load_config(config_path, config, error))
    {
        std::cerr << "ERROR: Failed to load config: " << error << "\n";
        return 1;
    }
    if (!envkeeper::runtime::validate_config(config, error))
    {
        std::cerr << "ERROR: Invalid config: " << error << "\n";
        return 1;
    }

    envkeeper::logging::Level level;
    const std::string &level_str = log_level.empty() ? config.logging.level : log_level;
    if (!envkeeper::logging::parse_level(level_str, level))
    {
        std::cerr << "ERROR: Invalid log level: " << level_str << "\n";
        return 1;
    }
    envkeeper::logging::Logger::init(level);

    if (command == "cleanup")
    {
        return cmd_cleanup(config);
    }
    if (command == "status")
    {
        return cmd_status(config);
    }
    if (command == "run")
    {
        return cmd_run(config, command_args);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Use --help for usage information\n";
    return 1;
}
