#include "cli.h"

#include <signal.h>
#include <time.h>

#include <atomic>
#include <iomanip>
#include <iostream>
#include <set>
#include <thread>

namespace ua {

namespace {

// Options that never take a value
const std::set<std::string> FLAG_OPTIONS = {"no-compress", "verbose", "v"};

// Maps command-line options onto configuration keys
const std::map<std::string, std::string> OPTION_KEYS = {
    {"chunk-size", "chunk_size"},
    {"threads", "threads"},
    {"tries", "tries"},
    {"deadline", "deadline_seconds"},
    {"state-file", "state_file"},
    {"api", "api_address"},
};

// Turns SIGINT/SIGTERM into a cancellation of the running job. The signals
// are blocked in every thread and collected here with sigtimedwait, so the
// token is never touched from a signal handler.
class SignalWatcher {
public:
    // Must run before any other thread is started so that every thread
    // inherits the blocked mask.
    SignalWatcher() {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        blocked_ = pthread_sigmask(SIG_BLOCK, &signals_, &previous_) == 0;
        if (!blocked_) {
            Utils::logWarning("Could not block SIGINT/SIGTERM; interrupts will not be graceful");
            return;
        }
        thread_ = std::thread(&SignalWatcher::watch, this);
    }

    ~SignalWatcher() {
        stop_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
        if (blocked_) {
            pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void attach(CancellationToken* cancel) {
        target_ = cancel;
        if (cancel && received_) {
            cancel->cancel(ErrorCode::Cancelled);
        }
    }

private:
    void watch() {
        timespec timeout{0, 200 * 1000 * 1000};
        while (!stop_) {
            int signal = sigtimedwait(&signals_, nullptr, &timeout);
            if (signal > 0) {
                Utils::logInfo("Received signal " + std::to_string(signal) +
                               ", stopping upload (progress is kept for resume)...");
                received_ = true;
                CancellationToken* cancel = target_;
                if (cancel) {
                    cancel->cancel(ErrorCode::Cancelled);
                }
            }
        }
    }

    std::atomic<CancellationToken*> target_{nullptr};
    std::atomic<bool> received_{false};
    sigset_t signals_;
    sigset_t previous_;
    bool blocked_ = false;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

std::unique_ptr<UploadAgent> makeNetworkAgent(const std::string& api_address, const JobOptions& options) {
    return std::make_unique<UploadAgent>(api_address, options);
}

} // namespace

CLI::CLI() : CLI(makeNetworkAgent) {}

CLI::CLI(AgentFactory factory) : factory_(std::move(factory)) {
    // Register command handlers
    commands_["upload"] = &CLI::handleUpload;
    commands_["status"] = &CLI::handleStatus;
    commands_["help"] = &CLI::handleHelp;
    commands_["--help"] = &CLI::handleHelp;
    commands_["-h"] = &CLI::handleHelp;
}

CLI::~CLI() = default;

int CLI::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        printHelp();
        return EXIT_USAGE;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    auto it = commands_.find(args[0]);
    if (it == commands_.end()) {
        std::cout << "Unknown command: " << args[0] << std::endl;
        std::cout << "Type 'help' for available commands." << std::endl;
        return EXIT_USAGE;
    }
    return (this->*(it->second))(rest);
}

int CLI::exitCodeFor(const JobResult& result) {
    if (result.closed) {
        return EXIT_OK;
    }
    switch (result.status.code()) {
        case ErrorCode::Cancelled:
        case ErrorCode::DeadlineExceeded:
            return EXIT_INTERRUPTED;
        case ErrorCode::ConfigurationError:
            return EXIT_USAGE;
        default:
            return EXIT_UPLOAD_FAILED;
    }
}

int CLI::handleUpload(const std::vector<std::string>& args) {
    std::map<std::string, std::string> options;
    std::vector<std::string> remaining_args;

    if (!parseOptions(args, options, remaining_args) || remaining_args.size() != 2) {
        std::cout << "Usage: upload <file-id> <local-file> [options]" << std::endl;
        std::cout << "Type 'help' for available options." << std::endl;
        return EXIT_USAGE;
    }
    if (!applyOptions(options)) {
        return EXIT_USAGE;
    }

    const std::string& file_id = remaining_args[0];
    const std::string& local_file = remaining_args[1];
    Config& config = Config::getInstance();
    JobOptions job_options = config.toJobOptions();

    std::cout << "Uploading " << local_file << " to " << file_id << std::endl;
    if (!job_options.compress) std::cout << "  Compression: Disabled" << std::endl;

    JobResult result;
    std::unique_ptr<UploadAgent> agent;
    {
        SignalWatcher watcher;
        agent = factory_(config.getApiAddress(), job_options);
        agent->enableProgressBar(true);
        watcher.attach(&agent->cancellationToken());
        result = agent->upload(file_id, local_file);
        watcher.attach(nullptr);
    }

    if (Utils::isVerbose()) {
        agent->printStatistics();
    }

    int code = exitCodeFor(result);
    if (code == EXIT_OK) {
        return code;
    }

    std::cout << "Upload failed: " << result.status.toString() << std::endl;
    if (!result.outstanding.empty()) {
        std::cout << "Outstanding chunks (" << result.outstanding.size() << "): "
                  << Utils::formatFileSize(result.bytes_acked) << " of "
                  << Utils::formatFileSize(result.total_bytes) << " acknowledged" << std::endl;
        std::vector<std::string> indices;
        for (int index : result.outstanding) {
            indices.push_back(std::to_string(index));
        }
        std::cout << "  " << Utils::joinStrings(indices, " ") << std::endl;
        if (!job_options.state_file.empty()) {
            std::cout << "Run the same command again to resume." << std::endl;
        }
    }
    return code;
}

int CLI::handleStatus(const std::vector<std::string>& args) {
    std::map<std::string, std::string> options;
    std::vector<std::string> remaining_args;

    if (!parseOptions(args, options, remaining_args) || remaining_args.size() != 2) {
        std::cout << "Usage: status <file-id> <local-file> [--state-file PATH] [--chunk-size N] [--no-compress]"
                  << std::endl;
        return EXIT_USAGE;
    }
    if (!applyOptions(options)) {
        return EXIT_USAGE;
    }

    Config& config = Config::getInstance();
    std::unique_ptr<UploadAgent> agent = factory_(config.getApiAddress(), config.toJobOptions());
    return agent->status(remaining_args[0], remaining_args[1]) ? EXIT_OK : EXIT_UPLOAD_FAILED;
}

int CLI::handleHelp(const std::vector<std::string>& args) {
    printHelp();
    return EXIT_OK;
}

void CLI::printHelp() {
    std::cout << std::endl;
    std::cout << "Usage: ua_upload <command> [args...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << std::left << std::setw(34) << "  upload <file-id> <local-file>"
              << "Upload a file in chunks and close it" << std::endl;
    std::cout << std::left << std::setw(34) << "  status <file-id> <local-file>"
              << "Show the saved resume state of an upload" << std::endl;
    std::cout << std::left << std::setw(34) << "  help"
              << "Show this help message" << std::endl;
    std::cout << std::endl;

    std::cout << "Options:" << std::endl;
    std::cout << std::left << std::setw(34) << "  --chunk-size N"
              << "Chunk size, with optional K/M/G suffix (default 75M)" << std::endl;
    std::cout << std::left << std::setw(34) << "  --no-compress"
              << "Send chunks uncompressed" << std::endl;
    std::cout << std::left << std::setw(34) << "  --threads N"
              << "Number of upload workers" << std::endl;
    std::cout << std::left << std::setw(34) << "  --tries N"
              << "Attempts per chunk before giving up (default 3)" << std::endl;
    std::cout << std::left << std::setw(34) << "  --deadline SECONDS"
              << "Abort the whole job after this long" << std::endl;
    std::cout << std::left << std::setw(34) << "  --state-file PATH"
              << "Resume state file" << std::endl;
    std::cout << std::left << std::setw(34) << "  --api ADDRESS"
              << "Upload API host:port" << std::endl;
    std::cout << std::left << std::setw(34) << "  --config FILE"
              << "Read settings from a key = value file" << std::endl;
    std::cout << std::left << std::setw(34) << "  --verbose, -v"
              << "Debug logging and upload statistics" << std::endl;
    std::cout << std::endl;

    std::cout << "Exit status: 0 success, 1 usage error, 2 upload failed, 3 cancelled or deadline" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  ua_upload upload file-xyz reads.fastq --state-file ~/.ua_state.json" << std::endl;
    std::cout << "  ua_upload upload file-xyz big.bam --chunk-size 256M --threads 8 --no-compress" << std::endl;
    std::cout << "  ua_upload status file-xyz reads.fastq --state-file ~/.ua_state.json" << std::endl;
    std::cout << std::endl;
}

bool CLI::parseOptions(const std::vector<std::string>& args,
                       std::map<std::string, std::string>& options,
                       std::vector<std::string>& remaining_args) {
    options.clear();
    remaining_args.clear();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.substr(0, 2) == "--") {
            std::string option = arg.substr(2);

            // --option=value
            size_t eq_pos = option.find('=');
            if (eq_pos != std::string::npos) {
                options[option.substr(0, eq_pos)] = option.substr(eq_pos + 1);
            } else if (FLAG_OPTIONS.count(option)) {
                options[option] = "";
            } else if (i + 1 < args.size()) {
                options[option] = args[++i];
            } else {
                std::cout << "Option --" << option << " requires a value" << std::endl;
                return false;
            }
        } else if (arg[0] == '-' && arg.length() > 1) {
            // Short option(s)
            for (size_t j = 1; j < arg.length(); ++j) {
                options[std::string(1, arg[j])] = "";
            }
        } else {
            remaining_args.push_back(arg);
        }
    }

    return true;
}

bool CLI::applyOptions(const std::map<std::string, std::string>& options) {
    Config& config = Config::getInstance();

    // The config file goes first so that explicit flags override it
    auto config_file = options.find("config");
    if (config_file != options.end() && !config.loadFromFile(config_file->second)) {
        std::cout << "Error: invalid config file " << config_file->second << std::endl;
        return false;
    }

    for (const auto& option : options) {
        const std::string& name = option.first;
        if (name == "config") {
            continue;
        } else if (name == "verbose" || name == "v") {
            Utils::setVerbose(true);
        } else if (name == "no-compress") {
            config.set("compress", "false");
        } else {
            auto key = OPTION_KEYS.find(name);
            if (key == OPTION_KEYS.end()) {
                std::cout << "Unknown option: --" << name << std::endl;
                return false;
            }
            if (!config.set(key->second, option.second)) {
                std::cout << "Invalid value for --" << name << ": " << option.second << std::endl;
                return false;
            }
        }
    }
    return true;
}

} // namespace ua
