#pragma once

#include "upload_agent.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ua {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_UPLOAD_FAILED = 2;
constexpr int EXIT_INTERRUPTED = 3;

class CLI {
public:
    using AgentFactory =
        std::function<std::unique_ptr<UploadAgent>(const std::string& api_address, const JobOptions& options)>;

    CLI();
    explicit CLI(AgentFactory factory);
    ~CLI();

    // Runs one command; returns the process exit code
    int execute(const std::vector<std::string>& args);

    // Command handlers
    int handleUpload(const std::vector<std::string>& args);
    int handleStatus(const std::vector<std::string>& args);
    int handleHelp(const std::vector<std::string>& args);

    static int exitCodeFor(const JobResult& result);

private:
    AgentFactory factory_;

    using CommandHandler = int (CLI::*)(const std::vector<std::string>&);
    std::map<std::string, CommandHandler> commands_;

    // Helper methods
    void printHelp();
    bool parseOptions(const std::vector<std::string>& args,
                      std::map<std::string, std::string>& options,
                      std::vector<std::string>& remaining_args);
    bool applyOptions(const std::map<std::string, std::string>& options);
};

} // namespace ua
