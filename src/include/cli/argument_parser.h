#pragma once

#include <core/model/selection.h>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bucketpull::cli {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::optional<std::string> bucket;
    std::optional<std::string> destination;
    std::vector<std::string> files;
    std::vector<std::string> folders;
    bool everything = false;
    bool interactive = false;
    std::optional<int> max_parallel;
    std::optional<int> threads;
    std::optional<int> poll_interval_ms;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> report_path;
    std::optional<std::string> retry_path;
    bool save_config = false;
    bool show_help = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // 解析命令行参数, throws UsageError
    CliOptions Parse();

    // 显示帮助信息
    static void ShowHelp(std::ostream& out);

private:
    int argc_;
    char** argv_;
    int i_; // 当前解析的参数索引

    // 参数解析
    void parseOption(const std::string& arg, CliOptions& options);
    std::string nextValue(const std::string& flag);
    int nextInt(const std::string& flag);

    // 参数验证
    void validateOptions(const CliOptions& options) const;
};

// --file/--folder/--everything as a Selection; the count of paths picks
// between the single and multiple modes.
core::Selection ToSelection(const CliOptions& options);

} // namespace bucketpull::cli
