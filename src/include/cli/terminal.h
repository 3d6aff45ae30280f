#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace bucketpull::cli {

class Terminal {
public:
    Terminal(std::istream& in = std::cin, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void ClearLine();
    // nullopt on end of input
    std::optional<std::string> ReadLine();
    std::optional<std::string> Ask(const std::string& prompt);

    void Print(const std::string& message);
    void PrintInfo(const std::string& message);
    void PrintWarning(const std::string& message);
    void PrintError(const std::string& message);
    void PrintPrompt(const std::string& prompt);

    std::ostream& out() { return out_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    bool color_;
    std::mutex mutex_;
};

} // namespace bucketpull::cli
