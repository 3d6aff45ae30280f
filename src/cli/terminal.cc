#include <cli/terminal.h>
#include <unistd.h>

namespace bucketpull::cli {

Terminal::Terminal(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in)
    , out_(out)
    , err_(err)
    , color_(&out == &std::cout && ::isatty(STDOUT_FILENO) == 1) {}

void Terminal::ClearLine() {
    std::lock_guard lock(mutex_);
    out_ << "\r\033[K" << std::flush;
}

std::optional<std::string> Terminal::ReadLine() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> Terminal::Ask(const std::string& prompt) {
    PrintPrompt(prompt);
    return ReadLine();
}

void Terminal::Print(const std::string& message) {
    std::lock_guard lock(mutex_);
    out_ << message << std::endl;
}

void Terminal::PrintInfo(const std::string& message) {
    std::lock_guard lock(mutex_);
    if (color_) {
        out_ << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
    } else {
        out_ << "[INFO] " << message << std::endl;
    }
}

void Terminal::PrintWarning(const std::string& message) {
    std::lock_guard lock(mutex_);
    if (color_) {
        out_ << "\033[33m[WARN] " << message << "\033[0m" << std::endl;
    } else {
        out_ << "[WARN] " << message << std::endl;
    }
}

void Terminal::PrintError(const std::string& message) {
    std::lock_guard lock(mutex_);
    if (color_) {
        err_ << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
    } else {
        err_ << "[ERROR] " << message << std::endl;
    }
}

void Terminal::PrintPrompt(const std::string& prompt) {
    std::lock_guard lock(mutex_);
    out_ << prompt;
    out_.flush();
}

} // namespace bucketpull::cli
