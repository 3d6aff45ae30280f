#include <boost/process.hpp>
#include <condition_variable>
#include <core/util/process.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>

namespace bp = boost::process;

namespace bucketpull::core {

ProcessRunner::ProcessRunner(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

ProcessResult ProcessRunner::Run(const std::string& executable,
                                 const std::vector<std::string>& args,
                                 std::stop_token stop_token) const {
    ProcessResult result;

    boost::filesystem::path exe = executable;
    if (executable.find('/') == std::string::npos) {
        exe = bp::search_path(executable);
    }
    if (exe.empty()) {
        spdlog::error("Executable not found in PATH: {}", executable);
        result.launched = false;
        result.exit_code = 127;
        result.output = executable + ": command not found";
        return result;
    }

    bp::ipstream output;
    bp::group group;
    bp::child child;
    try {
        // limit_handles keeps sibling transfers from inheriting this pipe
        child = bp::child(exe,
                          bp::args(args),
                          bp::std_in < bp::null,
                          (bp::std_out & bp::std_err) > output,
                          group,
                          bp::limit_handles);
    } catch (const bp::process_error& e) {
        spdlog::error("Failed to launch {}: {}", exe.string(), e.what());
        result.launched = false;
        result.output = e.what();
        return result;
    }
    spdlog::debug("Launched {} (pid {})", exe.string(), child.id());

    std::thread reader([&output, &result]() {
        std::string line;
        while (std::getline(output, line)) {
            result.output += line;
            result.output += '\n';
        }
    });

    std::mutex mutex;
    std::condition_variable_any cv;
    std::error_code ec;
    while (child.running(ec)) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, stop_token, poll_interval_, [] { return false; });
        if (stop_token.stop_requested()) {
            spdlog::debug("Terminating process group of pid {}", child.id());
            group.terminate(ec);
            if (ec) {
                spdlog::warn("Failed to terminate process group: {}", ec.message());
                child.terminate(ec);
            }
            result.terminated = true;
            break;
        }
    }
    if (ec) {
        spdlog::warn("Lost track of pid {}: {}", child.id(), ec.message());
    }

    child.wait(ec);
    reader.join();

    result.exit_code = child.exit_code();
    return result;
}

} // namespace bucketpull::core
