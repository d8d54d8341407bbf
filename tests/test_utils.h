// Shared helpers for the hostfan tests.

#pragma once

#include "hostfan/executor.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>


namespace hostfan::test {


// ---------------------------------------------------------------------------
// Requirements
// ---------------------------------------------------------------------------

inline void print_test_message(std::string_view prefix, std::string_view message)
{
    std::fprintf(stderr,
                 "%.*s%.*s\n",
                 static_cast<int>(prefix.size()),
                 prefix.data(),
                 static_cast<int>(message.size()),
                 message.data());
}

[[noreturn]] inline void fail(std::string_view prefix, std::string_view message)
{
    print_test_message(prefix, message);
    std::exit(1);
}

inline void require_true(bool condition, std::string_view prefix, std::string_view message)
{
    if (!condition) {
        fail(prefix, message);
    }
}


// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

/// Unique scratch directory, removed on destruction.
class Temp_directory
{
public:
    explicit Temp_directory(std::string_view name)
    {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("hostfan_" + std::string(name) + "_" + std::to_string(::getpid()) + "_" +
                  std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(m_path);
    }

    ~Temp_directory()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    Temp_directory(const Temp_directory&) = delete;
    Temp_directory& operator=(const Temp_directory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, std::string_view content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::size_t count_files(const std::filesystem::path& dir, std::string_view needle)
{
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().find(needle) != std::string::npos) {
            ++count;
        }
    }
    return count;
}


// ---------------------------------------------------------------------------
// Executor stand-in
// ---------------------------------------------------------------------------

/// Succeeds everywhere except on the hosts it was told to fail on. Writes one
/// line per call into the output descriptor and remembers every call.
class Scripted_executor : public Executor
{
public:
    explicit Scripted_executor(std::set<std::string> failing_hosts = {},
                               std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : m_failing(std::move(failing_hosts)), m_delay(delay)
    {}

    ExecResult execute(const std::string& command, const std::string& host, int output_fd) override
    {
        if (m_delay.count() > 0) {
            std::this_thread::sleep_for(m_delay);
        }

        const bool failing = m_failing.count(host) != 0;
        std::string line = (failing ? "refused " : "ran ") + command + " on " + host + "\n";
        if (::write(output_fd, line.data(), line.size()) != static_cast<ssize_t>(line.size())) {
            return {false, -1, "short write"};
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.emplace_back(command, host);
        }

        if (failing) {
            return {false, 255, "exit status 255"};
        }
        return {true, 0, ""};
    }

    std::vector<std::pair<std::string, std::string>> calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

private:
    std::set<std::string> m_failing;
    std::chrono::milliseconds m_delay;
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, std::string>> m_calls;
};


} // namespace hostfan::test
