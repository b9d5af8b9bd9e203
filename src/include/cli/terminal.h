#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <optional>
#include <string>

namespace landrop::cli {

// Line input from stdin multiplexed on the io_context, colored output on stdout/stderr.
class Terminal {
public:
    // Throws boost::system::system_error when stdin cannot be watched (e.g. a regular file)
    explicit Terminal(boost::asio::io_context& ioc);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // nullopt on end of input or once Close() was called
    boost::asio::awaitable<std::optional<std::string>> ReadLine();
    void Close();

    void ClearScreen();
    void PrintInfo(const std::string& message);
    void PrintError(const std::string& message);
    void PrintPrompt();

private:
    boost::asio::posix::stream_descriptor input_;
    std::string buffer_;
};

} // namespace landrop::cli
