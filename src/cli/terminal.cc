#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cli/terminal.h>
#include <iostream>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace net = boost::asio;

namespace landrop::cli {

Terminal::Terminal(net::io_context& ioc)
    : input_(ioc, ::dup(STDIN_FILENO)) {}

Terminal::~Terminal() {
    Close();
}

net::awaitable<std::optional<std::string>> Terminal::ReadLine() {
    boost::system::error_code ec;
    auto length = co_await net::async_read_until(input_,
                                                 net::dynamic_buffer(buffer_),
                                                 '\n',
                                                 net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        if (ec != net::error::eof && ec != net::error::operation_aborted) {
            spdlog::error("Failed to read from stdin: {}", ec.message());
        }
        co_return std::nullopt;
    }
    std::string line = buffer_.substr(0, length - 1);
    buffer_.erase(0, length);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    co_return line;
}

void Terminal::Close() {
    if (input_.is_open()) {
        boost::system::error_code ec;
        input_.close(ec);
    }
}

void Terminal::ClearScreen() {
    std::cout << "\033[2J\033[H" << std::flush;
}

void Terminal::PrintInfo(const std::string& message) {
    std::cout << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintError(const std::string& message) {
    std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintPrompt() {
    std::cout << "> ";
    std::cout.flush();
}

} // namespace landrop::cli
