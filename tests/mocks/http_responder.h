#pragma once
#ifndef TESTS_MOCKS_HTTP_RESPONDER_H
#define TESTS_MOCKS_HTTP_RESPONDER_H

#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief One-connection-at-a-time HTTP server on 127.0.0.1 for client tests.
 *
 * The handler gets the raw request head and returns the raw response. An
 * empty response keeps the connection open without answering.
 */
class HttpResponder {
public:
    using Handler = std::function<std::string(const std::string &request)>;

    explicit HttpResponder(Handler handler)
        : handler_(std::move(handler)),
          acceptor_(ioc_, boost::asio::ip::tcp::endpoint(
                              boost::asio::ip::address_v4::loopback(), 0)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~HttpResponder() {
        stop_ = true;
        // Wake the blocking accept.
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket wake(ioc_);
        wake.connect(acceptor_.local_endpoint(), ec);
        thread_.join();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    std::string url(const std::string &path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port()) + path;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        namespace asio = boost::asio;
        for (;;) {
            asio::ip::tcp::socket socket(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stop_)
                return;

            std::string request;
            asio::read_until(socket, asio::dynamic_buffer(request), "\r\n\r\n", ec);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }
            std::string response = handler_(request);
            if (response.empty()) {
                held_.push_back(std::move(socket));
                continue;
            }
            asio::write(socket, asio::buffer(response), ec);
            socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<boost::asio::ip::tcp::socket> held_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

#endif // TESTS_MOCKS_HTTP_RESPONDER_H
