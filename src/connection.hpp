#pragma once
#include <asio.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "action_router.hpp"
#include "log.hpp"

// Server side of one client socket. Reads a request line, then its payload,
// dispatches it and writes the response before reading the next request.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                              std::shared_ptr<ActionRouter> router,
                                              std::shared_ptr<Logger> logger);

    ~Connection();

    // Longest request line accepted; the payload is read separately.
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    void start();
    std::string remote_endpoint() const { return remote_; }

private:
    Connection(asio::ip::tcp::socket sock,
               std::shared_ptr<ActionRouter> router,
               std::shared_ptr<Logger> logger);
    void do_read_header();
    void do_read_payload(nlohmann::json request, std::size_t size);
    void handle_request(const nlohmann::json& request, std::string payload);
    void do_write(nlohmann::json response, bool close_after);
    void close();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<ActionRouter> router_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf read_buf_{kMaxHeaderBytes};
    std::string payload_buf_;
    std::string write_buf_;
    std::string remote_;
};
