#include "connection.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <istream>
#include <iterator>

using json = nlohmann::json;

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               std::shared_ptr<ActionRouter> router,
                                               std::shared_ptr<Logger> logger)
{
    return std::shared_ptr<Connection>(new Connection(std::move(sock), std::move(router), std::move(logger)));
}

Connection::Connection(asio::ip::tcp::socket sock,
                       std::shared_ptr<ActionRouter> router,
                       std::shared_ptr<Logger> logger)
: socket_(std::move(sock)), router_(std::move(router)), logger_(std::move(logger))
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("?") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    log_debug(logger_.get(), "Connection from {}", remote_);
    do_read_header();
}

void Connection::do_read_header(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec == asio::error::not_found){
                // read_buf_ filled up without a newline.
                log_warn(logger_.get(), "Request line from {} exceeds {} bytes", remote_, kMaxHeaderBytes);
                do_write(make_action_error("", UploadErrorKind::InvalidRequest,
                                           "request line exceeds " + std::to_string(kMaxHeaderBytes) + " bytes"), true);
                return;
            }
            if(ec){
                if(ec != asio::error::eof){
                    log_info(logger_.get(), "Connection read error from {}: {}", remote_, ec.message());
                } else {
                    log_debug(logger_.get(), "Connection closed by {}", remote_);
                }
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(line.empty()){
                do_read_header();
                return;
            }

            json request;
            try{
                request = json::parse(line);
            } catch(const json::parse_error& ex){
                log_warn(logger_.get(), "Failed to parse request from {}: {}", remote_, ex.what());
                do_write(make_action_error("", UploadErrorKind::InvalidRequest,
                                           std::string("malformed request: ") + ex.what()), true);
                return;
            }

            std::size_t size = 0;
            if(request.is_object() && request.contains("size") && request["size"].is_number_unsigned()){
                size = request["size"].get<std::size_t>();
            }
            if(size > router_->max_request_bytes()){
                // The payload cannot be skipped safely, so the socket goes too.
                auto id = request.value("requestId", std::string());
                do_write(make_action_error(id, UploadErrorKind::InvalidRequest,
                                           "payload of " + std::to_string(size) + " bytes exceeds limit of " +
                                           std::to_string(router_->max_request_bytes())), true);
                return;
            }
            do_read_payload(std::move(request), size);
        });
}

void Connection::do_read_payload(json request, std::size_t size){
    // Bytes that arrived with the header line are already in read_buf_.
    payload_buf_.assign(size, '\0');
    std::size_t buffered = std::min(read_buf_.size(), size);
    std::istream is(&read_buf_);
    is.read(payload_buf_.data(), static_cast<std::streamsize>(buffered));
    if(buffered == size){
        handle_request(request, std::move(payload_buf_));
        return;
    }

    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(payload_buf_.data() + buffered, size - buffered),
        [this, self, request = std::move(request)](std::error_code ec, std::size_t){
            if(ec){
                log_info(logger_.get(), "Payload read error from {}: {}", remote_, ec.message());
                close();
                return;
            }
            handle_request(request, std::move(payload_buf_));
        });
}

void Connection::handle_request(const json& request, std::string payload){
    auto response = router_->dispatch(request, payload);
    do_write(std::move(response), false);
}

void Connection::do_write(json response, bool close_after){
    write_buf_ = response.dump() + "\n";
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_buf_),
        [this, self, close_after](std::error_code ec, std::size_t){
            if(ec){
                log_info(logger_.get(), "Connection write error to {}: {}", remote_, ec.message());
                close();
                return;
            }
            if(close_after){
                close();
                return;
            }
            do_read_header();
        });
}

void Connection::close(){
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}
