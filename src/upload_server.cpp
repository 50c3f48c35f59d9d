#include "upload_server.hpp"

#include <stdexcept>

#include "action_router.hpp"
#include "connection.hpp"
#include "filesystem_chunk_store.hpp"
#include "merger.hpp"
#include "settings_manager.hpp"
#include "upload_service.hpp"

UploadServer::UploadServer(std::shared_ptr<SettingsManager> settings)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("chunkup-server")) {}

UploadServer::~UploadServer() {
  stop();
}

void UploadServer::start() {
  if(started_) return;

  init(settings_->get<bool>("verbose"));

  listen_ip_ = settings_->get<std::string>("listen_ip");
  auto listen_port_value = settings_->get<long long>("listen_port");
  if(listen_port_value < 0 || listen_port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port_value);
    throw std::runtime_error("Invalid listen_port");
  }
  listen_port_ = static_cast<uint16_t>(listen_port_value);
  thread_count_ = settings_->get<std::size_t>("io_threads");
  if(thread_count_ == 0) thread_count_ = 1;

  std::filesystem::path root = settings_->get<std::string>("storage_root");
  if(root.empty()) {
    throw std::runtime_error("storage_root must not be empty");
  }
  store_ = std::make_shared<FileSystemChunkStore>(root, logger_);
  merger_ = std::make_shared<Merger>(store_, logger_);
  service_ = std::make_shared<UploadService>(store_, merger_, logger_);
  router_ = std::make_shared<ActionRouter>(service_, logger_,
                                           settings_->get<std::size_t>("max_request_bytes"));

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();

  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  started_ = true;

  logger_->info("Serving {} on {}", store_->root().string(), local_address());
  start_accept();
}

void UploadServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("Accept error: {}", ec.message());
      } else {
        Connection::create(std::move(socket), router_, logger_)->start();
      }
      if(started_) {
        start_accept();
      }
    });
}

void UploadServer::run() {
  if(!started_) start();
  for(std::size_t i = 1; i < thread_count_; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
  io_.run();
  join_threads();
}

void UploadServer::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  for(std::size_t i = 0; i < thread_count_; ++i) {
    io_threads_.emplace_back([this](){ io_.run(); });
  }
}

void UploadServer::stop() {
  if(!started_) return;
  started_ = false;

  work_.reset();
  io_.stop();
  join_threads();
  // No io thread is left, so the acceptor can be closed from here.
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  acceptor_.reset();
  io_.restart();
  logger_->info("Server on port {} stopped", listen_port_);
}

void UploadServer::join_threads() {
  for(auto& thread : io_threads_) {
    if(thread.joinable() && thread.get_id() != std::this_thread::get_id()) thread.join();
  }
  io_threads_.clear();
}

std::string UploadServer::local_address() const {
  return listen_ip_ + ":" + std::to_string(listen_port_);
}
