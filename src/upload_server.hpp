#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

class ActionRouter;
class FileSystemChunkStore;
class Merger;
class SettingsManager;
class UploadService;

// TCP front of a FileSystemChunkStore. Reads listen_ip, listen_port,
// storage_root, io_threads, max_request_bytes and verbose from the settings.
class UploadServer {
public:
  explicit UploadServer(std::shared_ptr<SettingsManager> settings);
  ~UploadServer();

  UploadServer(const UploadServer&) = delete;
  UploadServer& operator=(const UploadServer&) = delete;

  // Binds and starts accepting; no threads yet.
  void start();
  // Blocks running the io_context on the calling thread plus io_threads - 1.
  void run();
  // Runs io_threads threads in the background and returns.
  void start_background();
  void stop();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<FileSystemChunkStore> store() const { return store_; }
  std::shared_ptr<Merger> merger() const { return merger_; }

  uint16_t listen_port() const { return listen_port_; }
  std::string local_address() const;

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void join_threads();

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> io_threads_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::shared_ptr<FileSystemChunkStore> store_;
  std::shared_ptr<Merger> merger_;
  std::shared_ptr<UploadService> service_;
  std::shared_ptr<ActionRouter> router_;
  std::atomic<bool> started_{false};
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
  std::size_t thread_count_ = 1;
};
