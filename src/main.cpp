#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "remote_upload_actions.hpp"
#include "settings_manager.hpp"
#include "upload_server.hpp"
#include "upload_session.hpp"

namespace {

std::string progress_bar(double percent, std::size_t width) {
  auto filled = static_cast<std::size_t>(percent / 100.0 * static_cast<double>(width));
  if(filled > width) filled = width;
  return std::string(filled, '#') + std::string(width - filled, '.');
}

int run_server(const std::shared_ptr<SettingsManager>& settings) {
  UploadServer server(settings);
  server.start();
  server.logger()->print("chunkup serving {} on {}",
                         settings->get<std::string>("storage_root"), server.local_address());
  server.start_background();

  asio::io_context signal_io;
  asio::signal_set signals(signal_io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signo){
    if(!ec) server.logger()->info("Signal {} received, shutting down", signo);
  });
  signal_io.run();

  server.stop();
  return 0;
}

int run_upload(const std::shared_ptr<SettingsManager>& settings, const std::shared_ptr<Logger>& logger) {
  auto file = settings->get<std::string>("file");
  if(file.empty()) {
    logger->print_err("upload needs a file");
    return 1;
  }
  if(!std::filesystem::is_regular_file(file)) {
    logger->print_err("{} is not a regular file", file);
    return 1;
  }

  auto actions = std::shared_ptr<RemoteUploadActions>(
    RemoteUploadActions::from_address(settings->get<std::string>("server"), logger));

  UploadSession::Options options;
  options.chunk_size = settings->get<std::size_t>("chunk_size");
  options.concurrency = settings->get<std::size_t>("concurrency");
  options.max_retries = settings->get<std::size_t>("max_retries");
  options.retry_backoff = std::chrono::milliseconds(settings->get<long long>("retry_backoff_ms"));
  options.verify_chunks = settings->get<bool>("verify_chunks");

  // Declared before the session so they outlive its listener.
  const auto interval = std::chrono::milliseconds(settings->get<long long>("progress_interval_ms"));
  std::mutex print_mutex;
  auto last_print = std::chrono::steady_clock::time_point{};
  auto last_state = UploadSession::State::Default;

  // Ctrl-C pauses the transfer; chunks already stored let a rerun resume.
  std::atomic<bool> interrupted{false};
  asio::io_context signal_io;
  asio::signal_set signals(signal_io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signo){
    if(ec) return;
    logger->info("Signal {} received, pausing upload", signo);
    interrupted = true;
  });
  std::thread signal_thread([&signal_io]{ signal_io.run(); });
  struct SignalThreadStop {
    asio::io_context& io;
    std::thread& thread;
    ~SignalThreadStop() {
      io.stop();
      if(thread.joinable()) thread.join();
    }
  } signal_thread_stop{signal_io, signal_thread};

  UploadSession session(file, actions, options, logger);
  session.add_listener([&](const UploadSession::Snapshot& snap){
    std::lock_guard<std::mutex> lock(print_mutex);
    auto now = std::chrono::steady_clock::now();
    if(snap.state == last_state && now - last_print < interval) return;
    last_print = now;
    last_state = snap.state;
    logger->print("[{}] {:6.2f}% {}/{} chunks  {}",
                  progress_bar(snap.progress, 40), snap.progress,
                  snap.completed, snap.chunk_count, UploadSession::state_name(snap.state));
  });

  bool auto_upload = settings->get<bool>("auto_upload");
  session.start(auto_upload);
  if(!auto_upload && session.state() == UploadSession::State::WaitForUpload) {
    session.play();
  }

  while(!interrupted && !session.wait_until_settled(std::chrono::milliseconds(200))) {
  }

  if(interrupted) {
    if(session.state() == UploadSession::State::Uploading) {
      try {
        session.stop();
      } catch(const SessionStateError& e) {
        // Finished or failed between the check and the call.
        logger->debug("stop after signal: {}", e.what());
      }
    }
    // Waits for chunks already on the wire.
    session.destroy();
    auto snap = session.snapshot();
    if(!UploadSession::is_terminal(snap.state)) {
      logger->print_err("upload interrupted with {}/{} chunks stored; run again to resume",
                        snap.completed, snap.chunk_count);
      return 1;
    }
  }

  auto snap = session.snapshot();
  switch(snap.state) {
    case UploadSession::State::FastUploaded:
      logger->print("{} already on server as {}", file, snap.hash);
      return 0;
    case UploadSession::State::UploadSuccessfully:
      logger->print("{} uploaded as {} ({} chunks)", file, snap.hash, snap.chunk_count);
      return 0;
    default:
      if(snap.error) {
        logger->print_err("upload failed: {} ({})", snap.error->what(), snap.error->kind_name());
      } else {
        logger->print_err("upload ended in state {}", UploadSession::state_name(snap.state));
      }
      return 1;
  }
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".chunkup" / "settings.json");
    settings->load();

    CommandLineParser parser("chunkup");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const std::invalid_argument& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("chunkup");
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto command = settings->get<std::string>("command");
    if(command == "serve") {
      return run_server(settings);
    }
    if(command == "upload") {
      return run_upload(settings, logger);
    }
    if(command.empty() && settings->save_requested()) {
      return 0;
    }
    print_err(nullptr, "Unknown command '{}'", command);
    parser.usage();
    return 1;
  } catch(std::exception& e) {
    init(false);
    Logger logger("chunkup-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
