#include "connection.hpp"
#include "content_hasher.hpp"
#include "filesystem_chunk_store.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "remote_upload_actions.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "upload_errors.hpp"
#include "upload_server.hpp"
#include "upload_session.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

using namespace std::chrono_literals;
using chunkup::test::TempDir;

struct TestContext {
  chunkup::test::LogCapture& logs;
  std::shared_ptr<Logger> logger;
  bool verbose = false;
};

#define EXPECT(cond) do { \
    if(!(cond)) { \
      std::cout << "\n    " << __FILE__ << ":" << __LINE__ << ": expected " #cond << std::flush; \
      return false; \
    } \
  } while(0)

template<typename Error, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch(const Error&) {
    return true;
  }
  return false;
}

std::unique_ptr<UploadServer> start_server(TestContext& ctx,
                                           const std::filesystem::path& root,
                                           std::size_t max_request_bytes = 64u * 1024u * 1024u) {
  auto configure = [](const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };

  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(root / ".chunkup" / "settings.json");
  configure(settings, "listen_ip", "127.0.0.1");
  configure(settings, "listen_port", 0);
  configure(settings, "storage_root", (root / "store").string());
  configure(settings, "io_threads", 2);
  configure(settings, "max_request_bytes", max_request_bytes);
  configure(settings, "verbose", ctx.verbose);

  auto server = std::make_unique<UploadServer>(settings);
  ctx.logs.attach(*server, "server");
  server->start();
  server->start_background();
  if(ctx.verbose) {
    std::cout << "    server listening on " << server->listen_port() << "\n";
  }
  return server;
}

std::shared_ptr<RemoteUploadActions> client_for(TestContext& ctx, const UploadServer& server) {
  return std::make_shared<RemoteUploadActions>("127.0.0.1", server.listen_port(), ctx.logger);
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Sends one raw request line and returns the parsed response.
nlohmann::json raw_exchange(uint16_t port, const std::string& line, const std::string& payload = std::string()) {
  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  asio::write(socket, asio::buffer(line + "\n"));
  if(!payload.empty()) asio::write(socket, asio::buffer(payload));
  asio::streambuf buf;
  asio::read_until(socket, buf, "\n");
  std::istream is(&buf);
  std::string response;
  std::getline(is, response);
  return nlohmann::json::parse(response);
}

bool test_remote_end_to_end(TestContext& ctx) {
  TempDir dir("remote_e2e");
  auto server = start_server(ctx, dir.path());
  auto actions = client_for(ctx, *server);

  auto content = chunkup::test::make_content(5 * 64 * 1024 + 99, 21);
  auto path = chunkup::test::write_file(dir / "upload.bin", content);
  UploadSession::Options options;
  options.chunk_size = 64 * 1024;
  options.concurrency = 3;

  {
    UploadSession session(path, actions, options, ctx.logger);
    session.start();
    EXPECT(session.wait_until_settled(10s));
    EXPECT(session.state() == UploadSession::State::UploadSuccessfully);
    EXPECT(session.chunk_count() == 6);
    auto hash = session.file_hash();
    EXPECT(read_file(server->store()->artifact_path(hash)) == content);
    EXPECT(server->merger()->merges_performed() == 1);
  }
  // Concurrent workers each borrowed their own socket and returned it.
  EXPECT(actions->idle_connections() >= 1);
  EXPECT(actions->idle_connections() <= 3);

  UploadSession again(path, actions, options, ctx.logger);
  again.start();
  EXPECT(again.wait_until_settled(5s));
  EXPECT(again.state() == UploadSession::State::FastUploaded);
  EXPECT(server->merger()->merges_performed() == 1);

  server->stop();
  return true;
}

bool test_remote_resume(TestContext& ctx) {
  TempDir dir("remote_resume");
  auto server = start_server(ctx, dir.path());
  auto actions = client_for(ctx, *server);

  auto content = chunkup::test::make_content(5 * 1000, 22);
  auto path = chunkup::test::write_file(dir / "upload.bin", content);
  auto hash = ContentHasher::hash_bytes(content);
  for(ChunkIndex i : {0, 1, 3}) {
    std::istringstream in(content.substr(i * 1000, 1000));
    server->store()->write_chunk(hash, i, in);
  }

  UploadSession::Options options;
  options.chunk_size = 1000;
  options.concurrency = 2;
  UploadSession session(path, actions, options, ctx.logger);
  session.start(false);
  EXPECT(session.state() == UploadSession::State::WaitForUpload);
  EXPECT(session.pending_indices() == (std::vector<ChunkIndex>{2, 4}));
  session.play();
  EXPECT(session.wait_until_settled(5s));
  EXPECT(session.state() == UploadSession::State::UploadSuccessfully);
  EXPECT(read_file(server->store()->artifact_path(hash)) == content);

  server->stop();
  return true;
}

bool test_remote_errors(TestContext& ctx) {
  TempDir dir("remote_errors");
  auto server = start_server(ctx, dir.path());
  auto actions = client_for(ctx, *server);
  auto hash = ContentHasher::hash_bytes("remote errors");

  EXPECT(!actions->file_exists(hash));
  EXPECT(!actions->chunk_exists(hash, 0));
  EXPECT(!actions->last_existed_chunk_index(hash));

  std::istringstream first("part one");
  actions->upload_chunk(hash, 0, first);
  EXPECT(actions->chunk_exists(hash, 0));
  auto last = actions->last_existed_chunk_index(hash);
  EXPECT(last && *last == 0);

  EXPECT(throws<IncompleteUploadError>([&]{ actions->merge(hash, 2); }));
  EXPECT(!actions->file_exists(hash));
  EXPECT(throws<InvalidRequestError>([&]{ actions->file_exists("not/a/hash"); }));

  std::istringstream second(" and two");
  actions->upload_chunk(hash, 1, second);
  actions->merge(hash, 2);
  actions->merge(hash, 2);
  EXPECT(actions->file_exists(hash));
  EXPECT(read_file(server->store()->artifact_path(hash)) == "part one and two");

  server->stop();
  return true;
}

bool test_malformed_requests(TestContext& ctx) {
  TempDir dir("remote_malformed");
  auto server = start_server(ctx, dir.path(), 16);
  auto port = server->listen_port();

  auto unknown = raw_exchange(port, make_action_request("dropTable", nlohmann::json::array(), "r1").dump());
  EXPECT(unknown.value("requestId", "") == "r1");
  EXPECT(unknown["error"]["kind"] == "InvalidRequestError");

  auto bad_args = raw_exchange(port, make_action_request(action_names::kChunkExists,
                                                         nlohmann::json::array({"abc", -1}), "r2").dump());
  EXPECT(bad_args["error"]["kind"] == "InvalidRequestError");

  auto garbage = raw_exchange(port, "{not json");
  EXPECT(garbage["error"]["kind"] == "InvalidRequestError");

  auto hash = ContentHasher::hash_bytes("too big");
  auto too_big = raw_exchange(port, make_action_request(action_names::kUploadChunk,
                                                        nlohmann::json::array({hash, 0}), "r3", 64).dump(),
                              std::string(64, 'x'));
  EXPECT(too_big["error"]["kind"] == "InvalidRequestError");
  EXPECT(!server->store()->chunk_exists(hash, 0));

  // The client maps the same refusal onto the typed exception.
  auto actions = client_for(ctx, *server);
  std::istringstream payload(std::string(64, 'y'));
  EXPECT(throws<InvalidRequestError>([&]{ actions->upload_chunk(hash, 0, payload); }));

  server->stop();
  return true;
}

bool test_oversized_request_line(TestContext& ctx) {
  TempDir dir("remote_long_line");
  auto server = start_server(ctx, dir.path());

  // A request line that never ends must not grow the server's buffer.
  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server->listen_port()));
  asio::write(socket, asio::buffer(std::string(Connection::kMaxHeaderBytes, 'x')));
  asio::streambuf buf;
  asio::read_until(socket, buf, "\n");
  std::istream is(&buf);
  std::string line;
  std::getline(is, line);
  auto response = nlohmann::json::parse(line);
  EXPECT(response["error"]["kind"] == "InvalidRequestError");

  // The server drops the connection afterwards.
  std::error_code ec;
  asio::read(socket, buf, asio::transfer_at_least(1), ec);
  EXPECT(ec == asio::error::eof || ec == asio::error::connection_reset);

  // Other clients are unaffected.
  auto actions = client_for(ctx, *server);
  EXPECT(!actions->file_exists(ContentHasher::hash_bytes("still serving")));
  server->stop();
  return true;
}

bool test_unreachable_server(TestContext& ctx) {
  TempDir dir("remote_unreachable");
  auto server = start_server(ctx, dir.path());
  auto port = server->listen_port();
  server->stop();
  server.reset();

  RemoteUploadActions actions("127.0.0.1", port, ctx.logger);
  EXPECT(throws<TransferError>([&]{ actions.file_exists(ContentHasher::hash_bytes("x")); }));

  auto path = chunkup::test::write_file(dir / "upload.bin", "payload");
  auto shared = std::make_shared<RemoteUploadActions>("127.0.0.1", port, ctx.logger);
  UploadSession session(path, shared, UploadSession::Options(), ctx.logger);
  session.start();
  EXPECT(session.state() == UploadSession::State::Error);
  EXPECT(session.error() && session.error()->kind() == UploadErrorKind::Transfer);
  return true;
}

bool test_address_parsing(TestContext&) {
  auto actions = RemoteUploadActions::from_address("upload.example.org:9000");
  EXPECT(actions->host() == "upload.example.org");
  EXPECT(actions->port() == 9000);
  EXPECT(throws<std::invalid_argument>([]{ RemoteUploadActions::from_address("no-port"); }));
  EXPECT(throws<std::invalid_argument>([]{ RemoteUploadActions::from_address("host:"); }));
  EXPECT(throws<std::invalid_argument>([]{ RemoteUploadActions::from_address("host:70000"); }));
  EXPECT(throws<std::invalid_argument>([]{ RemoteUploadActions::from_address("host:12ab"); }));
  return true;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("CHUNKUP_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("CHUNKUP_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  init(verbose);
  chunkup::test::LogCapture logs;
  auto logger = std::make_shared<Logger>("remote-test");
  logs.attach(logger, "client");
  TestContext ctx{logs, logger, verbose};
  std::vector<TestCase> tests = {
    {"remote_end_to_end", test_remote_end_to_end},
    {"remote_resume", test_remote_resume},
    {"remote_errors", test_remote_errors},
    {"malformed_requests", test_malformed_requests},
    {"oversized_request_line", test_oversized_request_line},
    {"unreachable_server", test_unreachable_server},
    {"address_parsing", test_address_parsing}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " remote tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " remote tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  logs.detach_all();
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
