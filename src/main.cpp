#include "stdinc.hpp"

#include "ddp/client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <fmt/ranges.h>

namespace ddp {

namespace {
constexpr std::array<std::string_view, 7> k_log_levels
    = {"trace", "debug", "info", "warn", "error", "critical", "off"};

struct Config {
  bool show_help{false};
  string url{""};
  string version{"1"};
  vector<string> subscriptions;
  string method{""};
  string params{""};
  int seconds{10};
  string log_level{""};
};

void show_help(std::string_view exec) {
  cout << format(R"V0G0N(

   Usage: {} --url <ws-url> [OPTIONS...]

      Connects to a DDP server (e.g., Meteor), optionally subscribes to
      publications and calls a method, and prints what the server sends.

   Options:

      --url <url>          ws:// or wss:// address, e.g., ws://localhost:3000/websocket
      --version <version>  Preferred protocol version: {}
      --sub <name>         Subscribe to a publication. May be repeated.
      --call <method>      Call a method once connected.
      --params <json>      Json array of parameters for --call.
      --seconds <n>        Seconds to run before disconnecting. Default is 10.
      --log-level <level>  One of: {}

)V0G0N",
                 exec, fmt::join(DdpClient::supported_versions(), ", "),
                 fmt::join(k_log_levels, ", "))
       << endl;
}

// ------------------------------------------------------------------------------------ CliListener

class CliListener final : public DdpListener {
public:
  void on_connect() override { cout << "connected" << endl; }

  void on_disconnect(uint16_t code, std::string_view reason) override {
    cout << format("disconnected, code={}, reason='{}'", code, reason) << endl;
  }

  void on_exception(std::error_code ec, std::string_view what) override {
    cout << format("error: {} ({})", what, ec.message()) << endl;
  }

  void on_data_added(std::string_view collection, std::string_view id,
                     std::string_view fields) override {
    cout << format("added    {}/{} {}", collection, id, fields) << endl;
  }

  void on_data_changed(std::string_view collection, std::string_view id,
                       std::string_view fields, std::string_view cleared) override {
    cout << format("changed  {}/{} {} cleared={}", collection, id, fields, cleared) << endl;
  }

  void on_data_removed(std::string_view collection, std::string_view id) override {
    cout << format("removed  {}/{}", collection, id) << endl;
  }
};
} // namespace

int main(int argc, char** argv) {
  Config config;
  auto has_error = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (arg == "-h" || arg == "--help") {
        config.show_help = true;
      } else if (arg == "--url") {
        config.url = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--version") {
        config.version = cli::safe_arg_choice(argc, argv, i, DdpClient::supported_versions());
      } else if (arg == "--sub") {
        config.subscriptions.push_back(cli::safe_arg_str(argc, argv, i));
      } else if (arg == "--call") {
        config.method = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--params") {
        config.params = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--seconds") {
        config.seconds = cli::safe_arg_int(argc, argv, i);
      } else if (arg == "--log-level") {
        config.log_level = cli::safe_arg_choice(argc, argv, i, k_log_levels);
      } else {
        cout << format("unexpected argument: '{}'", arg) << endl;
        has_error = true;
      }
    } catch (std::runtime_error& e) {
      cout << format("Error on command-line: {}", e.what()) << endl;
      has_error = true;
    }
  }

  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  if (config.url.empty()) {
    cout << "must specify --url" << endl;
    has_error = true;
  }
  if (config.seconds < 0) {
    cout << format("--seconds must be non-negative, got {}", config.seconds) << endl;
    has_error = true;
  }

  Json::Value params;
  if (!config.params.empty()) {
    auto parsed = protocol::parse_json(config.params);
    if (!parsed || !parsed->isArray()) {
      cout << format("--params must be a json array, got: {}", config.params) << endl;
      has_error = true;
    } else {
      params = std::move(*parsed);
    }
  }

  if (has_error) {
    cout << format("aborting...") << endl;
    return EXIT_FAILURE;
  }

  if (!config.log_level.empty() && !logging::set_log_level(config.log_level))
    cout << format("failed to set log level '{}'", config.log_level) << endl;

  boost::asio::io_context io_context;

  auto client = std::make_unique<DdpClient>(
      DdpClient::Config{config.url, config.version},
      std::make_unique<net::WebsocketTransport>(io_context), std::make_shared<CliListener>());

  for (const auto& name : config.subscriptions) {
    client->subscribe(name, Json::Value{}, [name](const Status& status) {
      if (status.ok())
        cout << format("subscription '{}' ready", name) << endl;
      else
        cout << format("subscription '{}' {}: {} {}", name, str(status.code()), status.error(),
                       status.reason())
             << endl;
    });
  }

  if (!config.method.empty()) {
    client->call(config.method, params,
                 [method = config.method](const Status& status, std::string_view result) {
                   if (status.ok())
                     cout << format("{} returned {}", method, result) << endl;
                   else
                     cout << format("{} failed: {} {} {}", method, status.error(),
                                    status.reason(), status.details())
                          << endl;
                 });
  }

  // Requests are queued until the server accepts the handshake
  boost::asio::steady_timer timer{io_context, std::chrono::seconds{config.seconds}};
  timer.async_wait([&client](boost::system::error_code ec) {
    if (!ec)
      client->disconnect();
  });

  io_context.run();
  client.reset();

  return EXIT_SUCCESS;
}

} // namespace ddp

int main(int argc, char** argv) { return ddp::main(argc, argv); }
