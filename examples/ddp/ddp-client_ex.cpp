#include "stdinc.hpp"

#include "ddp/client.hpp"

#include <boost/asio/io_context.hpp>

namespace ddp::example {

// ------------------------------------------------------------------------------------ TodoListener

class TodoListener : public DdpListener {
public:
  void on_connect() override { INFO("connected"); }

  void on_disconnect(uint16_t code, std::string_view reason) override {
    INFO("disconnected, code={}, reason='{}'", code, reason);
  }

  void on_exception(std::error_code ec, std::string_view what) override {
    LOG_ERR("{}: {}", what, ec.message());
  }

  void on_data_added(std::string_view collection, std::string_view id,
                     std::string_view fields) override {
    INFO("added {}/{}: {}", collection, id, fields);
  }

  void on_data_changed(std::string_view collection, std::string_view id, std::string_view fields,
                       std::string_view cleared) override {
    INFO("changed {}/{}: {}, cleared {}", collection, id, fields, cleared);
  }

  void on_data_removed(std::string_view collection, std::string_view id) override {
    INFO("removed {}/{}", collection, id);
  }
};

// ---------------------------------------------------------------------------------------- run_todos

int run_todos(std::string_view url) {
  boost::asio::io_context io_context;

  DdpClient client{DdpClient::Config{string{url}},
                   std::make_unique<net::WebsocketTransport>(io_context),
                   std::make_shared<TodoListener>()};

  const auto sub_id = client.subscribe("tasks", Json::Value{}, [&client](const Status& status) {
    if (!status.ok()) {
      LOG_ERR("subscription failed: {} {}", status.error(), status.reason());
      client.disconnect();
      return;
    }

    Json::Value task{Json::objectValue};
    task["text"] = "buy milk";
    client.insert("tasks", task, [&client](const Status& status, std::string_view result) {
      if (status.ok())
        INFO("inserted task {}", result);
      else
        LOG_ERR("insert failed: {}", status.reason());
      client.disconnect(); // Lets `io_context.run()` return
    });
  });

  INFO("subscribed with id {}", sub_id);
  io_context.run();
  return EXIT_SUCCESS;
}

} // namespace ddp::example

int main(int argc, char** argv) {
  return ddp::example::run_todos(argc > 1 ? argv[1] : "ws://localhost:3000/websocket");
}
