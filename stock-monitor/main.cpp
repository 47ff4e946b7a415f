// (c) 2024, Interance GmbH & Co KG.

#include "controller_actor.hpp"
#include "database.hpp"
#include "http_server.hpp"
#include "json_file_storage.hpp"
#include "ledger.hpp"
#include "ledger_actor.hpp"
#include "log.hpp"
#include "memory_storage.hpp"
#include "stock_update.hpp"
#include "types.hpp"

#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/caf_main.hpp>
#include <caf/disposable.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/json_writer.hpp>
#include <caf/net/acceptor_resource.hpp>
#include <caf/net/http/with.hpp>
#include <caf/net/middleman.hpp>
#include <caf/net/octet_stream/with.hpp>
#include <caf/net/ssl/context.hpp>
#include <caf/net/tcp_accept_socket.hpp>
#include <caf/net/web_socket/frame.hpp>
#include <caf/net/web_socket/switch_protocol.hpp>
#include <caf/scheduled_actor/flow.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

using namespace std::literals;

namespace http = caf::net::http;
namespace ws = caf::net::web_socket;

namespace {

std::string_view default_storage = "sqlite";

std::string_view default_db_file = "stock.db";

std::string_view default_json_file = "stock_monitor_db.json";

constexpr auto default_port = uint16_t{8080};

constexpr auto default_max_connections = size_t{128};

constexpr auto default_max_request_size = uint32_t{65'536};

constexpr auto default_max_pending_frames = size_t{32};

std::atomic<bool> shutdown_flag;

void set_shutdown_flag(int) {
  shutdown_flag = true;
}

struct config : caf::actor_system_config {
  config() {
    opt_group{custom_options_, "global"}
      .add<std::string>("storage,s", "storage back end: sqlite, json or memory")
      .add<std::string>("db-file,d", "path to the database or JSON file")
      .add<uint16_t>("http-port,p", "port to listen for HTTP connections")
      .add<size_t>("max-connections,m", "limit for concurrent clients")
      .add<size_t>("max-request-size,r", "limit for single request size")
      .add<uint16_t>("cmd-port,P", "port to listen for (JSON) commands")
      .add<std::string>("cmd-addr,A", "bind address for the controller");
    opt_group{custom_options_, "stock"}
      .add<double>("warning-factor", "multiplier for the warning threshold")
      .add<int32_t>("lookback-days", "window for the average daily usage")
      .add<bool>("reject-overdraw", "reject outgoing movements beyond stock")
      .add<bool>("seed-sample-data", "add sample items to an empty catalog");
    opt_group{custom_options_, "tls"}
      .add<std::string>("key-file,k", "path to the private key file")
      .add<std::string>("cert-file,c", "path to the certificate file");
  }
};

// Creates the storage back end selected by the user.
storage_ptr make_storage(caf::actor_system& sys, const config& cfg) {
  auto kind = caf::get_or(cfg, "storage", default_storage);
  if (kind == "sqlite")
    return std::make_shared<database>(
      caf::get_or(cfg, "db-file", default_db_file));
  if (kind == "json")
    return std::make_shared<json_file_storage>(
      caf::get_or(cfg, "db-file", default_json_file));
  if (kind == "memory")
    return std::make_shared<memory_storage>();
  sys.println("*** unknown storage back end: {}", kind);
  return nullptr;
}

// Registers the sample items of the original desktop tool.
caf::error seed_sample_data(ledger& ldg) {
  auto xs = ldg.items();
  if (!xs)
    return std::move(xs.error());
  if (!xs->empty())
    return caf::error{};
  item steel;
  steel.name = "Steel Sheets";
  steel.sku = "STL-001";
  steel.unit = "pc";
  steel.current_quantity = 150;
  steel.min_quantity = 50;
  steel.supplier = "MetalWorks Inc.";
  steel.warehouse = "Main Warehouse";
  item pellets;
  pellets.name = "Plastic Pellets";
  pellets.sku = "PLA-001";
  pellets.unit = "kg";
  pellets.current_quantity = 500;
  pellets.min_quantity = 200;
  pellets.supplier = "Plastico";
  pellets.warehouse = "Main Warehouse";
  for (auto& x : {steel, pellets}) {
    if (auto res = ldg.register_item(x); !res)
      return std::move(res.error());
  }
  return caf::error{};
}

// Compares the stored quantity of each item with its movement history.
void audit(ledger& ldg) {
  auto xs = ldg.items();
  if (!xs) {
    log::error("failed to audit the ledger: {}", xs.error());
    return;
  }
  for (const auto& x : *xs) {
    auto replayed = ldg.replay(x.id);
    if (!replayed) {
      log::error("failed to replay item {}: {}", x.id, replayed.error());
      continue;
    }
    if (*replayed != x.current_quantity)
      log::warning("item {} ({}) stores {} but its movements add up to {}",
                   x.id, x.sku, x.current_quantity, *replayed);
  }
}

// The actor for handling a single WebSocket connection.
void ws_worker(caf::event_based_actor* self,
               caf::net::accept_event<ws::frame> new_conn,
               stock_events events) {
  using frame = ws::frame;
  auto [pull, push] = new_conn.data();
  auto writer = std::make_shared<caf::json_writer>();
  writer->skip_object_type_annotation(true);
  // We ignore whatever the client may send to us.
  pull.observe_on(self)
    .do_finally([] { log::info("WebSocket client disconnected"); })
    .subscribe(std::ignore);
  // Send all events as JSON objects to the client.
  events.observe_on(self)
    .filter([](const stock_event& ev) { return ev != nullptr; })
    .map([writer](const stock_event& ev) mutable {
      writer->reset();
      if (!writer->apply(*ev)) {
        log::error("failed to serialize a stock event: {}",
                   writer->get_error());
        return frame{};
      }
      return frame{writer->str()};
    })
    .filter([](const frame& item) { return !item.empty(); })
    .on_backpressure_buffer(default_max_pending_frames)
    .subscribe(push);
}

// The actor for accepting incoming WebSocket connections.
void ws_server(caf::event_based_actor* self,
               caf::net::acceptor_resource<ws::frame> res,
               stock_events events) {
  res.observe_on(self).for_each([self, events](auto new_conn) {
    log::info("WebSocket client connected");
    self->spawn(ws_worker, new_conn, events);
  });
}

} // namespace

int caf_main(caf::actor_system& sys, const config& cfg) {
  // Do a regular shutdown for CTRL+C and SIGTERM.
  signal(SIGTERM, set_shutdown_flag);
  signal(SIGINT, set_shutdown_flag);
  // Storage and ledger setup.
  auto store = make_storage(sys, cfg);
  if (!store)
    return EXIT_FAILURE;
  if (auto err = store->open()) {
    sys.println("Failed to open the storage: {}", err);
    return EXIT_FAILURE;
  }
  ledger_config ledger_cfg;
  ledger_cfg.warning_factor = caf::get_or(cfg, "stock.warning-factor",
                                          default_warning_factor);
  ledger_cfg.lookback_days = caf::get_or(cfg, "stock.lookback-days",
                                         default_lookback_days);
  ledger_cfg.reject_overdraw = caf::get_or(cfg, "stock.reject-overdraw",
                                           false);
  if (ledger_cfg.lookback_days <= 0
      || ledger_cfg.lookback_days > max_lookback_days) {
    sys.println("*** invalid lookback window: {} days",
                ledger_cfg.lookback_days);
    return EXIT_FAILURE;
  }
  auto ldg = std::make_shared<ledger>(store, ledger_cfg);
  if (auto err = ldg->init()) {
    sys.println("Failed to read the movement log: {}", err);
    return EXIT_FAILURE;
  }
  if (caf::get_or(cfg, "stock.seed-sample-data", false)) {
    if (auto err = seed_sample_data(*ldg)) {
      sys.println("Failed to add the sample data: {}", err);
      return EXIT_FAILURE;
    }
  }
  audit(*ldg);
  if (auto xs = ldg->items())
    sys.println("Catalog contains {} items", xs->size());
  auto [ledger_hdl, events] = spawn_ledger_actor(sys, ldg);
  // Spin up the controller if configured. The controller monitors the ledger
  // actor and quits together with it.
  auto ctrl_server = caf::disposable{};
  if (auto cmd_port = caf::get_as<uint16_t>(cfg, "cmd-port")) {
    auto addr = caf::get_or(cfg, "cmd-addr", "0.0.0.0"sv);
    auto started
      = caf::net::octet_stream::with(sys)
          // Bind to the user-defined address and port.
          .accept(*cmd_port, addr)
          // Stop the server if our ledger actor terminates.
          .monitor(ledger_hdl)
          // When started, run our worker actor to handle incoming connections.
          .start([&sys, hdl = ledger_hdl](
                   caf::net::acceptor_resource<std::byte> conns) {
            spawn_controller_actor(sys, hdl, std::move(conns));
          });
    if (!started) {
      sys.println("*** failed to start command server: {}", started.error());
      anon_send_exit(ledger_hdl, caf::exit_reason::user_shutdown);
      return EXIT_FAILURE;
    }
    ctrl_server = std::move(*started);
  }
  // Read the configuration for the web server.
  auto port = caf::get_or(cfg, "http-port", default_port);
  auto pem = caf::net::ssl::format::pem;
  auto key_file = caf::get_as<std::string>(cfg, "tls.key-file");
  auto cert_file = caf::get_as<std::string>(cfg, "tls.cert-file");
  auto max_connections = caf::get_or(cfg, "max-connections",
                                     default_max_connections);
  auto max_request_size = caf::get_or(cfg, "max-request-size",
                                      default_max_request_size);
  if (!key_file != !cert_file) {
    sys.println("*** inconsistent TLS config: declare neither file or both");
    return EXIT_FAILURE;
  }
  // Start the HTTP server.
  namespace ssl = caf::net::ssl;
  auto impl = std::make_shared<http_server>(ledger_hdl,
                                            ledger_cfg.lookback_days);
  auto server
    = caf::net::http::with(sys)
        // Optionally enable TLS.
        .context(ssl::context::enable(key_file && cert_file)
                   .and_then(ssl::emplace_server(ssl::tls::v1_2))
                   .and_then(ssl::use_private_key_file(key_file, pem))
                   .and_then(ssl::use_certificate_file(cert_file, pem)))
        // Bind to the user-defined port.
        .accept(port)
        // Limit how many clients may be connected at any given time.
        .max_connections(max_connections)
        // Limit the maximum request size.
        .max_request_size(max_request_size)
        // Stop the server if our ledger actor terminates.
        .monitor(ledger_hdl)
        // Route for listing all items.
        .route("/api/items", http::method::get,
               [impl](http::responder& res) {
                 log::debug("GET /api/items");
                 impl->list_items(res);
               })
        // Route for adding a new item to the catalog. The payload must be a
        // JSON object with at least the fields "name", "sku", "unit",
        // "current_quantity" and "min_quantity".
        .route("/api/items", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /api/items, body: {}", res.body());
                 impl->add_item(res);
               })
        // Route for retrieving a single item.
        .route("/api/items/<arg>", http::method::get,
               [impl](http::responder& res, int32_t key) {
                 log::debug("GET /api/items/{}", key);
                 impl->get_item(res, key);
               })
        // Route for the movement history of an item.
        .route("/api/items/<arg>/movements", http::method::get,
               [impl](http::responder& res, int32_t key) {
                 log::debug("GET /api/items/{}/movements", key);
                 impl->history(res, key);
               })
        // Route for the traffic-light status of an item.
        .route("/api/items/<arg>/status", http::method::get,
               [impl](http::responder& res, int32_t key) {
                 log::debug("GET /api/items/{}/status", key);
                 impl->status(res, key);
               })
        // Route for the predicted shortage date of an item.
        .route("/api/items/<arg>/shortage-date", http::method::get,
               [impl](http::responder& res, int32_t key) {
                 log::debug("GET /api/items/{}/shortage-date", key);
                 impl->predict(res, key);
               })
        // Route for applying a movement. The payload must be a JSON object
        // with the fields "item_id", "movement_type" and "quantity".
        .route("/api/stock-movements", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /api/stock-movements, body: {}",
                            res.body());
                 impl->apply_movement(res);
               })
        // Route for the current alerts, optionally filtered by "status",
        // "supplier" and "warehouse".
        .route("/api/stock-alerts", http::method::get,
               [impl](http::responder& res) {
                 log::debug("GET /api/stock-alerts");
                 impl->alerts(res);
               })
        // Route for the predicted shortage dates of all items.
        .route("/api/predictions/shortage-dates", http::method::get,
               [impl](http::responder& res) {
                 log::debug("GET /api/predictions/shortage-dates");
                 impl->predict_all(res);
               })
        // WebSocket route for subscribing to applied movements.
        .route("/events", http::method::get,
               ws::switch_protocol()
                 .on_request([](ws::acceptor<>& acc) { acc.accept(); })
                 .on_start([&sys, ev = events](auto res) {
                   sys.spawn(ws_server, res, ev);
                 }))
        // Start the server.
        .start();
  // Report any error to the user.
  if (!server) {
    sys.println("*** unable to run at port {}: {}", port, server.error());
    if (ctrl_server)
      ctrl_server.dispose();
    anon_send_exit(ledger_hdl, caf::exit_reason::user_shutdown);
    return EXIT_FAILURE;
  }
  // Wait for CTRL+C or SIGTERM and shut down the server.
  sys.println("*** running at port {}, press CTRL+C to terminate the server",
              port);
  while (!shutdown_flag)
    std::this_thread::sleep_for(250ms);
  sys.println("*** shutting down");
  server->dispose();
  if (ctrl_server)
    ctrl_server.dispose();
  anon_send_exit(ledger_hdl, caf::exit_reason::user_shutdown);
  return EXIT_SUCCESS;
}

CAF_MAIN(caf::id_block::stock_monitor, caf::net::middleman)
