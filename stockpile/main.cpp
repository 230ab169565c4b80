// (c) 2024, Interance GmbH & Co KG.

#include "stockpile/database.hpp"
#include "stockpile/http_server.hpp"
#include "stockpile/inventory_actor.hpp"
#include "stockpile/inventory_service.hpp"
#include "stockpile/log.hpp"
#include "stockpile/sweeper.hpp"
#include "stockpile/types.hpp"

#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/caf_main.hpp>
#include <caf/net/http/with.hpp>
#include <caf/net/middleman.hpp>
#include <caf/net/tcp_accept_socket.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

using namespace std::literals;

namespace http = caf::net::http;

namespace {

std::string_view default_db_file = "inventory.db";

constexpr auto default_port = uint16_t{8080};

constexpr auto default_max_connections = size_t{128};

constexpr auto default_max_request_size = uint32_t{65'536};

constexpr auto default_sweep_interval = caf::timespan{1min};

constexpr auto default_sweep_timeout = caf::timespan{30s};

constexpr auto default_request_timeout = caf::timespan{2s};

std::atomic<bool> shutdown_flag;

void set_shutdown_flag(int) {
  shutdown_flag = true;
}

struct config : caf::actor_system_config {
  config() {
    opt_group{custom_options_, "global"}
      .add<std::string>("db-file,d", "path to the database file")
      .add<uint16_t>("http-port,p", "port to listen for HTTP connections")
      .add<size_t>("max-connections,m", "limit for concurrent clients")
      .add<size_t>("max-request-size,r", "limit for single request size")
      .add<caf::timespan>("lock-expiry", "default expiry of stock locks")
      .add<caf::timespan>("sweep-interval", "delay between expiry sweeps")
      .add<caf::timespan>("sweep-timeout", "maximum duration of a sweep")
      .add<size_t>("max-attempts", "runs per request on version conflicts")
      .add<caf::timespan>("transaction-timeout",
                          "maximum duration of a transaction");
    opt_group{custom_options_, "tls"}
      .add<std::string>("key-file,k", "path to the private key file")
      .add<std::string>("cert-file,c", "path to the certificate file");
  }
};

} // namespace

int caf_main(caf::actor_system& sys, const config& cfg) {
  using stockpile::http_server;
  namespace log = stockpile::log;
  // Do a regular shutdown for CTRL+C and SIGTERM.
  signal(SIGTERM, set_shutdown_flag);
  signal(SIGINT, set_shutdown_flag);
  // Database setup.
  auto db_file = caf::get_or(cfg, "db-file", default_db_file);
  auto db = std::make_shared<stockpile::database>(db_file);
  if (auto err = db->open()) {
    sys.println("Failed to open the SQLite database: {}", err);
    return EXIT_FAILURE;
  }
  if (auto n = db->count("inventory_items"))
    sys.println("Database contains {} inventory items", *n);
  // Service setup.
  auto opts = stockpile::service_options{};
  opts.default_lock_expiry = caf::get_or(cfg, "lock-expiry",
                                         opts.default_lock_expiry);
  opts.max_attempts = caf::get_or(cfg, "max-attempts", opts.max_attempts);
  opts.transaction_timeout = caf::get_or(cfg, "transaction-timeout",
                                         opts.transaction_timeout);
  auto inventory = stockpile::spawn_inventory_actor(sys, db, opts);
  auto sweep_interval = caf::get_or(cfg, "sweep-interval",
                                    default_sweep_interval);
  auto sweep_timeout = caf::get_or(cfg, "sweep-timeout",
                                   default_sweep_timeout);
  auto sweeper = stockpile::spawn_sweeper(sys, inventory, sweep_interval,
                                          sweep_timeout);
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
  auto impl = std::make_shared<http_server>(inventory, default_request_timeout);
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
        // Stop the server if our inventory actor terminates.
        .monitor(inventory)
        // Route for retrieving an item with its active locks.
        .route("/inventory/query", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/query, body: {}", res.body());
                 impl->query(res);
               })
        // Route for reserving stock for a source document.
        .route("/inventory/lock", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/lock, body: {}", res.body());
                 impl->lock(res);
               })
        // Route for returning locked stock to the available stock.
        .route("/inventory/unlock", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/unlock, body: {}", res.body());
                 impl->unlock(res);
               })
        // Route for shipping locked stock.
        .route("/inventory/deduct", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/deduct, body: {}", res.body());
                 impl->deduct(res);
               })
        // Route for receiving stock.
        .route("/inventory/increase", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/increase, body: {}", res.body());
                 impl->increase(res);
               })
        // Route for removing stock without a prior lock.
        .route("/inventory/decrease", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/decrease, body: {}", res.body());
                 impl->decrease(res);
               })
        // Route for correcting the available stock after a physical count.
        .route("/inventory/adjust", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/adjust, body: {}", res.body());
                 impl->adjust(res);
               })
        // Route for releasing all locks of a cancelled source document.
        .route("/inventory/release-source", http::method::post,
               [impl](http::responder& res) {
                 log::debug("POST /inventory/release-source, body: {}",
                            res.body());
                 impl->release_source(res);
               })
        // Start the server.
        .start();
  // Report any error to the user.
  if (!server) {
    sys.println("*** unable to run at port {}: {}", port, server.error());
    anon_send_exit(sweeper, caf::exit_reason::user_shutdown);
    anon_send_exit(inventory, caf::exit_reason::user_shutdown);
    return EXIT_FAILURE;
  }
  // Wait for CTRL+C or SIGTERM and shut down the server.
  sys.println("*** running at port {}, press CTRL+C to terminate the server",
              port);
  while (!shutdown_flag)
    std::this_thread::sleep_for(250ms);
  sys.println("*** shutting down");
  server->dispose();
  anon_send_exit(sweeper, caf::exit_reason::user_shutdown);
  anon_send_exit(inventory, caf::exit_reason::user_shutdown);
  return EXIT_SUCCESS;
}

CAF_MAIN(caf::id_block::stockpile, caf::net::middleman)
