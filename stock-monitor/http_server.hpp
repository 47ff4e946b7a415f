// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "ec.hpp"
#include "ledger_actor.hpp"

#include <caf/error.hpp>
#include <caf/json_writer.hpp>
#include <caf/net/http/responder.hpp>
#include <caf/net/http/status.hpp>
#include <caf/sec.hpp>
#include <caf/typed_actor.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/// Bridges between HTTP requests and the ledger actor.
class http_server {
public:
  using responder = caf::net::http::responder;

  using http_status = caf::net::http::status;

  http_server(ledger_actor ledger, int32_t default_lookback_days)
    : ledger_(std::move(ledger)),
      default_lookback_days_(default_lookback_days) {
    // nop
  }

  static constexpr std::string_view json_mime_type = "application/json";

  static constexpr auto request_timeout = std::chrono::seconds{2};

  void list_items(responder& res);

  void get_item(responder& res, int32_t key);

  void add_item(responder& res);

  void apply_movement(responder& res);

  void history(responder& res, int32_t key);

  void status(responder& res, int32_t key);

  void alerts(responder& res);

  void predict(responder& res, int32_t key);

  void predict_all(responder& res);

private:
  /// Sends a request to the ledger actor and responds with the result as JSON
  /// object or with an error.
  template <class T, class... Ts>
  void forward(responder& res, http_status success, Ts&&... xs) {
    auto* self = res.self();
    auto prom = std::move(res).to_promise();
    self->mail(std::forward<Ts>(xs)...)
      .request(ledger_, request_timeout)
      .then(
        [this, prom, success](const T& value) mutable {
          respond_with_json(prom, success, value);
        },
        [this, prom](const caf::error& what) mutable {
          respond_with_error(prom, what);
        });
  }

  /// Reads the optional `days_lookback` query parameter.
  std::optional<int32_t> lookback_days(const responder& res);

  template <class T>
  void respond_with_json(responder::promise& prom, http_status code,
                         const T& value) {
    caf::json_writer writer;
    writer.skip_object_type_annotation(true);
    if (!writer.apply(value)) {
      respond_with_error(prom, http_status::internal_server_error,
                         "serialization_failed");
      return;
    }
    prom.respond(code, json_mime_type, writer.str());
  }

  template <class Responder>
  void respond_with_error(Responder& prom, http_status code,
                          std::string_view name) {
    std::string body = R"_({"code": ")_";
    body += name;
    body += "\"}";
    prom.respond(code, json_mime_type, body);
  }

  template <class Responder>
  void respond_with_error(Responder& prom, const caf::error& reason) {
    using namespace std::literals;
    if (reason.category() == caf::type_id_v<ec>) {
      auto code = static_cast<ec>(reason.code());
      respond_with_error(prom, status_of(code), to_string(code));
      return;
    }
    if (reason == caf::sec::request_timeout) {
      respond_with_error(prom, http_status::service_unavailable, "timeout"sv);
      return;
    }
    respond_with_error(prom, http_status::internal_server_error,
                       "internal_error"sv);
  }

  static http_status status_of(ec code);

  ledger_actor ledger_;
  int32_t default_lookback_days_;
};
