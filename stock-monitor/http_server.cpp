// (c) 2024, Interance GmbH & Co KG.

#include "http_server.hpp"

#include "log.hpp"

#include <caf/json_reader.hpp>
#include <caf/net/actor_shell.hpp>
#include <caf/net/http/request_header.hpp>
#include <caf/uri.hpp>

#include <charconv>

using namespace std::literals;

namespace {

/// Parses the payload of a request as JSON object.
template <class T>
bool read_payload(caf::net::http::responder& res, T& x) {
  auto payload = res.payload();
  if (!caf::is_valid_utf8(payload))
    return false;
  caf::json_reader reader;
  if (!reader.load(caf::to_string_view(payload)) || !reader.apply(x)) {
    log::debug("rejected payload: {}", reader.get_error());
    return false;
  }
  return true;
}

std::optional<std::string> query_param(const caf::net::http::responder& res,
                                       std::string_view key) {
  const auto& query = res.header().query();
  if (auto i = query.find(std::string{key}); i != query.end())
    return i->second;
  return std::nullopt;
}

} // namespace

void http_server::list_items(responder& res) {
  forward<std::vector<item>>(res, http_status::ok, caf::get_atom_v);
}

void http_server::get_item(responder& res, int32_t key) {
  forward<item>(res, http_status::ok, caf::get_atom_v, key);
}

void http_server::add_item(responder& res) {
  item new_item;
  if (!read_payload(res, new_item)) {
    respond_with_error(res, http_status::bad_request, "invalid_payload"sv);
    return;
  }
  forward<item>(res, http_status::created, caf::add_atom_v,
                std::move(new_item));
}

void http_server::apply_movement(responder& res) {
  movement_request req;
  if (!read_payload(res, req)) {
    respond_with_error(res, http_status::bad_request, "invalid_payload"sv);
    return;
  }
  forward<movement>(res, http_status::created, apply_atom_v, std::move(req));
}

void http_server::history(responder& res, int32_t key) {
  forward<std::vector<movement>>(res, http_status::ok, history_atom_v, key);
}

void http_server::status(responder& res, int32_t key) {
  auto* self = res.self();
  auto prom = std::move(res).to_promise();
  self->mail(status_atom_v, key)
    .request(ledger_, request_timeout)
    .then(
      [prom](stock_status value) mutable {
        auto body = R"_({"status": ")_"s;
        body += to_string(value);
        body += "\"}";
        prom.respond(http_status::ok, json_mime_type, body);
      },
      [this, prom](const caf::error& what) mutable {
        respond_with_error(prom, what);
      });
}

void http_server::alerts(responder& res) {
  alert_filter filter;
  if (auto str = query_param(res, "status")) {
    stock_status value;
    if (!from_string(*str, value)) {
      respond_with_error(res, http_status::bad_request, "invalid_status"sv);
      return;
    }
    filter.status = value;
  }
  filter.supplier = query_param(res, "supplier");
  filter.warehouse = query_param(res, "warehouse");
  forward<std::vector<stock_alert>>(res, http_status::ok, alerts_atom_v,
                                    std::move(filter));
}

void http_server::predict(responder& res, int32_t key) {
  auto days = lookback_days(res);
  if (!days) {
    respond_with_error(res, http_status::bad_request, "invalid_argument"sv);
    return;
  }
  forward<shortage_prediction>(res, http_status::ok, predict_atom_v, key,
                               *days);
}

void http_server::predict_all(responder& res) {
  auto days = lookback_days(res);
  if (!days) {
    respond_with_error(res, http_status::bad_request, "invalid_argument"sv);
    return;
  }
  forward<std::vector<shortage_prediction>>(res, http_status::ok,
                                            predict_all_atom_v, *days);
}

std::optional<int32_t> http_server::lookback_days(const responder& res) {
  auto str = query_param(res, "days_lookback");
  if (!str)
    return default_lookback_days_;
  int32_t result = 0;
  auto* first = str->data();
  auto* last = first + str->size();
  auto [ptr, err] = std::from_chars(first, last, result);
  if (err != std::errc{} || ptr != last)
    return std::nullopt;
  return result;
}

http_server::http_status http_server::status_of(ec code) {
  switch (code) {
    case ec::no_such_item:
      return http_status::not_found;
    case ec::key_already_exists:
    case ec::insufficient_stock:
      return http_status::conflict;
    case ec::invalid_quantity:
    case ec::invalid_argument:
      return http_status::bad_request;
    case ec::storage_unavailable:
      return http_status::service_unavailable;
    default:
      return http_status::internal_server_error;
  }
}
