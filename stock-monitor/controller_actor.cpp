// (c) 2024, Interance GmbH & Co KG.

#include "controller_actor.hpp"

#include "log.hpp"

#include <caf/actor.hpp>
#include <caf/actor_system.hpp>
#include <caf/cow_string.hpp>
#include <caf/event_based_actor.hpp>
#include <caf/flow/byte.hpp>
#include <caf/flow/string.hpp>
#include <caf/json_reader.hpp>
#include <caf/json_writer.hpp>
#include <caf/scheduled_actor/flow.hpp>
#include <caf/sec.hpp>
#include <caf/typed_actor.hpp>

#include <memory>

using namespace std::literals;

namespace {

caf::cow_string error_line(std::string_view code) {
  auto str = R"_({"error":")_"s;
  str += code;
  str += R"_("})_";
  return caf::cow_string{std::move(str)};
}

} // namespace

caf::actor
spawn_controller_actor(caf::actor_system& sys, ledger_actor ledger,
                       caf::net::acceptor_resource<std::byte> events) {
  return sys.spawn([events, ledger](caf::event_based_actor* self) mutable {
    // Stop if the ledger actor terminates.
    self->monitor(ledger, [self](const caf::error& reason) {
      log::info("controller lost the ledger actor: {}", reason);
      self->quit(reason);
    });
    // For each buffer pair, we create a new flow ...
    events.observe_on(self).for_each([self, ledger](auto ev) {
      log::info("controller added a new client");
      auto [pull, push] = ev.data();
      pull
        .observe_on(self)
        // ... that converts the lines to movement requests ...
        .transform(caf::flow::byte::split_as_utf8_at('\n'))
        .map([](const caf::cow_string& line) {
          log::debug("controller received line: {}", line.str());
          caf::json_reader reader;
          if (!reader.load(line.str())) {
            log::error("controller failed to parse JSON: {}",
                       reader.get_error());
            return std::shared_ptr<movement_request>{}; // Invalid JSON.
          }
          auto ptr = std::make_shared<movement_request>();
          if (!reader.apply(*ptr))
            return std::shared_ptr<movement_request>{}; // Not a request.
          return ptr;
        })
        .concat_map([self, ledger](std::shared_ptr<movement_request> ptr) {
          // If the `map` step failed, inject an error message.
          if (ptr == nullptr) {
            return self->make_observable()
              .just(error_line("invalid command"))
              .as_observable();
          }
          // Send the request to the ledger actor and convert the result
          // message into an observable.
          return self->mail(apply_atom_v, *ptr)
            .request(ledger, 1s)
            .as_observable()
            .map([ptr](const movement& res) {
              log::debug("controller applied movement {} to item {}", res.id,
                         ptr->item_id);
              caf::json_writer writer;
              writer.skip_object_type_annotation(true);
              if (!writer.apply(res))
                return error_line("serialization_failed");
              auto str = R"_({"result":)_"s;
              str += writer.str();
              str += '}';
              return caf::cow_string{std::move(str)};
            })
            .on_error_return([ptr](const caf::error& what) {
              log::debug("controller received an error for item {} -> {}",
                         ptr->item_id, what);
              auto code = "internal_error"s;
              if (what.category() == caf::type_id_v<ec>)
                code = to_string(static_cast<ec>(what.code()));
              else if (what == caf::sec::request_timeout)
                code = "timeout";
              return caf::expected<caf::cow_string>{error_line(code)};
            })
            .as_observable();
        })
        // ... disconnects if the client is too slow ...
        .on_backpressure_buffer(32)
        // ... and pushes the results back to the client as bytes.
        .transform(caf::flow::string::to_chars("\n"))
        .do_finally([] { log::info("controller lost connection to a client"); })
        .map([](char ch) { return static_cast<std::byte>(ch); })
        .subscribe(push);
    });
  });
}
