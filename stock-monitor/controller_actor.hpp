// (c) 2024, Interance GmbH & Co KG.

#pragma once

#include "ledger_actor.hpp"
#include "types.hpp"

#include <caf/fwd.hpp>
#include <caf/net/acceptor_resource.hpp>
#include <caf/net/fwd.hpp>

#include <cstddef>

/// Spawns an actor that reads one JSON movement request per line from each
/// client and answers each request with one line of JSON.
caf::actor
spawn_controller_actor(caf::actor_system& sys, ledger_actor ledger,
                       caf::net::acceptor_resource<std::byte> events);
