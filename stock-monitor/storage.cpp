// (c) 2024, Interance GmbH & Co KG.

#include "storage.hpp"

storage::~storage() {
  // nop
}
