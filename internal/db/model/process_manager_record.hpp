#pragma once

#include <cstdint>
#include <string>

namespace outbox::db::model {

/*
  Persistent process manager row.

  IMPORTANT:
  - version is the optimistic concurrency token. Every committed
    update increments it by one; a writer holding a stale version
    gets Conflict.
*/

struct ProcessManagerRecord {
  std::string id;   // canonical UUID text
  std::string type; // ProcessManager::TypeName()
  std::string state;

  uint64_t version = 0;
};

}
