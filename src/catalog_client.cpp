#include "catalog_client.hpp"

const char* to_string(DeclareStatus status) {
  switch(status) {
    case DeclareStatus::ok: return "ok";
    case DeclareStatus::already_exists: return "already_exists";
    case DeclareStatus::invalid_metadata: return "invalid_metadata";
  }
  return "unknown";
}
