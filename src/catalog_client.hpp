#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

enum class DeclareStatus {
  ok,
  already_exists,
  invalid_metadata
};

struct DeclareResult {
  DeclareStatus status = DeclareStatus::ok;
  std::string message;
};

const char* to_string(DeclareStatus status);

// The file catalog. Outcomes the pipeline is expected to handle come back as
// a DeclareStatus; anything else (transport failures, server errors) is
// thrown and ends the calling worker.
class CatalogClient {
public:
  virtual ~CatalogClient() = default;

  virtual DeclareResult declare_file(const nlohmann::json& metadata) = 0;
  // Never reports already_exists.
  virtual DeclareResult validate_metadata(const nlohmann::json& metadata) = 0;
  virtual void add_file_location(const std::string& public_name,
                                 const std::filesystem::path& location) = 0;
};
