#pragma once

#include <stdexcept>
#include <string>

// Sidecar metadata file for a data file does not exist.
class MetadataNotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Sidecar exists but is not a JSON object.
class InvalidMetadataError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The data file itself vanished (or was never a regular file) before it
// could be declared.
class SourceFileMissingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// File name matches a prefix we refuse to generate metadata for.
class UnsupportedFileError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CatalogError : public std::runtime_error {
public:
  CatalogError(const std::string& what, int http_status = 0)
    : std::runtime_error(what), http_status_(http_status) {}

  int http_status() const { return http_status_; }

private:
  int http_status_;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
