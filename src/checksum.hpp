#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct FileChecksums {
  uint32_t enstore = 0;   // adler32 seeded with 0 instead of 1
  uint32_t adler32 = 1;
  std::string md5;        // lowercase hex
  uint64_t bytes = 0;

  // Catalog form: {"enstore:<dec>", "adler32:<hex8>", "md5:<hex32>"}
  std::vector<std::string> as_catalog_strings() const;
};

// Reads the file once and feeds every digest. Throws SourceFileMissingError
// if the file cannot be opened.
FileChecksums compute_file_checksums(const std::filesystem::path& path);
