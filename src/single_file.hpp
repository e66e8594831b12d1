#pragma once

#include <memory>

#include "catalog_client.hpp"
#include "copy_client.hpp"
#include "log.hpp"
#include "pipeline.hpp"

// Non-recursive mode: declare options.source_root and copy it straight into
// options.destination on the calling thread. Returns the process exit code,
// 0 when the file was declared (or already known) and, unless virtual,
// copied; 1 otherwise.
int run_single_file(const PipelineOptions& options,
                    std::shared_ptr<CatalogClient> catalog,
                    std::shared_ptr<CopyClient> copier,
                    std::shared_ptr<Logger> logger = nullptr);
