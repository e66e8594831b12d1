#include "errors.hpp"
#include "fake_services.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "single_file.hpp"
#include "transfer_worker.hpp"
#include "work_queue.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using keepup::test::FakeCatalog;
using keepup::test::FakeCopy;
using keepup::test::ScratchDir;
using keepup::test::TestCase;
using keepup::test::TestContext;
using keepup::test::fail;

namespace {

// Production semantics with test-sized timings.
PipelineOptions fast_options(const fs::path& source, const fs::path& destination) {
  using namespace std::chrono_literals;
  PipelineOptions options;
  options.source_root = source;
  options.destination = destination;
  options.max_requests_per_second = 1000.0;
  options.request_smear = 1.0;
  options.declare_idle_timeout = 300ms;
  options.transfer_idle_timeout = 600ms;
  options.declare_start_jitter = 0ms;
  options.transfer_start_delay = 0ms;
  options.metadata.overrides = {{"file_format", "artroot"}, {"data_tier", "reconstructed"}};
  options.metadata.stage_overrides = {{"reco2", {{"parents", nullptr}}}};
  options.metadata.unsupported_prefixes = {"hist"};
  return options;
}

PipelineStats run_pipeline(TestContext& ctx,
                           const PipelineOptions& options,
                           const std::shared_ptr<FakeCatalog>& catalog,
                           const std::shared_ptr<FakeCopy>& copier) {
  auto logger = std::make_shared<Logger>("pipeline");
  ctx.logs.attach(logger);
  Pipeline pipeline(options, catalog, copier, logger);
  return pipeline.run();
}

bool test_files_without_metadata_only_heartbeat(TestContext& ctx) {
  ScratchDir dir("scenario_a");
  keepup::test::write_file(dir / "src/a.root", "a");
  keepup::test::write_file(dir / "src/b.root", "b");
  keepup::test::write_file(dir / "src/c.root", "c");

  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.delete_after = true;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.discovered != 3) return fail(ctx, __LINE__);
  if(stats.skipped != 3) return fail(ctx, __LINE__);
  if(ctx.logs.count("metadata not found") != 3) return fail(ctx, __LINE__);
  if(stats.heartbeats_sent != 3) return fail(ctx, __LINE__);
  if(stats.heartbeats_received != 3) return fail(ctx, __LINE__);
  if(!copier->calls().empty()) return fail(ctx, __LINE__);
  if(catalog->declare_calls() != 0) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "src/a.root")) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "src/c.root")) return fail(ctx, __LINE__);
  return true;
}

bool test_single_file_declared_and_copied(TestContext& ctx) {
  ScratchDir dir("scenario_b");
  keepup::test::write_data_file(dir / "src/run1/reco1_x.root", "payload", {{"runs", {1}}});

  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  auto stats = run_pipeline(ctx, fast_options(dir / "src", dir / "dst"), catalog, copier);

  if(stats.declared != 1) return fail(ctx, __LINE__);
  if(stats.transferred != 1) return fail(ctx, __LINE__);
  if(stats.files_deleted != 0) return fail(ctx, __LINE__);
  if(catalog->declare_calls() != 1) return fail(ctx, __LINE__);
  if(!catalog->has("stage0_x.root")) return fail(ctx, __LINE__);
  auto calls = copier->calls();
  if(calls.size() != 1) return fail(ctx, __LINE__);
  if(calls[0].destination != fs::absolute(dir / "dst/run1/stage0_x.root")) return fail(ctx, __LINE__);
  auto locations = catalog->locations();
  if(locations.size() != 1) return fail(ctx, __LINE__);
  if(locations[0].second != fs::absolute(dir / "dst/run1")) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "src/run1/reco1_x.root")) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "src/run1/reco1_x.root.json")) return fail(ctx, __LINE__);
  return true;
}

bool test_second_run_copies_duplicate_again(TestContext& ctx) {
  ScratchDir dir("scenario_c");
  keepup::test::write_data_file(dir / "src/reco1_x.root", "payload");

  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  auto first = run_pipeline(ctx, options, catalog, copier);
  auto second = run_pipeline(ctx, options, catalog, copier);

  if(first.declared != 1) return fail(ctx, __LINE__);
  if(second.declared != 0) return fail(ctx, __LINE__);
  if(second.already_declared != 1) return fail(ctx, __LINE__);
  if(second.heartbeats_sent != 0) return fail(ctx, __LINE__);
  if(second.transferred != 1) return fail(ctx, __LINE__);
  if(catalog->declare_calls() != 2) return fail(ctx, __LINE__);
  if(copier->calls().size() != 2) return fail(ctx, __LINE__);
  if(ctx.logs.count("already declared") != 1) return fail(ctx, __LINE__);
  return true;
}

bool test_virtual_files_never_copied(TestContext& ctx) {
  ScratchDir dir("virtual");
  keepup::test::write_data_file(dir / "src/reco2_fresh.root", "v1");
  keepup::test::write_data_file(dir / "src/reco2_known.root", "v2");
  keepup::test::write_data_file(dir / "src/reco1_real.root", "r");

  auto catalog = std::make_shared<FakeCatalog>();
  catalog->preload("stage1_known.root");
  auto copier = std::make_shared<FakeCopy>();
  auto stats = run_pipeline(ctx, fast_options(dir / "src", dir / "dst"), catalog, copier);

  if(stats.declared != 2) return fail(ctx, __LINE__);
  if(stats.already_declared != 1) return fail(ctx, __LINE__);
  if(stats.virtual_files != 2) return fail(ctx, __LINE__);
  if(stats.heartbeats_sent != 2) return fail(ctx, __LINE__);
  if(copier->copied("reco2_fresh.root")) return fail(ctx, __LINE__);
  if(copier->copied("reco2_known.root")) return fail(ctx, __LINE__);
  if(!copier->copied("reco1_real.root")) return fail(ctx, __LINE__);
  if(copier->calls().size() != 1) return fail(ctx, __LINE__);
  auto md = catalog->metadata_for("stage1_fresh.root");
  if(md.at("file_size") != 0) return fail(ctx, __LINE__);
  if(md.contains("checksum")) return fail(ctx, __LINE__);
  for(const auto& location : catalog->locations()) {
    if(location.first == "stage1_fresh.root") return fail(ctx, __LINE__);
  }
  return true;
}

// A run of virtual files gives the transfer pool nothing to copy; their
// heartbeats must keep it alive for the real file declared afterwards.
bool test_virtual_run_keeps_transfer_pool_alive(TestContext& ctx) {
  using namespace std::chrono_literals;
  ScratchDir dir("virtual_run");
  for(int i = 0; i < 5; ++i) {
    keepup::test::write_data_file(dir / ("src/reco2_v" + std::to_string(i) + ".root"), "v");
  }
  keepup::test::write_data_file(dir / "src/reco1_real.root", "r");

  auto catalog = std::make_shared<FakeCatalog>();
  catalog->set_delay(150ms);
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.declare_idle_timeout = 500ms;
  options.transfer_idle_timeout = 400ms;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.declared != 6) return fail(ctx, __LINE__);
  if(stats.virtual_files != 5) return fail(ctx, __LINE__);
  if(stats.heartbeats_sent != 5) return fail(ctx, __LINE__);
  if(stats.transferred != 1) return fail(ctx, __LINE__);
  if(stats.stranded != 0) return fail(ctx, __LINE__);
  if(!copier->copied("reco1_real.root")) return fail(ctx, __LINE__);
  return true;
}

// The only transfer worker gives up while the catalog is still answering;
// the declared file must be reported rather than silently dropped.
bool test_declared_file_left_without_transfer_worker(TestContext& ctx) {
  using namespace std::chrono_literals;
  ScratchDir dir("stranded");
  keepup::test::write_data_file(dir / "src/reco1_slow.root", "s");

  auto catalog = std::make_shared<FakeCatalog>();
  catalog->set_delay(300ms);
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.transfer_idle_timeout = 50ms;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.declared != 1) return fail(ctx, __LINE__);
  if(stats.transferred != 0) return fail(ctx, __LINE__);
  if(stats.stranded != 1) return fail(ctx, __LINE__);
  if(!copier->calls().empty()) return fail(ctx, __LINE__);
  if(ctx.logs.count("declared but never transferred") != 1) return fail(ctx, __LINE__);
  if(stats.summary().find("stranded=1") == std::string::npos) return fail(ctx, __LINE__);
  return true;
}

bool test_cleanup_follows_copy_status(TestContext& ctx) {
  ScratchDir dir("cleanup");
  keepup::test::write_data_file(dir / "src/ok.root", "1");
  keepup::test::write_data_file(dir / "src/present.root", "2");
  keepup::test::write_data_file(dir / "src/failed.root", "3");

  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>(0);
  copier->set_status("present.root", 17);
  copier->set_status("failed.root", 1);
  auto options = fast_options(dir / "src", dir / "dst");
  options.delete_after = true;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.transferred != 2) return fail(ctx, __LINE__);
  if(stats.transfer_failures != 1) return fail(ctx, __LINE__);
  if(stats.files_deleted != 2) return fail(ctx, __LINE__);
  if(fs::exists(dir / "src/ok.root")) return fail(ctx, __LINE__);
  if(fs::exists(dir / "src/ok.root.json")) return fail(ctx, __LINE__);
  if(fs::exists(dir / "src/present.root")) return fail(ctx, __LINE__);
  if(fs::exists(dir / "src/present.root.json")) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "src/failed.root")) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "src/failed.root.json")) return fail(ctx, __LINE__);
  return true;
}

bool test_invalid_metadata_skipped(TestContext& ctx) {
  ScratchDir dir("invalid");
  keepup::test::write_data_file(dir / "src/good.root", "g");
  keepup::test::write_data_file(dir / "src/rejected.root", "r");
  keepup::test::write_file(dir / "src/corrupt.root", "c");
  keepup::test::write_file(dir / "src/corrupt.root.json", "{{{");

  auto catalog = std::make_shared<FakeCatalog>();
  catalog->reject("rejected.root");
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.validate = true;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.declared != 1) return fail(ctx, __LINE__);
  if(stats.skipped != 2) return fail(ctx, __LINE__);
  if(stats.heartbeats_sent != 2) return fail(ctx, __LINE__);
  if(stats.worker_failures != 0) return fail(ctx, __LINE__);
  if(copier->calls().size() != 1) return fail(ctx, __LINE__);
  if(!copier->copied("good.root")) return fail(ctx, __LINE__);
  return true;
}

bool test_excluded_files_never_enter_pipeline(TestContext& ctx) {
  ScratchDir dir("exclude");
  keepup::test::write_data_file(dir / "src/reco1_a.root", "a");
  keepup::test::write_data_file(dir / "src/Supplemental_a.root", "s");

  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  auto stats = run_pipeline(ctx, fast_options(dir / "src", dir / "dst"), catalog, copier);

  if(stats.discovered != 1) return fail(ctx, __LINE__);
  if(catalog->declare_calls() != 1) return fail(ctx, __LINE__);
  if(copier->copied("Supplemental_a.root")) return fail(ctx, __LINE__);
  return true;
}

bool test_small_batch_uses_one_worker_per_pool(TestContext& ctx) {
  ScratchDir dir("pool_small");
  for(int i = 0; i < 5; ++i) {
    keepup::test::write_data_file(dir / ("src/f" + std::to_string(i) + ".root"), "x");
  }
  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.spawn_batch_size = 10;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.declare_workers_spawned != 1) return fail(ctx, __LINE__);
  if(stats.transfer_workers_spawned != 1) return fail(ctx, __LINE__);
  if(stats.declared != 5) return fail(ctx, __LINE__);
  if(stats.transferred != 5) return fail(ctx, __LINE__);
  return true;
}

bool test_pools_grow_to_ceiling(TestContext& ctx) {
  ScratchDir dir("pool_large");
  for(int i = 0; i < 30; ++i) {
    keepup::test::write_data_file(dir / ("src/f" + std::to_string(i) + ".root"), "x");
  }
  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.spawn_batch_size = 5;
  options.max_declare_workers = 2;
  options.max_transfer_workers = 4;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.declare_workers_spawned != 2) return fail(ctx, __LINE__);
  if(stats.transfer_workers_spawned != 4) return fail(ctx, __LINE__);
  if(stats.declared != 30) return fail(ctx, __LINE__);
  if(stats.transferred != 30) return fail(ctx, __LINE__);
  if(catalog->declared_count() != 30) return fail(ctx, __LINE__);
  return true;
}

bool test_crashed_worker_is_restarted(TestContext& ctx) {
  ScratchDir dir("crash");
  keepup::test::write_data_file(dir / "src/boom.root", "b");
  keepup::test::write_data_file(dir / "src/ok1.root", "1");
  keepup::test::write_data_file(dir / "src/ok2.root", "2");

  auto catalog = std::make_shared<FakeCatalog>();
  catalog->fail_on("boom.root");
  auto copier = std::make_shared<FakeCopy>();
  auto options = fast_options(dir / "src", dir / "dst");
  options.max_worker_restarts = 1;
  auto stats = run_pipeline(ctx, options, catalog, copier);

  if(stats.worker_failures != 1) return fail(ctx, __LINE__);
  if(stats.worker_restarts != 1) return fail(ctx, __LINE__);
  if(stats.declared != 2) return fail(ctx, __LINE__);
  if(stats.transferred != 2) return fail(ctx, __LINE__);
  if(copier->copied("boom.root")) return fail(ctx, __LINE__);
  if(ctx.logs.count("terminated by unexpected error") != 1) return fail(ctx, __LINE__);
  return true;
}

bool test_crash_without_restart_degrades(TestContext& ctx) {
  ScratchDir dir("crash_no_restart");
  keepup::test::write_data_file(dir / "src/boom.root", "b");

  auto catalog = std::make_shared<FakeCatalog>();
  catalog->fail_on("boom.root");
  auto copier = std::make_shared<FakeCopy>();
  auto stats = run_pipeline(ctx, fast_options(dir / "src", dir / "dst"), catalog, copier);

  if(stats.worker_failures != 1) return fail(ctx, __LINE__);
  if(stats.worker_restarts != 0) return fail(ctx, __LINE__);
  if(stats.declared != 0) return fail(ctx, __LINE__);
  if(!copier->calls().empty()) return fail(ctx, __LINE__);
  return true;
}

bool test_heartbeats_keep_transfer_worker_alive(TestContext& ctx) {
  using namespace std::chrono_literals;
  ScratchDir dir("heartbeat");
  keepup::test::write_data_file(dir / "src/late.root", "l");

  auto copier = std::make_shared<FakeCopy>();
  TransferOptions transfer_options;
  transfer_options.destination = dir / "dst";
  transfer_options.relative_to = dir / "src";
  transfer_options.delete_after = true;
  const FileTransferer transferer(copier, transfer_options);

  WorkQueue<TransferItem> queue;
  PipelineCounters counters;
  TransferWorkerOptions worker_options;
  worker_options.idle_timeout = 300ms;
  worker_options.start_delay = 0ms;
  TransferWorker worker("transfer-1", queue, transferer, worker_options, counters, nullptr);
  std::thread runner([&]{ worker.run(); });

  // Total wait well past the idle timeout, but never a gap longer than it.
  for(int i = 0; i < 6; ++i) {
    std::this_thread::sleep_for(150ms);
    queue.push(TransferItem(Heartbeat{}));
  }
  std::this_thread::sleep_for(150ms);
  queue.push(TransferItem(FileItem::from_path(dir / "src/late.root", transfer_options.rules)));
  runner.join();

  if(counters.heartbeats_received.load() != 6) return fail(ctx, __LINE__);
  if(counters.transferred.load() != 1) return fail(ctx, __LINE__);
  if(copier->calls().size() != 1) return fail(ctx, __LINE__);
  if(counters.files_deleted.load() != 1) return fail(ctx, __LINE__);
  return true;
}

bool test_source_must_be_directory(TestContext& ctx) {
  ScratchDir dir("not_dir");
  keepup::test::write_file(dir / "plain.root", "x");
  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  Pipeline pipeline(fast_options(dir / "plain.root", dir / "dst"), catalog, copier);
  try {
    pipeline.run();
  } catch(const ConfigError& e) {
    if(std::string(e.what()).find("is not a directory") == std::string::npos) return fail(ctx, __LINE__);
    return true;
  }
  return false;
}

bool test_single_file_mode(TestContext& ctx) {
  ScratchDir dir("single");
  keepup::test::write_data_file(dir / "in/reco1_s.root", "s");
  keepup::test::write_data_file(dir / "in/reco2_v.root", "v");
  keepup::test::write_file(dir / "in/bare.root", "b");
  keepup::test::write_data_file(dir / "in/fails.root", "f");

  auto catalog = std::make_shared<FakeCatalog>();
  auto copier = std::make_shared<FakeCopy>();
  copier->set_status("fails.root", 2);
  auto logger = std::make_shared<Logger>("single");
  ctx.logs.attach(logger);

  auto options = fast_options(dir / "in/reco1_s.root", dir / "out");
  options.delete_after = true;
  if(run_single_file(options, catalog, copier, logger) != 0) return fail(ctx, __LINE__);
  if(copier->calls().size() != 1) return fail(ctx, __LINE__);
  if(copier->calls()[0].destination != fs::absolute(dir / "out/stage0_s.root")) return fail(ctx, __LINE__);
  if(fs::exists(dir / "in/reco1_s.root")) return fail(ctx, __LINE__);

  options.source_root = dir / "in/reco2_v.root";
  if(run_single_file(options, catalog, copier, logger) != 0) return fail(ctx, __LINE__);
  if(copier->calls().size() != 1) return fail(ctx, __LINE__);
  if(!catalog->has("stage1_v.root")) return fail(ctx, __LINE__);

  options.source_root = dir / "in/bare.root";
  if(run_single_file(options, catalog, copier, logger) != 1) return fail(ctx, __LINE__);

  options.source_root = dir / "in/fails.root";
  if(run_single_file(options, catalog, copier, logger) != 1) return fail(ctx, __LINE__);
  if(!fs::exists(dir / "in/fails.root")) return fail(ctx, __LINE__);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"files_without_metadata_only_heartbeat", test_files_without_metadata_only_heartbeat},
    {"single_file_declared_and_copied", test_single_file_declared_and_copied},
    {"second_run_copies_duplicate_again", test_second_run_copies_duplicate_again},
    {"virtual_files_never_copied", test_virtual_files_never_copied},
    {"virtual_run_keeps_transfer_pool_alive", test_virtual_run_keeps_transfer_pool_alive},
    {"declared_file_left_without_transfer_worker", test_declared_file_left_without_transfer_worker},
    {"cleanup_follows_copy_status", test_cleanup_follows_copy_status},
    {"invalid_metadata_skipped", test_invalid_metadata_skipped},
    {"excluded_files_never_enter_pipeline", test_excluded_files_never_enter_pipeline},
    {"small_batch_uses_one_worker_per_pool", test_small_batch_uses_one_worker_per_pool},
    {"pools_grow_to_ceiling", test_pools_grow_to_ceiling},
    {"crashed_worker_is_restarted", test_crashed_worker_is_restarted},
    {"crash_without_restart_degrades", test_crash_without_restart_degrades},
    {"heartbeats_keep_transfer_worker_alive", test_heartbeats_keep_transfer_worker_alive},
    {"source_must_be_directory", test_source_must_be_directory},
    {"single_file_mode", test_single_file_mode}
  };
  return keepup::test::run_tests("pipeline", tests, argc, argv);
}
