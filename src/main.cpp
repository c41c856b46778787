#include "app/Config.hpp"
#include "app/DevicePoller.hpp"
#include "app/DeviceRegistry.hpp"
#include "app/PolicyEvaluator.hpp"
#include "app/TransferLog.hpp"
#include "app/TransferMonitor.hpp"
#include "collectors/SysfsDeviceDetector.hpp"
#include "collectors/UeventMonitor.hpp"
#include "util/Logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace usbtrail;

static std::atomic<bool> g_stop{false};

static void on_signal(int){ g_stop.store(true); }

static void print_usage() {
  std::cout <<
    "Usage: usbtrail [OPTIONS]\n"
    "  -c, --config FILE      configuration file\n"
    "  -l, --log-dir DIR      override general.log_directory\n"
    "  -p, --poll             force polling device detection\n"
    "  -v, --verbose          debug-level application logging\n"
    "      --list-devices     print currently detected removable devices and exit\n"
    "      --verify FILE      verify a log file against its digest and exit\n"
    "      --write-config     write the effective configuration to the config path and exit\n"
    "  -h, --help\n";
}

static int list_devices(util::Logger& log) {
  collectors::SysfsDeviceDetector detector;
  std::vector<model::Device> devices;
  if (!detector.detect(devices)) {
    log.error("device detection failed");
    return 1;
  }
  if (devices.empty()) {
    std::cout << "No removable storage devices mounted\n";
    return 0;
  }
  for (const auto& d : devices) {
    std::cout << d.device_id << "\n"
              << "  name:   " << d.name << "\n"
              << "  mount:  " << d.mount_point << "\n"
              << "  node:   " << d.dev_node << " (" << (d.fstype.empty() ? "?" : d.fstype) << ")\n"
              << "  vendor: " << d.vendor.value_or("Unknown") << "\n";
    if (d.serial) std::cout << "  serial: " << *d.serial << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string log_dir_override;
  std::string verify_file;
  bool force_poll = false;
  bool verbose = false;
  bool want_list = false;
  bool want_write_config = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-c" || a == "--config") && i + 1 < argc) config_path = argv[++i];
    else if ((a == "-l" || a == "--log-dir") && i + 1 < argc) log_dir_override = argv[++i];
    else if (a == "-p" || a == "--poll") force_poll = true;
    else if (a == "-v" || a == "--verbose") verbose = true;
    else if (a == "--list-devices") want_list = true;
    else if (a == "--verify" && i + 1 < argc) verify_file = argv[++i];
    else if (a == "--write-config") want_write_config = true;
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::fprintf(stderr, "usbtrail: unknown or incomplete option '%s'\n", a.c_str());
      print_usage();
      return 2;
    }
  }

  // stderr only until the log directory is known
  util::StreamLogger boot_log(verbose ? util::LogLevel::Debug : util::LogLevel::Info);
  if (config_path.empty()) config_path = app::config_file_path();
  bool found = false;
  model::Settings settings = app::load_settings(config_path, boot_log, &found);
  if (!log_dir_override.empty()) settings.general.log_directory = log_dir_override;
  if (force_poll) settings.detect_mode = model::DetectMode::Poll;

  if (want_write_config) {
    if (config_path.empty()) {
      boot_log.error("no configuration path (set HOME or pass --config)");
      return 1;
    }
    if (!app::save_settings(settings, config_path)) {
      boot_log.logf(util::LogLevel::Error, "cannot write %s", config_path.c_str());
      return 1;
    }
    std::cout << "Wrote " << config_path << "\n";
    return 0;
  }
  if (!verify_file.empty()) {
    auto r = app::verify_log_integrity(verify_file, settings.security.hash_algorithm);
    std::cout << verify_file << ": " << app::to_string(r.status) << " (" << r.message << ")\n";
    return r.status == app::IntegrityStatus::Verified ? 0 : 1;
  }
  if (want_list) return list_devices(boot_log);

  util::StreamLogger log(verbose ? util::LogLevel::Debug : util::LogLevel::Info, settings.general.log_directory);
  if (!found) log.logf(util::LogLevel::Info, "no configuration at %s; using defaults",
                       config_path.empty() ? "(none)" : config_path.c_str());
  if (settings.security.encrypt_logs) log.warn("security.encrypt_logs is set but log encryption is not supported");

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  app::TransferLogOptions tlo;
  tlo.directory = settings.general.log_directory;
  tlo.hash_algorithm = settings.security.hash_algorithm;
  tlo.retention_days = settings.security.log_retention_days;
  app::TransferLog transfers(tlo, log);
  if (!transfers.open()) return 1;

  app::PolicyEvaluator policy(settings);
  app::DeviceRegistry registry(log);
  app::TransferMonitor monitor(registry, policy, transfers, log);
  monitor.attach();

  collectors::SysfsDeviceDetector detector;
  std::unique_ptr<collectors::IHotplugSource> hotplug;
  if (settings.detect_mode != model::DetectMode::Poll) hotplug = std::make_unique<collectors::UeventMonitor>();
  app::PollerOptions po;
  po.poll_interval = std::chrono::seconds(settings.monitoring.check_interval_seconds);
  app::DevicePoller poller(registry, detector, std::move(hotplug), log, po);
  poller.start();
  if (settings.detect_mode == model::DetectMode::Uevent && poller.mode() != app::DevicePoller::Mode::Native)
    log.warn("uevent detection requested but unavailable; polling instead");

  log.logf(util::LogLevel::Info, "usbtrail running: %zu device(s), logs in %s", registry.size(),
           settings.general.log_directory.c_str());
  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  log.info("shutting down");
  bool clean = poller.stop();
  clean = monitor.shutdown() && clean;
  if (!clean) {
    // Detached workers still reference the registry, sink and logger below
    log.warn("some workers did not stop in time; exiting without cleanup");
    std::fflush(stdout);
    std::_Exit(0);
  }
  return 0;
}
