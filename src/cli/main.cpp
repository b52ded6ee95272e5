#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "devid/error.h"
#include "devid/orchestrator/config.h"
#include "devid/orchestrator/event_bus.h"
#include "devid/orchestrator/identity_resolver.h"
#include "devid/platform/capabilities.h"
#include "devid/platform/file_secure_store.h"
#include "devid/platform/hardware_id.h"
#include "devid/platform/secure_store.h"
#include "devid/storage/device_id_store.h"
#include "devid/storage/file_key_value_store.h"
#include "devid/storage/io_util.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;

  void PrintUsage() {
    std::cerr << "devid - device identity resolver\n";
    std::cerr << "Usage:\n";
    std::cerr << "  devid [flags] resolve                 Resolve and print the device id\n";
    std::cerr << "  devid [flags] show                    Print the stored id without creating one\n";
    std::cerr << "  devid [flags] first-launch            Print the first-launch flag\n";
    std::cerr << "  devid [flags] complete-first-launch   Clear the first-launch flag\n";
    std::cerr << "  devid [flags] reset                   Delete the id from every local backend\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --state-dir=DIR      Preferences and secure store location\n";
    std::cerr << "  --log-dir=DIR        Diagnostics log directory\n";
    std::cerr << "  --platform=NAME      auto, local, hardware or cloud (default auto)\n";
  }

  struct CliOptions {
    std::optional<std::filesystem::path> state_dir;
    std::optional<std::filesystem::path> log_dir;
    devid::platform::PlatformCapabilities capabilities = devid::platform::DetectPlatformCapabilities();
  };

  std::optional<std::string_view> FlagValue(std::string_view arg, std::string_view prefix) {
    if (arg.rfind(prefix, 0) != 0) {
      return std::nullopt;
    }
    return arg.substr(prefix.size());
  }

  std::string_view DomainPrefix(devid::ErrorDomain domain) {
    switch (domain) {
    case devid::ErrorDomain::Storage:
      return "Storage error";
    case devid::ErrorDomain::SecureStore:
      return "Secure store error";
    case devid::ErrorDomain::Remote:
      return "Remote error";
    case devid::ErrorDomain::Crypto:
      return "Crypto error";
    case devid::ErrorDomain::Validation:
      return "Validation error";
    case devid::ErrorDomain::Config:
      return "Configuration error";
    case devid::ErrorDomain::State:
      return "State error";
    case devid::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const devid::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    devid::orchestrator::Event event;
    event.category = devid::orchestrator::EventCategory::kDiagnostics;
    event.severity = devid::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), devid::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                devid::orchestrator::FieldPrivacy::kPublic, true);
    }
    devid::orchestrator::EventBus::Instance().Publish(event);
  }

  int ExitCodeFor(const devid::Error& err) {
    switch (err.domain) {
    case devid::ErrorDomain::Validation:
    case devid::ErrorDomain::Config:
      return kExitUsage;
    case devid::ErrorDomain::Storage:
    case devid::ErrorDomain::SecureStore:
    case devid::ErrorDomain::Remote:
    case devid::ErrorDomain::Crypto:
    case devid::ErrorDomain::State:
    case devid::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  // Composition root. The remote directory is supplied by the host
  // application; the CLI runs without one.
  struct Composition {
    devid::orchestrator::ResolverConfig config;
    std::shared_ptr<devid::storage::FileKeyValueStore> local_store;
    devid::orchestrator::ResolverBackends backends;
  };

  Composition Compose(const CliOptions& options) {
    Composition composition;
    composition.config = devid::orchestrator::ResolverConfig::FromEnvironment();
    if (options.state_dir) {
      composition.config.state_dir = *options.state_dir;
    }
    if (options.log_dir) {
      composition.config.log_dir = *options.log_dir;
    }
    if (composition.config.state_dir.empty()) {
      composition.config.state_dir = devid::orchestrator::DefaultStateDirectory();
    }
    if (!composition.config.log_dir.empty()) {
      devid::orchestrator::ConfigureDefaultJsonLogger(composition.config.log_dir,
                                                      composition.config.log_max_bytes);
    }

    const auto& state_dir = composition.config.state_dir;
    devid::storage::EnsurePrivateDirectory(state_dir);
    composition.local_store = std::make_shared<devid::storage::FileKeyValueStore>(state_dir / "prefs.tlv");

    auto& backends = composition.backends;
    backends.local_store = composition.local_store;
    // An unavailable store is left out; the strategies treat it as absent.
    if (options.capabilities.has_cloud_secure_store || options.capabilities.has_hardware_id) {
      backends.local_secure_store = devid::platform::SelectSecureStore(
          devid::platform::MakeKeychainSecureStore(devid::platform::SecureStoreScope::kDeviceLocal),
          std::make_shared<devid::platform::FileSecureStore>(state_dir / "secure"));
    }
    if (options.capabilities.has_cloud_secure_store) {
      // The file store is a desktop stand-in so the cloud strategy can run
      // without a keychain.
      backends.cloud_secure_store = devid::platform::SelectSecureStore(
          devid::platform::MakeKeychainSecureStore(devid::platform::SecureStoreScope::kCloudSynchronized),
          std::make_shared<devid::platform::FileSecureStore>(state_dir / "cloud", "file-cloud"));
    }
    if (options.capabilities.has_hardware_id) {
      backends.hardware_id = std::make_shared<devid::platform::MachineIdProvider>();
    }
    return composition;
  }

  void PrintIdentity(const devid::orchestrator::IdentityResolver& resolver,
                     const devid::platform::PlatformCapabilities& capabilities) {
    const auto identity = resolver.Current();
    std::cout << "device_id: " << identity.id << '\n';
    std::cout << "source: " << devid::core::ToString(identity.source) << '\n';
    std::cout << "platform: " << devid::platform::DescribeCapabilities(capabilities) << '\n';
    std::cout << "strategy: " << resolver.StrategyName() << '\n';
    std::cout << "first_launch: " << (identity.is_first_launch ? "true" : "false") << '\n';
    std::cout << "persisted: " << (identity.persisted ? "true" : "false") << '\n';
  }

  int HandleResolve(const CliOptions& options) {
    auto composition = Compose(options);
    devid::orchestrator::IdentityResolver resolver(composition.backends, options.capabilities,
                                                   composition.config);
    resolver.Initialize();
    resolver.FlushBackgroundWrites();
    PrintIdentity(resolver, options.capabilities);
    return kExitOk;
  }

  int HandleShow(const CliOptions& options) {
    auto composition = Compose(options);
    devid::storage::DeviceIdStore ids(*composition.local_store, composition.config.keys);
    auto id = ids.PeekDeviceId();
    std::cout << "device_id: " << (id ? *id : std::string("(none)")) << '\n';
    if (auto backup = ids.ReadBackupId()) {
      std::cout << "backup_id: " << *backup << '\n';
    }
    std::cout << "onboarding_complete: " << (ids.IsOnboardingComplete() ? "true" : "false") << '\n';
    return kExitOk;
  }

  int HandleFirstLaunch(const CliOptions& options) {
    auto composition = Compose(options);
    devid::orchestrator::IdentityResolver resolver(composition.backends, options.capabilities,
                                                   composition.config);
    std::cout << (resolver.IsFirstLaunch() ? "true" : "false") << '\n';
    return kExitOk;
  }

  int HandleCompleteFirstLaunch(const CliOptions& options) {
    auto composition = Compose(options);
    devid::orchestrator::IdentityResolver resolver(composition.backends, options.capabilities,
                                                   composition.config);
    if (!resolver.MarkFirstLaunchComplete()) {
      std::cerr << "Storage error: Failed to update first-launch flag." << std::endl;
      return kExitIO;
    }
    return kExitOk;
  }

  int HandleReset(const CliOptions& options) {
    auto composition = Compose(options);
    devid::orchestrator::IdentityResolver resolver(composition.backends, options.capabilities,
                                                   composition.config);
    resolver.Reset();
    std::cout << "Device identity reset.\n";
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    CliOptions options;
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (auto value = FlagValue(arg, "--state-dir=")) {
        if (value->empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.state_dir = std::filesystem::path(std::string(*value));
        continue;
      }
      if (auto value = FlagValue(arg, "--log-dir=")) {
        if (value->empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.log_dir = std::filesystem::path(std::string(*value));
        continue;
      }
      if (auto value = FlagValue(arg, "--platform=")) {
        auto parsed = devid::platform::ParsePlatformCapabilities(*value);
        if (!parsed) {
          std::cerr << "Validation error: Unknown platform '" << *value << "'." << std::endl;
          return kExitUsage;
        }
        options.capabilities = *parsed;
        continue;
      }

      PrintUsage();
      return kExitUsage;
    }

    if (argc - index != 1) {
      PrintUsage();
      return kExitUsage;
    }

    const std::string_view cmd = argv[index];
    if (cmd == "resolve") {
      return HandleResolve(options);
    }
    if (cmd == "show") {
      return HandleShow(options);
    }
    if (cmd == "first-launch") {
      return HandleFirstLaunch(options);
    }
    if (cmd == "complete-first-launch") {
      return HandleCompleteFirstLaunch(options);
    }
    if (cmd == "reset") {
      return HandleReset(options);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const devid::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
