#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "devid/error.h"
#include "devid/orchestrator/event_bus.h"
#include "devid/orchestrator/identity_resolver.h"
#include "devid/platform/hardware_id.h"
#include "devid/platform/secure_store.h"
#include "devid/remote/identity_directory.h"
#include "devid/storage/key_value_store.h"

// In-memory backends with failure injection and call counting, shared by
// the resolver tests.
namespace devid::testing {

  inline void Expect(bool condition, std::string_view message) {
    if (!condition) {
      std::cerr << "FAILED: " << message << std::endl;
      std::abort();
    }
  }

  class TempDir {
  public:
    explicit TempDir(std::string_view prefix) {
      auto base = std::filesystem::temp_directory_path();
      auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
      path_ = base / (std::string(prefix) + std::to_string(static_cast<unsigned long long>(stamp)));
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_{};
  };

  class MemoryKeyValueStore final : public storage::KeyValueStore {
  public:
    std::optional<std::string> GetString(std::string_view key) const override {
      std::lock_guard<std::mutex> lock(mutex_);
      ThrowIfReadsFail();
      auto it = strings_.find(std::string(key));
      if (it == strings_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    void SetString(std::string_view key, std::string_view value) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ThrowIfWritesFail();
      strings_[std::string(key)] = std::string(value);
    }

    std::optional<bool> GetBool(std::string_view key) const override {
      std::lock_guard<std::mutex> lock(mutex_);
      ThrowIfReadsFail();
      auto it = bools_.find(std::string(key));
      if (it == bools_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    void SetBool(std::string_view key, bool value) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ThrowIfWritesFail();
      bools_[std::string(key)] = value;
    }

    void Remove(std::string_view key) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ThrowIfWritesFail();
      strings_.erase(std::string(key));
      bools_.erase(std::string(key));
    }

    // Direct access that bypasses failure injection.
    std::optional<std::string> Raw(const std::string& key) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = strings_.find(key);
      if (it == strings_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    void Seed(const std::string& key, const std::string& value) {
      std::lock_guard<std::mutex> lock(mutex_);
      strings_[key] = value;
    }

    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};

  private:
    void ThrowIfReadsFail() const {
      if (fail_reads.load()) {
        throw Error(ErrorDomain::Storage, errors::storage::kBackendUnavailable, "injected read failure");
      }
    }

    void ThrowIfWritesFail() const {
      if (fail_writes.load()) {
        throw Error(ErrorDomain::Storage, errors::storage::kPersistenceFailure, "injected write failure");
      }
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> strings_;
    std::map<std::string, bool> bools_;
  };

  class FakeSecureStore final : public platform::SecureStore {
  public:
    explicit FakeSecureStore(std::string id = "fake") : id_(std::move(id)) {}

    std::string_view Id() const noexcept override { return id_; }
    bool IsAvailable() const noexcept override { return true; }

    std::optional<std::string> Read(std::string_view ns, std::string_view key) override {
      ++reads;
      if (fail_reads.load()) {
        throw Error(ErrorDomain::SecureStore, errors::secure_store::kBackendUnavailable, "injected read failure");
      }
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = items_.find(Slot(ns, key));
      if (it == items_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    void Write(std::string_view ns, std::string_view key, std::string_view value) override {
      ++writes;
      if (fail_writes.load()) {
        throw Error(ErrorDomain::SecureStore, errors::secure_store::kPersistenceFailure, "injected write failure");
      }
      std::lock_guard<std::mutex> lock(mutex_);
      items_[Slot(ns, key)] = std::string(value);
    }

    void Delete(std::string_view ns, std::string_view key) override {
      if (fail_writes.load()) {
        throw Error(ErrorDomain::SecureStore, errors::secure_store::kPersistenceFailure, "injected delete failure");
      }
      std::lock_guard<std::mutex> lock(mutex_);
      items_.erase(Slot(ns, key));
    }

    std::optional<std::string> Get(std::string_view ns) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = items_.find(Slot(ns, platform::kDeviceIdItemKey));
      if (it == items_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    void Put(std::string_view ns, const std::string& value) {
      std::lock_guard<std::mutex> lock(mutex_);
      items_[Slot(ns, platform::kDeviceIdItemKey)] = value;
    }

    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};
    std::atomic<int> reads{0};
    std::atomic<int> writes{0};

  private:
    static std::string Slot(std::string_view ns, std::string_view key) {
      return std::string(ns) + '/' + std::string(key);
    }

    std::string id_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> items_;
  };

  class FakeDirectory final : public remote::RemoteIdentityDirectory {
  public:
    std::optional<remote::UserRecord> GetUser(const std::string& id) override {
      ++get_calls;
      Pause();
      ThrowIfUnavailable();
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = records_.find(id);
      if (it == records_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    std::optional<remote::UserRecord> FindByHardwareId(const std::string& hardware_id) override {
      ++find_calls;
      Pause();
      ThrowIfUnavailable();
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& [id, record] : records_) {
        if (record.hardware_id && *record.hardware_id == hardware_id) {
          return record;
        }
      }
      return std::nullopt;
    }

    void UpsertHardwareId(const std::string& id, const std::string& hardware_id) override {
      ++upsert_calls;
      Pause();
      ThrowIfUnavailable();
      std::lock_guard<std::mutex> lock(mutex_);
      auto& record = records_[id];
      record.id = id;
      record.hardware_id = hardware_id;
    }

    void AddRecord(const std::string& id, std::optional<std::string> hardware_id) {
      std::lock_guard<std::mutex> lock(mutex_);
      records_[id] = remote::UserRecord{id, std::move(hardware_id)};
    }

    std::optional<remote::UserRecord> Record(const std::string& id) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = records_.find(id);
      if (it == records_.end()) {
        return std::nullopt;
      }
      return it->second;
    }

    std::size_t RecordCount() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return records_.size();
    }

    std::atomic<bool> unavailable{false};
    std::atomic<int> delay_ms{0};
    std::atomic<int> get_calls{0};
    std::atomic<int> find_calls{0};
    std::atomic<int> upsert_calls{0};

  private:
    void Pause() const {
      const int delay = delay_ms.load();
      if (delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
      }
    }

    void ThrowIfUnavailable() const {
      if (unavailable.load()) {
        throw Error(ErrorDomain::Remote, errors::remote::kBackendUnavailable, "injected network failure",
                    std::nullopt, Retryability::kTransient);
      }
    }

    mutable std::mutex mutex_;
    std::map<std::string, remote::UserRecord> records_;
  };

  // Collects event ids published while alive.
  class EventRecorder {
  public:
    EventRecorder() {
      id_ = orchestrator::EventBus::Instance().Subscribe([this](const orchestrator::Event& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
      });
    }

    ~EventRecorder() { orchestrator::EventBus::Instance().Unsubscribe(id_); }

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    int Count(std::string_view event_id) const {
      std::lock_guard<std::mutex> lock(mutex_);
      int count = 0;
      for (const auto& event : events_) {
        if (event.event_id == event_id) {
          ++count;
        }
      }
      return count;
    }

    std::vector<orchestrator::Event> Events() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return events_;
    }

  private:
    orchestrator::EventBus::SubscriptionId id_{0};
    mutable std::mutex mutex_;
    std::vector<orchestrator::Event> events_;
  };

  // One set of fakes wired the way a host application composes the resolver.
  struct ResolverRig {
    std::shared_ptr<MemoryKeyValueStore> kv = std::make_shared<MemoryKeyValueStore>();
    std::shared_ptr<FakeSecureStore> device = std::make_shared<FakeSecureStore>("device");
    std::shared_ptr<FakeSecureStore> cloud = std::make_shared<FakeSecureStore>("cloud");
    std::shared_ptr<FakeDirectory> directory = std::make_shared<FakeDirectory>();
    std::optional<std::string> hardware_id;

    orchestrator::ResolverBackends Backends() const {
      orchestrator::ResolverBackends backends;
      backends.local_store = kv;
      backends.local_secure_store = device;
      backends.cloud_secure_store = cloud;
      backends.hardware_id = std::make_shared<platform::StaticHardwareIdProvider>(hardware_id);
      backends.directory = directory;
      return backends;
    }

    std::unique_ptr<orchestrator::IdentityResolver> Cloud(orchestrator::ResolverConfig config = {}) const {
      return std::make_unique<orchestrator::IdentityResolver>(Backends(), platform::PlatformCapabilities{false, true},
                                                              std::move(config));
    }

    std::unique_ptr<orchestrator::IdentityResolver> Hardware(orchestrator::ResolverConfig config = {}) const {
      return std::make_unique<orchestrator::IdentityResolver>(Backends(), platform::PlatformCapabilities{true, false},
                                                              std::move(config));
    }

    std::unique_ptr<orchestrator::IdentityResolver> LocalOnly(orchestrator::ResolverConfig config = {}) const {
      return std::make_unique<orchestrator::IdentityResolver>(Backends(), platform::PlatformCapabilities{},
                                                              std::move(config));
    }

    std::optional<std::string> LocalId() const { return kv->Raw("devid.device_id"); }
    std::optional<std::string> BackupId() const { return kv->Raw("devid.backup_id"); }
  };

  // Keeps test diagnostics out of the working directory.
  inline void RouteLogsTo(const std::filesystem::path& dir) {
    orchestrator::ConfigureDefaultJsonLogger(dir);
  }

} // namespace devid::testing
