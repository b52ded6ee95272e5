#include "devid/platform/hardware_id.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <string_view>

#include "devid/common.h"
#include "devid/crypto/sha256.h"

namespace devid::platform {
namespace {

std::string Trim(std::string value) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

std::optional<std::string> ReadFirstLine(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::string line;
  std::getline(in, line);
  line = Trim(std::move(line));
  if (line.empty()) {
    return std::nullopt;
  }
  return line;
}

}  // namespace

MachineIdProvider::MachineIdProvider()
    : MachineIdProvider({"/etc/machine-id", "/var/lib/dbus/machine-id",
                         "/sys/class/dmi/id/product_uuid"}) {}

MachineIdProvider::MachineIdProvider(std::vector<std::filesystem::path> candidates,
                                     std::string app_label)
    : candidates_(std::move(candidates)), app_label_(std::move(app_label)) {}

std::optional<std::string> MachineIdProvider::GetId() noexcept {
  try {
    for (const auto& candidate : candidates_) {
      auto value = ReadFirstLine(candidate);
      if (!value) {
        continue;
      }
      std::string material = app_label_;
      material.push_back('\0');
      material.append(*value);
      return devid::HexEncode(devid::crypto::Sha256(material));
    }
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"hardware_id_error\",\"message\":\"" << ex.what() << "\"}" << std::endl;
  }
  return std::nullopt;
}

std::optional<std::string> StaticHardwareIdProvider::GetId() noexcept {
  if (!value_ || value_->empty()) {
    return std::nullopt;
  }
  return value_;
}

}  // namespace devid::platform
