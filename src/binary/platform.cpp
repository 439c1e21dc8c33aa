#include "beeptunnel/binary/platform.hpp"

#include "beeptunnel/common/fs.hpp"

#ifndef _WIN32
#include <sys/utsname.h>
#endif

namespace beeptunnel::binary {

std::string_view os_name(const OsFamily os) {
  switch (os) {
  case OsFamily::Windows:
    return "windows";
  case OsFamily::Darwin:
    return "darwin";
  case OsFamily::Linux:
  case OsFamily::Unknown:
    break;
  }
  return "linux";
}

std::string_view arch_name(const CpuArch arch) {
  switch (arch) {
  case CpuArch::X86:
    return "386";
  case CpuArch::Arm64:
    return "arm64";
  case CpuArch::Arm:
    return "arm";
  case CpuArch::Amd64:
  case CpuArch::Unknown:
    break;
  }
  return "amd64";
}

std::string platform_id(const OsFamily os, const CpuArch arch) {
  return std::string(os_name(os)) + "_" + std::string(arch_name(arch));
}

CpuArch parse_machine(const std::string &machine) {
  const std::string m = common::to_lower(common::trim(machine));
  if (m == "x86_64" || m == "amd64" || m == "x64") {
    return CpuArch::Amd64;
  }
  if (m == "i386" || m == "i486" || m == "i586" || m == "i686" || m == "x86") {
    return CpuArch::X86;
  }
  if (m == "aarch64" || m == "arm64" || common::starts_with(m, "armv8")) {
    return CpuArch::Arm64;
  }
  if (common::starts_with(m, "arm")) {
    return CpuArch::Arm;
  }
  return CpuArch::Unknown;
}

OsFamily current_os() {
#if defined(_WIN32)
  return OsFamily::Windows;
#elif defined(__APPLE__)
  return OsFamily::Darwin;
#elif defined(__linux__)
  return OsFamily::Linux;
#else
  return OsFamily::Unknown;
#endif
}

CpuArch current_arch() {
#ifndef _WIN32
  struct utsname info {};
  if (uname(&info) == 0) {
    if (const auto arch = parse_machine(info.machine); arch != CpuArch::Unknown) {
      return arch;
    }
  }
#endif
#if defined(__x86_64__) || defined(_M_X64)
  return CpuArch::Amd64;
#elif defined(__i386__) || defined(_M_IX86)
  return CpuArch::X86;
#elif defined(__aarch64__) || defined(_M_ARM64)
  return CpuArch::Arm64;
#elif defined(__arm__) || defined(_M_ARM)
  return CpuArch::Arm;
#else
  return CpuArch::Unknown;
#endif
}

std::string current_platform() { return platform_id(current_os(), current_arch()); }

bool is_windows_platform(const std::string &platform) {
  return common::starts_with(platform, "windows_");
}

std::string binary_file_name(const std::string &platform) {
  std::string name = std::string(BINARY_BASE_NAME) + "_" + platform;
  if (is_windows_platform(platform)) {
    name += ".exe";
  }
  return name;
}

std::string info_file_name(const std::string &platform) {
  return std::string(BINARY_BASE_NAME) + "_" + platform + "_info.json";
}

} // namespace beeptunnel::binary
