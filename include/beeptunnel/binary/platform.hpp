#pragma once

#include <string>
#include <string_view>

namespace beeptunnel::binary {

inline constexpr const char *BINARY_BASE_NAME = "frpc";

enum class OsFamily { Windows, Linux, Darwin, Unknown };
enum class CpuArch { Amd64, X86, Arm64, Arm, Unknown };

[[nodiscard]] std::string_view os_name(OsFamily os);
[[nodiscard]] std::string_view arch_name(CpuArch arch);

/// `{os}_{arch}`; unknown OS maps to linux, unknown CPU to amd64.
[[nodiscard]] std::string platform_id(OsFamily os, CpuArch arch);

/// Maps a `uname -m` style machine string to a CPU family.
[[nodiscard]] CpuArch parse_machine(const std::string &machine);

[[nodiscard]] OsFamily current_os();
[[nodiscard]] CpuArch current_arch();
[[nodiscard]] std::string current_platform();

[[nodiscard]] bool is_windows_platform(const std::string &platform);
[[nodiscard]] std::string binary_file_name(const std::string &platform);
[[nodiscard]] std::string info_file_name(const std::string &platform);

} // namespace beeptunnel::binary
