#pragma once

#include <span>
#include <string_view>

namespace stratify {

inline constexpr std::string_view WRAPPER_SCRIPT = "mvnw";
inline constexpr std::string_view WRAPPER_BATCH_SCRIPT = "mvnw.cmd";
inline constexpr std::string_view WRAPPER_DIRECTORY = ".mvn/wrapper";
inline constexpr std::string_view WRAPPER_PROPERTIES = ".mvn/wrapper/maven-wrapper.properties";

// A file the build wrapper consists of, relative to the module root
struct WrapperAsset {
    std::string_view relative_path;
    std::string_view content;
    bool executable = false;
};

// Embedded templates, in installation order
auto wrapper_assets() -> std::span<const WrapperAsset>;

} // namespace stratify
