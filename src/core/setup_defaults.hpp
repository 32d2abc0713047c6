#ifndef CORE_SETUP_DEFAULTS_HPP
#define CORE_SETUP_DEFAULTS_HPP

#include <array>
#include <cstddef>

namespace defaults {
inline constexpr const char* kConfigFilePath = "/config/config.yaml";
inline constexpr const char* kDataRoot = "/data";
inline constexpr const char* kFactoryTeddyCloudUrl = "http://docker";

inline constexpr const char* kPrimaryEndpoint = "/api/toniesCustomJson";
inline constexpr const char* kBoxesEndpoint = "/api/tonieboxes";
inline constexpr int kStatusProbeTimeoutSeconds = 5;
inline constexpr int kTestProbeTimeoutSeconds = 10;
inline constexpr std::size_t kErrorBodyExcerptLength = 100;
inline constexpr const char* kUnknownBoxName = "Unknown";

// Layout expected under the data root.
inline constexpr const char* kConfigSubdir = "config";
inline constexpr const char* kLibrarySubdir = "library";
inline constexpr const char* kCatalogFile = "tonies.custom.json";
inline constexpr const char* kTafExtension = ".taf";
inline constexpr std::array<const char*, 2> kImageDirCandidates = {"library/own/pics", "www/custom_img"};

// remote:
inline constexpr const char* kApiBase = "/api";
inline constexpr int kRemoteTimeoutSeconds = 30;

// volumes:
inline constexpr const char* kVolumeConfigPath = "/data/config";
inline constexpr const char* kVolumeLibraryPath = "/data/library";

// app:
inline constexpr bool kConfirmBeforeSave = true;
inline constexpr bool kAutoReloadConfig = true;
inline constexpr int kMaxImageSizeMb = 5;
inline constexpr std::array<const char*, 4> kAllowedImageFormats = {"jpg", "jpeg", "png", "webp"};
inline constexpr bool kShowHiddenFiles = false;
inline constexpr bool kRecursiveScan = true;

// advanced:
inline constexpr bool kParseCoverFromTaf = true;
inline constexpr bool kExtractTrackNames = true;
inline constexpr const char* kLogLevel = "INFO";
inline constexpr bool kCacheTafMetadata = true;
inline constexpr int kCacheTtlSeconds = 300;

inline constexpr const char* kSaveSuccessMessage = "Configuration saved. Please restart the application.";
}  // namespace defaults

#endif
