#pragma once

#include <optional>
#include <string>

#include "audio_types.hpp"

namespace vani::session {

/**
 * @brief Source of static audio assets for playback
 */
class AssetStore {
public:
    virtual ~AssetStore() = default;

    /// @return the asset as an encoded frame (container or raw), nullopt if unknown
    virtual std::optional<AudioFrame> load(const std::string& assetId) = 0;
};

/**
 * @brief Reads <directory>/<assetId>.wav
 *
 * Asset ids are restricted to [A-Za-z0-9_-] so they cannot escape the
 * directory.
 */
class FileAssetStore : public AssetStore {
public:
    explicit FileAssetStore(std::string directory);

    std::optional<AudioFrame> load(const std::string& assetId) override;

    static bool isValidAssetId(const std::string& assetId);
    std::string pathFor(const std::string& assetId) const;

private:
    std::string directory_;
};

} // namespace vani::session
