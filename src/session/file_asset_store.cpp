#include "session/asset_store.hpp"
#include "core/audio/wav_container.hpp"
#include "system/logger.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

namespace vani::session {

FileAssetStore::FileAssetStore(std::string directory) : directory_(std::move(directory)) {
    while (directory_.size() > 1 && directory_.back() == '/') {
        directory_.pop_back();
    }
}

bool FileAssetStore::isValidAssetId(const std::string& assetId) {
    if (assetId.empty() || assetId.size() > 128) {
        return false;
    }
    for (char c : assetId) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

std::string FileAssetStore::pathFor(const std::string& assetId) const {
    return directory_ + "/" + assetId + ".wav";
}

std::optional<AudioFrame> FileAssetStore::load(const std::string& assetId) {
    if (!isValidAssetId(assetId)) {
        Logger::warning("FileAssetStore: rejected asset id '{}'", assetId);
        return std::nullopt;
    }

    std::string path = pathFor(assetId);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        Logger::warning("FileAssetStore: asset {} not found at {}", assetId, path);
        return std::nullopt;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto info = core::audio::parseWavContainer(bytes);
    if (!info) {
        Logger::warning("FileAssetStore: {} is not a WAV file", path);
        return std::nullopt;
    }

    AudioFormat format{AudioEncoding::WAV, info->sampleRate, info->channels};
    Logger::debug("FileAssetStore: loaded {} ({} bytes, {} Hz)", assetId, bytes.size(), info->sampleRate);
    return AudioFrame(std::move(bytes), format);
}

} // namespace vani::session
