#include "callguard/recording/segment_storage.hpp"

#include <system_error>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"
#include "callguard/utils/crypto.hpp"

namespace callguard::recording {

namespace fs = std::filesystem;

FileSegmentStorage::FileSegmentStorage(fs::path archive_dir, std::string master_secret)
    : archive_dir_(std::move(archive_dir)), master_secret_(std::move(master_secret)) {}

std::string FileSegmentStorage::put(const Recording& recording,
                                    const RecordingSegment& segment) {
    const auto relative = fs::path(recording.id) /
                          (std::to_string(segment.sequence_number) + ".seg");
    const auto target = archive_dir_ / relative;
    const auto staging = fs::path(target.string() + ".tmp");

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageUnavailable("cannot create " + target.parent_path().string() + ": " +
                                 ec.message());
    }

    utils::encrypt_file(segment.local_path, staging,
                        utils::derive_key(master_secret_, recording.encryption_key_ref));
    fs::rename(staging, target, ec);
    if (ec) {
        fs::remove(staging, ec);
        throw StorageUnavailable("cannot store segment " + target.string());
    }
    logging::debug("Segment stored",
                   {kv("recording_id", recording.id),
                    kv("sequence", segment.sequence_number),
                    kv("path", relative.string())});
    return relative.generic_string();
}

std::string FileSegmentStorage::get(const Recording& recording,
                                    const RecordingSegment& segment) {
    if (segment.storage_path.empty()) {
        throw NotFound("segment " + std::to_string(segment.sequence_number) +
                       " of recording " + recording.id + " is not stored");
    }
    const auto source = archive_dir_ / segment.storage_path;
    if (!fs::exists(source)) {
        throw NotFound("segment object missing: " + segment.storage_path);
    }
    return utils::decrypt_file(source,
                               utils::derive_key(master_secret_, recording.encryption_key_ref));
}

void FileSegmentStorage::remove(const std::string& storage_path) {
    if (storage_path.empty()) {
        return;
    }
    const auto target = archive_dir_ / storage_path;
    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        throw StorageUnavailable("cannot remove " + target.string() + ": " + ec.message());
    }
    const auto parent = target.parent_path();
    if (fs::is_directory(parent, ec) && fs::is_empty(parent, ec)) {
        fs::remove(parent, ec);
    }
}

}
