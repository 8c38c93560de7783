#pragma once

#include <filesystem>
#include <string>

#include "callguard/model/types.hpp"

namespace callguard::recording {

// Durable home of finalized segments.
class SegmentStorage {
public:
    virtual ~SegmentStorage() = default;

    // Uploads segment.local_path and returns the storage path.
    virtual std::string put(const Recording& recording, const RecordingSegment& segment) = 0;
    // Returns the plaintext media of a stored segment.
    virtual std::string get(const Recording& recording, const RecordingSegment& segment) = 0;
    virtual void remove(const std::string& storage_path) = 0;
};

// Stores segments under archive_dir encrypted with AES-256-GCM; the data key
// is derived from the master secret and the recording's key reference.
class FileSegmentStorage : public SegmentStorage {
public:
    FileSegmentStorage(std::filesystem::path archive_dir, std::string master_secret);

    std::string put(const Recording& recording, const RecordingSegment& segment) override;
    std::string get(const Recording& recording, const RecordingSegment& segment) override;
    void remove(const std::string& storage_path) override;

private:
    std::filesystem::path archive_dir_;
    std::string master_secret_;
};

}
