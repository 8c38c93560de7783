#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "callguard/events/event_stream.hpp"
#include "callguard/model/types.hpp"
#include "callguard/recording/segment_storage.hpp"
#include "callguard/recording/upload_pool.hpp"
#include "callguard/settings/settings.hpp"
#include "callguard/storage/store.hpp"
#include "callguard/utils/clock.hpp"
#include "callguard/utils/keyed_mutex.hpp"

namespace callguard::recording {

struct RecordingView {
    Recording recording;
    std::vector<RecordingSegment> segments;
};

// Recording state machine:
//   idle -> recording <-> paused -> stopped -> uploading -> ready
//   recording|paused|stopped|uploading -> failed on upload exhaustion
class RecordingPipeline {
public:
    RecordingPipeline(storage::Store& store,
                      events::EventStream& events,
                      SettingsProvider& settings,
                      SegmentStorage& segment_storage,
                      const utils::Clock& clock,
                      utils::KeyedMutex& call_locks,
                      std::filesystem::path spool_dir,
                      int upload_workers);
    ~RecordingPipeline();

    Recording start(const std::string& call_id,
                    const std::string& initiated_by,
                    MediaFormat format);
    Recording pause(const std::string& recording_id);
    Recording resume(const std::string& recording_id);
    Recording stop(const std::string& recording_id);
    void write_media(const std::string& recording_id, const std::string& bytes);

    RecordingView status(const std::string& recording_id);
    std::string read_segment(const std::string& recording_id, int sequence_number);

    // Admin only. A held recording is never purged.
    Recording set_legal_hold(const std::string& recording_id,
                             const std::string& admin_id,
                             bool held);

    // Stops any live recording of a call that reached a terminal state or
    // whose recording consent was withdrawn.
    void on_event(const LifecycleEvent& event);
    size_t purge_expired(Timestamp now);

    // Reconciles unfinished recordings with the store: resubmits pending
    // segments in sequence order, completes recordings whose segments all
    // landed and force-stops live recordings of finished calls. Run at startup
    // and from maintenance. Returns the number of actions taken.
    size_t restore();

    void drain();
    void shutdown();

private:
    template <typename Fn>
    Recording mutate(const std::string& recording_id, Fn&& fn);

    Recording load(const std::string& recording_id);
    int64_t offset_ms(const Recording& recording) const;
    void open_segment(const Recording& recording, int sequence_number);
    void finalize_segment(Recording& recording, SegmentState state);
    void stop_locked(Recording& recording, const std::string& reason,
                     events::PendingEvents& pending);
    void maybe_complete(Recording& recording, events::PendingEvents& pending);
    void fail_locked(Recording& recording, const std::string& reason,
                     events::PendingEvents& pending);
    void set_status(Recording& recording, RecordingStatus to, const std::string& reason,
                    events::PendingEvents& pending);
    void upload(const UploadTask& task);
    // One upload attempt. Returns the attempt count when the put failed and
    // should be retried; throws UploadExhausted past the attempt limit.
    std::optional<int> try_upload(const UploadTask& task, const RuntimeSettings& settings);
    void exhaust(const UploadTask& task, const std::string& error);
    size_t reconcile(const std::string& recording_id);

    storage::Store& store_;
    events::EventStream& events_;
    SettingsProvider& settings_;
    SegmentStorage& segment_storage_;
    const utils::Clock& clock_;
    utils::KeyedMutex& call_locks_;
    std::filesystem::path spool_dir_;
    std::unique_ptr<UploadPool> pool_;
};

}
