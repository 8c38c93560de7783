#include "callguard/recording/recording_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>
#include <thread>
#include <nlohmann/json.hpp>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"
#include "callguard/metrics.hpp"
#include "callguard/utils/crypto.hpp"
#include "callguard/utils/ids.hpp"

namespace callguard::recording {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxBackoffMs = 60000;

std::string event_name(RecordingStatus from, RecordingStatus to) {
    switch (to) {
        case RecordingStatus::Recording:
            return from == RecordingStatus::Paused ? "recording.resumed" : "recording.started";
        case RecordingStatus::Paused:
            return "recording.paused";
        case RecordingStatus::Stopped:
            return "recording.stopped";
        case RecordingStatus::Ready:
            return "recording.ready";
        case RecordingStatus::Failed:
            return "recording.failed";
        default:
            return "";
    }
}

std::optional<RecordingSegment> find_segment(const std::vector<RecordingSegment>& segments,
                                             int sequence_number) {
    for (const auto& segment : segments) {
        if (segment.sequence_number == sequence_number) {
            return segment;
        }
    }
    return std::nullopt;
}

void remove_local(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logging::warn("Cannot remove spooled segment", {kv("path", path), kv("error", ec.message())});
    }
}

int64_t backoff_ms(const RuntimeSettings& settings, int attempts) {
    const auto shift = std::min(std::max(attempts - 1, 0), 16);
    return std::min<int64_t>(static_cast<int64_t>(settings.upload_retry_base_ms) << shift,
                             kMaxBackoffMs);
}

}

RecordingPipeline::RecordingPipeline(storage::Store& store,
                                     events::EventStream& events,
                                     SettingsProvider& settings,
                                     SegmentStorage& segment_storage,
                                     const utils::Clock& clock,
                                     utils::KeyedMutex& call_locks,
                                     fs::path spool_dir,
                                     int upload_workers)
    : store_(store),
      events_(events),
      settings_(settings),
      segment_storage_(segment_storage),
      clock_(clock),
      call_locks_(call_locks),
      spool_dir_(std::move(spool_dir)) {
    pool_ = std::make_unique<UploadPool>(
        upload_workers, [this](const UploadTask& task) { upload(task); });
}

RecordingPipeline::~RecordingPipeline() {
    shutdown();
}

Recording RecordingPipeline::load(const std::string& recording_id) {
    auto recording = store_.find_recording(recording_id);
    if (!recording) {
        throw NotFound("recording not found: " + recording_id);
    }
    return *recording;
}

int64_t RecordingPipeline::offset_ms(const Recording& recording) const {
    return std::max<int64_t>(0, to_millis(clock_.now()) - to_millis(recording.created_at));
}

template <typename Fn>
Recording RecordingPipeline::mutate(const std::string& recording_id, Fn&& fn) {
    const auto call_id = load(recording_id).call_id;
    events::PendingEvents pending(events_);
    Recording recording;
    {
        auto guard = call_locks_.lock(call_id);
        auto tx = store_.begin();
        recording = load(recording_id);
        if (fn(recording, pending)) {
            store_.update_recording(recording);
        }
        tx->commit();
    }
    pending.flush();
    return recording;
}

void RecordingPipeline::set_status(Recording& recording,
                                   RecordingStatus to,
                                   const std::string& reason,
                                   events::PendingEvents& pending) {
    const auto from = recording.status;
    recording.status = to;
    const auto type = event_name(from, to);
    if (!type.empty()) {
        nlohmann::json payload = {{"recording_id", recording.id},
                                  {"status", to_string(to)},
                                  {"duration_ms", recording.duration_ms}};
        if (!reason.empty()) {
            payload["reason"] = reason;
        }
        pending.add(type, recording.call_id, recording.id, payload);
    }
    Metrics::instance().increment("recording_transitions_total", "status", to_string(to));
    logging::info("Recording transition",
                  {kv("recording_id", recording.id),
                   kv("call_id", recording.call_id),
                   kv("from", to_string(from)),
                   kv("to", to_string(to)),
                   kv("reason", reason)});
}

void RecordingPipeline::open_segment(const Recording& recording, int sequence_number) {
    const auto dir = spool_dir_ / recording.id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageUnavailable("cannot create spool dir " + dir.string() + ": " + ec.message());
    }

    RecordingSegment segment;
    segment.recording_id = recording.id;
    segment.sequence_number = sequence_number;
    segment.start_offset_ms = offset_ms(recording);
    segment.local_path = (dir / (std::to_string(sequence_number) + ".part")).string();
    segment.state = SegmentState::Open;
    {
        std::ofstream touch(segment.local_path, std::ios::binary | std::ios::trunc);
        if (!touch) {
            throw StorageUnavailable("cannot create spool file " + segment.local_path);
        }
    }
    store_.insert_segment(segment);
}

void RecordingPipeline::finalize_segment(Recording& recording, SegmentState state) {
    auto segments = store_.segments(recording.id);
    auto open = std::find_if(segments.begin(), segments.end(), [](const RecordingSegment& s) {
        return s.state == SegmentState::Open;
    });
    if (open == segments.end()) {
        return;
    }
    auto segment = *open;
    const auto end = offset_ms(recording);
    segment.end_offset_ms = std::max(end, segment.start_offset_ms);
    segment.duration_ms = *segment.end_offset_ms - segment.start_offset_ms;
    if (!fs::exists(segment.local_path)) {
        std::ofstream touch(segment.local_path, std::ios::binary);
    }
    segment.checksum = utils::sha256_file_hex(segment.local_path);
    segment.state = state;
    store_.update_segment(segment);
    recording.duration_ms += segment.duration_ms;

    logging::debug("Segment finalized",
                   {kv("recording_id", recording.id),
                    kv("sequence", segment.sequence_number),
                    kv("duration_ms", segment.duration_ms),
                    kv("state", to_string(state))});
    if (state == SegmentState::Pending) {
        pool_->submit({recording.id, segment.sequence_number});
    }
}

Recording RecordingPipeline::start(const std::string& call_id,
                                   const std::string& initiated_by,
                                   MediaFormat format) {
    events::PendingEvents pending(events_);
    Recording recording;
    {
        auto guard = call_locks_.lock(call_id);
        auto call = store_.find_call(call_id);
        if (!call) {
            throw NotFound("call not found: " + call_id);
        }
        if (!call->is_participant(initiated_by)) {
            throw InvalidParticipants("user " + initiated_by + " is not part of call " + call_id);
        }
        if (is_terminal(call->status)) {
            throw SessionClosed("call " + call_id + " is " + to_string(call->status));
        }
        if (call->status != CallStatus::Connected) {
            throw InvalidStateTransition("call " + call_id + " is not connected");
        }
        if (auto existing = store_.find_recording_for_call(call_id)) {
            throw InvalidStateTransition("call " + call_id + " already has recording " +
                                         existing->id + " (" + to_string(existing->status) + ")");
        }
        for (const auto& participant : {call->initiator_id, call->counterpart_id}) {
            const auto consent =
                store_.latest_consent(call_id, participant, ConsentType::Recording);
            if (!consent || consent->status != ConsentStatus::Given) {
                throw ConsentRequired("recording consent missing from " + participant +
                                      " on call " + call_id);
            }
        }

        recording.id = utils::make_uuid();
        recording.call_id = call_id;
        recording.status = RecordingStatus::Idle;
        recording.format = format;
        recording.initiated_by = initiated_by;
        recording.encryption_key_ref = utils::make_id("key");
        recording.consent_verified = true;
        recording.created_at = clock_.now();
        auto tx = store_.begin();
        store_.insert_recording(recording);

        open_segment(recording, 0);
        set_status(recording, RecordingStatus::Recording, "", pending);
        store_.update_recording(recording);
        tx->commit();
    }
    pending.flush();
    return recording;
}

Recording RecordingPipeline::pause(const std::string& recording_id) {
    return mutate(recording_id, [&](Recording& recording, events::PendingEvents& pending) {
        if (recording.status != RecordingStatus::Recording) {
            throw InvalidStateTransition("cannot pause recording in state " +
                                         to_string(recording.status));
        }
        finalize_segment(recording, SegmentState::Pending);
        set_status(recording, RecordingStatus::Paused, "", pending);
        return true;
    });
}

Recording RecordingPipeline::resume(const std::string& recording_id) {
    return mutate(recording_id, [&](Recording& recording, events::PendingEvents& pending) {
        if (recording.status != RecordingStatus::Paused) {
            throw InvalidStateTransition("cannot resume recording in state " +
                                         to_string(recording.status));
        }
        const auto next = static_cast<int>(store_.segments(recording.id).size());
        open_segment(recording, next);
        set_status(recording, RecordingStatus::Recording, "", pending);
        return true;
    });
}

Recording RecordingPipeline::stop(const std::string& recording_id) {
    return mutate(recording_id, [&](Recording& recording, events::PendingEvents& pending) {
        if (recording.status != RecordingStatus::Recording &&
            recording.status != RecordingStatus::Paused) {
            throw InvalidStateTransition("cannot stop recording in state " +
                                         to_string(recording.status));
        }
        stop_locked(recording, "", pending);
        return true;
    });
}

void RecordingPipeline::stop_locked(Recording& recording,
                                    const std::string& reason,
                                    events::PendingEvents& pending) {
    if (recording.status == RecordingStatus::Recording) {
        finalize_segment(recording, SegmentState::Pending);
    }
    set_status(recording, RecordingStatus::Stopped, reason, pending);
    set_status(recording, RecordingStatus::Uploading, reason, pending);
    maybe_complete(recording, pending);
}

void RecordingPipeline::maybe_complete(Recording& recording, events::PendingEvents& pending) {
    if (recording.status != RecordingStatus::Uploading) {
        return;
    }
    const auto segments = store_.segments(recording.id);
    const bool all_uploaded = std::all_of(
        segments.begin(), segments.end(),
        [](const RecordingSegment& s) { return s.state == SegmentState::Uploaded; });
    if (!all_uploaded) {
        return;
    }
    recording.retention_expires_at =
        clock_.now() + std::chrono::seconds(settings_.current().recording_retention_sec);
    set_status(recording, RecordingStatus::Ready, "", pending);
}

void RecordingPipeline::fail_locked(Recording& recording,
                                    const std::string& reason,
                                    events::PendingEvents& pending) {
    if (recording.status == RecordingStatus::Ready ||
        recording.status == RecordingStatus::Failed) {
        return;
    }
    if (recording.status == RecordingStatus::Recording) {
        finalize_segment(recording, SegmentState::Failed);
    }
    for (auto segment : store_.segments(recording.id)) {
        if (segment.state == SegmentState::Pending) {
            segment.state = SegmentState::Failed;
            store_.update_segment(segment);
        }
    }
    recording.failure_reason = reason;
    recording.retention_expires_at =
        clock_.now() + std::chrono::seconds(settings_.current().recording_retention_sec);
    set_status(recording, RecordingStatus::Failed, reason, pending);
}

void RecordingPipeline::write_media(const std::string& recording_id, const std::string& bytes) {
    const auto call_id = load(recording_id).call_id;
    auto guard = call_locks_.lock(call_id);
    const auto recording = load(recording_id);
    if (recording.status != RecordingStatus::Recording) {
        throw InvalidStateTransition("recording " + recording_id + " is " +
                                     to_string(recording.status));
    }
    const auto segments = store_.segments(recording_id);
    auto open = std::find_if(segments.begin(), segments.end(), [](const RecordingSegment& s) {
        return s.state == SegmentState::Open;
    });
    if (open == segments.end()) {
        throw InvalidStateTransition("recording " + recording_id + " has no open segment");
    }
    std::ofstream out(open->local_path, std::ios::binary | std::ios::app);
    if (!out) {
        throw StorageUnavailable("cannot append to " + open->local_path);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw StorageUnavailable("short write to " + open->local_path);
    }
}

void RecordingPipeline::upload(const UploadTask& task) {
    int store_failures = 0;
    while (true) {
        std::optional<int> retry;
        RuntimeSettings settings;
        try {
            settings = settings_.current();
            retry = try_upload(task, settings);
        } catch (const UploadExhausted& ex) {
            exhaust(task, ex.what());
            return;
        } catch (const NotFound&) {
            return;
        } catch (const StorageUnavailable& ex) {
            // The store itself is failing; the segment stays pending and
            // restore() picks it up if this task gives up.
            ++store_failures;
            Metrics::instance().increment("segment_uploads_total", "result", "store_error");
            logging::warn("Segment upload interrupted",
                          {kv("recording_id", task.recording_id),
                           kv("sequence", task.sequence_number),
                           kv("failures", store_failures),
                           kv("error", ex.what())});
            if (store_failures >= std::max(settings.max_upload_attempts, 1)) {
                logging::error("Segment upload deferred",
                               {kv("recording_id", task.recording_id),
                                kv("sequence", task.sequence_number)});
                return;
            }
            retry = store_failures;
        }
        if (!retry) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms(settings, *retry)));
    }
}

std::optional<int> RecordingPipeline::try_upload(const UploadTask& task,
                                                 const RuntimeSettings& settings) {
    Recording recording;
    RecordingSegment segment;
    const auto call_id = load(task.recording_id).call_id;
    {
        auto guard = call_locks_.lock(call_id);
        recording = load(task.recording_id);
        auto found = find_segment(store_.segments(task.recording_id), task.sequence_number);
        if (!found || found->state != SegmentState::Pending) {
            return std::nullopt;
        }
        segment = *found;
        if (recording.status == RecordingStatus::Failed) {
            segment.state = SegmentState::Failed;
            store_.update_segment(segment);
            return std::nullopt;
        }
    }

    std::string storage_path;
    std::string error;
    try {
        storage_path = segment_storage_.put(recording, segment);
    } catch (const std::exception& ex) {
        error = ex.what();
    }

    events::PendingEvents pending(events_);
    int attempts = 0;
    {
        auto guard = call_locks_.lock(call_id);
        auto tx = store_.begin();
        recording = load(task.recording_id);
        auto found = find_segment(store_.segments(task.recording_id), task.sequence_number);
        if (!found || found->state != SegmentState::Pending) {
            return std::nullopt;
        }
        segment = *found;
        segment.upload_attempts += 1;
        attempts = segment.upload_attempts;
        if (error.empty()) {
            segment.storage_path = storage_path;
            segment.state = SegmentState::Uploaded;
            store_.update_segment(segment);
            maybe_complete(recording, pending);
            store_.update_recording(recording);
        } else {
            store_.update_segment(segment);
        }
        tx->commit();
        if (error.empty()) {
            remove_local(segment.local_path);
        }
    }
    pending.flush();

    if (error.empty()) {
        Metrics::instance().increment("segment_uploads_total", "result", "uploaded");
        logging::info("Segment uploaded",
                      {kv("recording_id", task.recording_id),
                       kv("sequence", task.sequence_number),
                       kv("attempts", attempts)});
        return std::nullopt;
    }

    Metrics::instance().increment("segment_uploads_total", "result", "retry");
    logging::warn("Segment upload failed",
                  {kv("recording_id", task.recording_id),
                   kv("sequence", task.sequence_number),
                   kv("attempt", attempts),
                   kv("error", error)});
    if (attempts >= settings.max_upload_attempts) {
        throw UploadExhausted("segment " + std::to_string(task.sequence_number) + " failed after " +
                              std::to_string(attempts) + " attempts: " + error);
    }
    return attempts;
}

void RecordingPipeline::exhaust(const UploadTask& task, const std::string& error) {
    Metrics::instance().increment("segment_uploads_total", "result", "exhausted");
    logging::error("Segment upload exhausted",
                   {kv("recording_id", task.recording_id),
                    kv("sequence", task.sequence_number),
                    kv("error", error)});
    try {
        mutate(task.recording_id, [&](Recording& recording, events::PendingEvents& pending) {
            auto found = find_segment(store_.segments(task.recording_id), task.sequence_number);
            if (found && found->state == SegmentState::Pending) {
                found->state = SegmentState::Failed;
                store_.update_segment(*found);
            }
            fail_locked(recording, "upload_exhausted", pending);
            return true;
        });
    } catch (const StorageUnavailable& ex) {
        // Left pending; the next restore() retries and exhausts it again.
        logging::error("Cannot record upload exhaustion",
                       {kv("recording_id", task.recording_id), kv("error", ex.what())});
    } catch (const NotFound& ex) {
        logging::debug("Exhausted segment's recording is gone",
                       {kv("recording_id", task.recording_id), kv("error", ex.what())});
    }
}

RecordingView RecordingPipeline::status(const std::string& recording_id) {
    RecordingView view;
    view.recording = load(recording_id);
    view.segments = store_.segments(recording_id);
    return view;
}

std::string RecordingPipeline::read_segment(const std::string& recording_id,
                                            int sequence_number) {
    const auto recording = load(recording_id);
    auto segment = find_segment(store_.segments(recording_id), sequence_number);
    if (!segment || segment->state != SegmentState::Uploaded) {
        throw NotFound("segment " + std::to_string(sequence_number) + " of recording " +
                       recording_id + " is not available");
    }
    return segment_storage_.get(recording, *segment);
}

Recording RecordingPipeline::set_legal_hold(const std::string& recording_id,
                                            const std::string& admin_id,
                                            bool held) {
    auto admin = store_.find_user(admin_id);
    if (!admin || !admin->is_admin) {
        throw Unauthorized("user " + admin_id + " lacks administrative capability");
    }
    return mutate(recording_id, [&](Recording& recording, events::PendingEvents& pending) {
        if (recording.legal_hold == held) {
            return false;
        }
        recording.legal_hold = held;
        AccessLogEntry entry;
        entry.recording_id = recording.id;
        entry.accessor_id = admin_id;
        entry.action = held ? AccessAction::LegalHold : AccessAction::LegalHoldReleased;
        entry.allowed = true;
        entry.timestamp = clock_.now();
        store_.append_access_log(entry);
        pending.add("recording.legal_hold", recording.call_id, recording.id,
                    {{"recording_id", recording.id}, {"held", held}, {"by", admin_id}});
        logging::info("Legal hold changed",
                      {kv("recording_id", recording.id), kv("held", held), kv("by", admin_id)});
        return true;
    });
}

void RecordingPipeline::on_event(const LifecycleEvent& event) {
    std::string reason;
    if (event.type == "call.ended" || event.type == "call.missed" ||
        event.type == "call.failed") {
        reason = "call_" + event.type.substr(event.type.find('.') + 1);
    } else if (event.type == "call.consent_withdrawn") {
        const auto payload = nlohmann::json::parse(event.payload, nullptr, false);
        if (payload.is_discarded() ||
            payload.value("type", std::string()) != to_string(ConsentType::Recording)) {
            return;
        }
        reason = "consent_withdrawn";
    } else {
        return;
    }
    auto existing = store_.find_recording_for_call(event.call_id);
    if (!existing || (existing->status != RecordingStatus::Recording &&
                      existing->status != RecordingStatus::Paused)) {
        return;
    }
    mutate(existing->id, [&](Recording& recording, events::PendingEvents& pending) {
        if (recording.status != RecordingStatus::Recording &&
            recording.status != RecordingStatus::Paused) {
            return false;
        }
        logging::info("Force-stopping recording",
                      {kv("recording_id", recording.id), kv("call_id", recording.call_id),
                       kv("reason", reason)});
        stop_locked(recording, reason, pending);
        return true;
    });
}

size_t RecordingPipeline::purge_expired(Timestamp now) {
    size_t purged = 0;
    for (const auto& candidate : store_.recordings_expired(now)) {
        events::PendingEvents pending(events_);
        bool removed = false;
        {
            auto guard = call_locks_.lock(candidate.call_id);
            auto recording = store_.find_recording(candidate.id);
            if (!recording || recording->legal_hold ||
                (recording->status != RecordingStatus::Ready &&
                 recording->status != RecordingStatus::Failed)) {
                continue;
            }
            try {
                for (const auto& segment : store_.segments(recording->id)) {
                    segment_storage_.remove(segment.storage_path);
                    remove_local(segment.local_path);
                }
            } catch (const std::exception& ex) {
                logging::warn("Purge deferred",
                              {kv("recording_id", recording->id), kv("error", ex.what())});
                continue;
            }
            std::error_code ec;
            fs::remove_all(spool_dir_ / recording->id, ec);

            // The row and its audit entry go together; a failed audit keeps the row
            // for the next sweep.
            try {
                auto tx = store_.begin();
                store_.delete_recording(recording->id);
                AccessLogEntry entry;
                entry.recording_id = recording->id;
                entry.accessor_id = "system";
                entry.action = AccessAction::Purged;
                entry.allowed = true;
                entry.timestamp = now;
                store_.append_access_log(entry);
                tx->commit();
            } catch (const StorageUnavailable& ex) {
                logging::warn("Purge deferred",
                              {kv("recording_id", recording->id), kv("error", ex.what())});
                continue;
            }
            pending.add("recording.purged", recording->call_id, recording->id,
                        {{"recording_id", recording->id}});
            removed = true;
        }
        pending.flush();
        if (removed) {
            ++purged;
            Metrics::instance().increment("recording_transitions_total", "status", "purged");
            logging::info("Recording purged", {kv("recording_id", candidate.id)});
        }
    }
    return purged;
}

size_t RecordingPipeline::restore() {
    size_t actions = 0;
    for (const auto& candidate : store_.unfinished_recordings()) {
        try {
            actions += reconcile(candidate.id);
        } catch (const std::exception& ex) {
            logging::warn("Recording reconciliation failed",
                          {kv("recording_id", candidate.id), kv("error", ex.what())});
        }
    }
    if (actions > 0) {
        logging::info("Recordings reconciled", {kv("actions", actions)});
    }
    return actions;
}

size_t RecordingPipeline::reconcile(const std::string& recording_id) {
    size_t actions = 0;
    mutate(recording_id, [&](Recording& recording, events::PendingEvents& pending) {
        if (recording.status == RecordingStatus::Idle ||
            recording.status == RecordingStatus::Ready ||
            recording.status == RecordingStatus::Failed) {
            return false;
        }
        auto segments = store_.segments(recording.id);
        std::sort(segments.begin(), segments.end(),
                  [](const RecordingSegment& a, const RecordingSegment& b) {
                      return a.sequence_number < b.sequence_number;
                  });
        for (const auto& segment : segments) {
            if (segment.state == SegmentState::Pending &&
                pool_->submit({recording.id, segment.sequence_number})) {
                ++actions;
            }
        }

        const auto before = recording.status;
        if (before == RecordingStatus::Recording || before == RecordingStatus::Paused) {
            const auto call = store_.find_call(recording.call_id);
            if (call && !is_terminal(call->status)) {
                return false;
            }
            const auto reason = call ? "call_" + to_string(call->status) : "call_missing";
            logging::info("Force-stopping recording",
                          {kv("recording_id", recording.id), kv("call_id", recording.call_id),
                           kv("reason", reason)});
            stop_locked(recording, reason, pending);
        } else {
            if (before == RecordingStatus::Stopped) {
                set_status(recording, RecordingStatus::Uploading, "", pending);
            }
            maybe_complete(recording, pending);
        }
        if (recording.status == before) {
            return false;
        }
        ++actions;
        return true;
    });
    return actions;
}

void RecordingPipeline::drain() {
    pool_->drain();
}

void RecordingPipeline::shutdown() {
    if (pool_) {
        pool_->shutdown();
    }
}

}
