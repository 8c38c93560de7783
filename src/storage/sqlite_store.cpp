#include "callguard/storage/sqlite_store.hpp"

#include <sqlite3.h>

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "callguard/errors.hpp"
#include "callguard/logging.hpp"

namespace callguard::storage {

namespace {

class ConstraintViolation : public std::runtime_error {
public:
    explicit ConstraintViolation(const std::string& message) : std::runtime_error(message) {}
};

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    const std::string message = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_PROTOCOL:
            throw StorageUnavailable(message);
        case SQLITE_CONSTRAINT:
            throw ConstraintViolation(message);
        default:
            throw std::runtime_error(message);
    }
}

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        const int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            throw_sqlite(db_, rc, "sqlite prepare");
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind_text(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
        return *this;
    }

    Statement& bind_blob(int idx, const std::string& value) {
        sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
        return *this;
    }

    Statement& bind_opt_text(int idx, const std::optional<std::string>& value) {
        if (!value) {
            sqlite3_bind_null(stmt_, idx);
            return *this;
        }
        return bind_text(idx, *value);
    }

    Statement& bind_int(int idx, int value) {
        sqlite3_bind_int(stmt_, idx, value);
        return *this;
    }

    Statement& bind_int64(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
        return *this;
    }

    Statement& bind_opt_int64(int idx, const std::optional<int64_t>& value) {
        if (!value) {
            sqlite3_bind_null(stmt_, idx);
            return *this;
        }
        return bind_int64(idx, *value);
    }

    Statement& bind_bool(int idx, bool value) {
        return bind_int(idx, value ? 1 : 0);
    }

    Statement& bind_time(int idx, Timestamp value) {
        return bind_int64(idx, to_millis(value));
    }

    Statement& bind_opt_time(int idx, const std::optional<Timestamp>& value) {
        if (!value) {
            sqlite3_bind_null(stmt_, idx);
            return *this;
        }
        return bind_time(idx, *value);
    }

    // True while a row is available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw_sqlite(db_, rc, "sqlite step");
    }

    void run() {
        while (step()) {
        }
    }

    bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(stmt_, col);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    std::string blob(int col) const {
        const void* data = sqlite3_column_blob(stmt_, col);
        const int size = sqlite3_column_bytes(stmt_, col);
        return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size))
                    : std::string();
    }

    std::optional<std::string> opt_text(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return text(col);
    }

    int integer(int col) const {
        return sqlite3_column_int(stmt_, col);
    }

    int64_t int64(int col) const {
        return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
    }

    std::optional<int64_t> opt_int64(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return int64(col);
    }

    Timestamp time(int col) const {
        return from_millis(int64(col));
    }

    std::optional<Timestamp> opt_time(int col) const {
        if (is_null(col)) {
            return std::nullopt;
        }
        return time(col);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS users(
    id TEXT PRIMARY KEY,
    role TEXT NOT NULL,
    is_admin INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_users_role ON users(role);

CREATE TABLE IF NOT EXISTS calls(
    id TEXT PRIMARY KEY,
    initiator_id TEXT NOT NULL,
    counterpart_id TEXT NOT NULL,
    escalated_to TEXT,
    status TEXT NOT NULL,
    call_type TEXT NOT NULL,
    escalation_level INTEGER NOT NULL DEFAULT 0,
    context TEXT NOT NULL DEFAULT '{}',
    created_at INTEGER NOT NULL,
    answered_at INTEGER,
    ended_at INTEGER,
    end_reason TEXT NOT NULL DEFAULT '',
    flagged_at INTEGER,
    flag_reason TEXT NOT NULL DEFAULT '',
    last_activity_at INTEGER NOT NULL,
    initiator_seen_at INTEGER,
    counterpart_seen_at INTEGER
);
CREATE INDEX IF NOT EXISTS idx_calls_status ON calls(status);
CREATE INDEX IF NOT EXISTS idx_calls_initiator ON calls(initiator_id, status);

CREATE TABLE IF NOT EXISTS signaling_messages(
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    call_id TEXT NOT NULL REFERENCES calls(id),
    sender_id TEXT NOT NULL,
    kind TEXT NOT NULL,
    payload BLOB NOT NULL,
    created_at INTEGER NOT NULL,
    consumed INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_signaling_call ON signaling_messages(call_id, created_at);

CREATE TABLE IF NOT EXISTS recordings(
    id TEXT PRIMARY KEY,
    call_id TEXT NOT NULL UNIQUE REFERENCES calls(id),
    status TEXT NOT NULL,
    format TEXT NOT NULL,
    initiated_by TEXT NOT NULL,
    encryption_key_ref TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    duration_ms INTEGER NOT NULL DEFAULT 0,
    retention_expires_at INTEGER,
    failure_reason TEXT NOT NULL DEFAULT '',
    consent_verified INTEGER NOT NULL DEFAULT 0,
    legal_hold INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_recordings_retention ON recordings(retention_expires_at);

CREATE TABLE IF NOT EXISTS recording_segments(
    recording_id TEXT NOT NULL REFERENCES recordings(id) ON DELETE CASCADE,
    sequence_number INTEGER NOT NULL,
    start_offset_ms INTEGER NOT NULL,
    end_offset_ms INTEGER,
    duration_ms INTEGER NOT NULL DEFAULT 0,
    local_path TEXT NOT NULL DEFAULT '',
    storage_path TEXT NOT NULL DEFAULT '',
    checksum TEXT NOT NULL DEFAULT '',
    state TEXT NOT NULL,
    upload_attempts INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY(recording_id, sequence_number)
);

CREATE TABLE IF NOT EXISTS consent_log(
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    call_id TEXT NOT NULL REFERENCES calls(id),
    user_id TEXT NOT NULL,
    consent_type TEXT NOT NULL,
    consent_status TEXT NOT NULL,
    method TEXT NOT NULL DEFAULT 'web_form',
    source_address TEXT NOT NULL DEFAULT '',
    recorded_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_consent_call ON consent_log(call_id, user_id, consent_type);

CREATE TABLE IF NOT EXISTS escalation_rules(
    id TEXT PRIMARY KEY,
    trigger_condition TEXT NOT NULL,
    threshold_seconds INTEGER NOT NULL,
    escalate_to_role TEXT NOT NULL,
    priority_level INTEGER NOT NULL DEFAULT 0,
    channels TEXT NOT NULL DEFAULT '[]',
    cooldown_seconds INTEGER NOT NULL DEFAULT 0,
    active INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS escalation_events(
    id TEXT PRIMARY KEY,
    call_id TEXT NOT NULL REFERENCES calls(id),
    rule_id TEXT NOT NULL,
    level INTEGER NOT NULL,
    triggered_at INTEGER NOT NULL,
    acknowledged_by TEXT,
    acknowledged_at INTEGER,
    UNIQUE(call_id, level)
);

CREATE TABLE IF NOT EXISTS notification_jobs(
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    event_id TEXT NOT NULL,
    channel TEXT NOT NULL,
    recipient TEXT NOT NULL,
    payload TEXT NOT NULL,
    attempts INTEGER NOT NULL DEFAULT 0,
    next_attempt_at INTEGER NOT NULL,
    state TEXT NOT NULL,
    last_error TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_jobs_due ON notification_jobs(state, next_attempt_at);

CREATE TABLE IF NOT EXISTS access_grants(
    id TEXT PRIMARY KEY,
    recording_id TEXT NOT NULL,
    grantee_id TEXT NOT NULL,
    permission TEXT NOT NULL,
    granted_by TEXT NOT NULL,
    granted_at INTEGER NOT NULL,
    expires_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_grants_recording ON access_grants(recording_id);
CREATE INDEX IF NOT EXISTS idx_grants_grantee ON access_grants(grantee_id);

CREATE TABLE IF NOT EXISTS access_log(
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    recording_id TEXT NOT NULL,
    accessor_id TEXT NOT NULL,
    action TEXT NOT NULL,
    allowed INTEGER NOT NULL,
    timestamp INTEGER NOT NULL,
    source_address TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_access_log_recording ON access_log(recording_id, timestamp);

CREATE TABLE IF NOT EXISTS events(
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    event_id TEXT NOT NULL UNIQUE,
    type TEXT NOT NULL,
    call_id TEXT NOT NULL,
    subject_id TEXT NOT NULL,
    payload TEXT NOT NULL,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_events_call ON events(call_id, created_at);

CREATE TABLE IF NOT EXISTS settings(
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)SQL";

const char* kCallColumns =
    "id,initiator_id,counterpart_id,escalated_to,status,call_type,escalation_level,context,"
    "created_at,answered_at,ended_at,end_reason,flagged_at,flag_reason,last_activity_at,"
    "initiator_seen_at,counterpart_seen_at";

const char* kRecordingColumns =
    "id,call_id,status,format,initiated_by,encryption_key_ref,created_at,duration_ms,"
    "retention_expires_at,failure_reason,consent_verified,legal_hold";

const char* kSegmentColumns =
    "recording_id,sequence_number,start_offset_ms,end_offset_ms,duration_ms,local_path,"
    "storage_path,checksum,state,upload_attempts";

const char* kConsentColumns =
    "id,call_id,user_id,consent_type,consent_status,method,source_address,recorded_at";

const char* kJobColumns =
    "id,event_id,channel,recipient,payload,attempts,next_attempt_at,state,last_error";

const char* kGrantColumns =
    "id,recording_id,grantee_id,permission,granted_by,granted_at,expires_at";

std::string select_from(const char* columns, const char* table, const char* tail) {
    return std::string("SELECT ") + columns + " FROM " + table + " " + tail;
}

std::string select_recordings_from(const char* tail) {
    std::string columns;
    std::string list = kRecordingColumns;
    size_t start = 0;
    while (start <= list.size()) {
        const auto comma = list.find(',', start);
        const auto name = list.substr(start, comma == std::string::npos ? std::string::npos
                                                                         : comma - start);
        if (!columns.empty()) {
            columns += ",";
        }
        columns += "r." + name;
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return "SELECT " + columns + " FROM recordings r " + tail;
}

UserRecord read_user(const Statement& st) {
    UserRecord user;
    user.id = st.text(0);
    user.role = st.text(1);
    user.is_admin = st.integer(2) != 0;
    return user;
}

CallSession read_call(const Statement& st) {
    CallSession call;
    call.id = st.text(0);
    call.initiator_id = st.text(1);
    call.counterpart_id = st.text(2);
    call.escalated_to = st.opt_text(3);
    call.status = parse_call_status(st.text(4));
    call.call_type = parse_call_type(st.text(5));
    call.escalation_level = st.integer(6);
    call.context = st.text(7);
    call.created_at = st.time(8);
    call.answered_at = st.opt_time(9);
    call.ended_at = st.opt_time(10);
    call.end_reason = st.text(11);
    call.flagged_at = st.opt_time(12);
    call.flag_reason = st.text(13);
    call.last_activity_at = st.time(14);
    call.initiator_seen_at = st.opt_time(15);
    call.counterpart_seen_at = st.opt_time(16);
    return call;
}

SignalingMessage read_signal(const Statement& st) {
    SignalingMessage message;
    message.id = st.int64(0);
    message.call_id = st.text(1);
    message.sender_id = st.text(2);
    message.kind = parse_signal_kind(st.text(3));
    message.payload = st.blob(4);
    message.created_at = st.time(5);
    message.consumed = st.integer(6) != 0;
    return message;
}

Recording read_recording(const Statement& st) {
    Recording recording;
    recording.id = st.text(0);
    recording.call_id = st.text(1);
    recording.status = parse_recording_status(st.text(2));
    recording.format = parse_media_format(st.text(3));
    recording.initiated_by = st.text(4);
    recording.encryption_key_ref = st.text(5);
    recording.created_at = st.time(6);
    recording.duration_ms = st.int64(7);
    recording.retention_expires_at = st.opt_time(8);
    recording.failure_reason = st.text(9);
    recording.consent_verified = st.integer(10) != 0;
    recording.legal_hold = st.integer(11) != 0;
    return recording;
}

RecordingSegment read_segment(const Statement& st) {
    RecordingSegment segment;
    segment.recording_id = st.text(0);
    segment.sequence_number = st.integer(1);
    segment.start_offset_ms = st.int64(2);
    segment.end_offset_ms = st.opt_int64(3);
    segment.duration_ms = st.int64(4);
    segment.local_path = st.text(5);
    segment.storage_path = st.text(6);
    segment.checksum = st.text(7);
    segment.state = parse_segment_state(st.text(8));
    segment.upload_attempts = st.integer(9);
    return segment;
}

EscalationRule read_rule(const Statement& st) {
    EscalationRule rule;
    rule.id = st.text(0);
    rule.trigger = parse_trigger_condition(st.text(1));
    rule.threshold_seconds = st.integer(2);
    rule.escalate_to_role = st.text(3);
    rule.priority_level = st.integer(4);
    rule.notification_channels =
        nlohmann::json::parse(st.text(5)).get<std::vector<std::string>>();
    rule.cooldown_seconds = st.integer(6);
    rule.active = st.integer(7) != 0;
    return rule;
}

EscalationEvent read_escalation(const Statement& st) {
    EscalationEvent event;
    event.id = st.text(0);
    event.call_id = st.text(1);
    event.rule_id = st.text(2);
    event.level = st.integer(3);
    event.triggered_at = st.time(4);
    event.acknowledged_by = st.opt_text(5);
    event.acknowledged_at = st.opt_time(6);
    return event;
}

NotificationJob read_job(const Statement& st) {
    NotificationJob job;
    job.id = st.int64(0);
    job.event_id = st.text(1);
    job.channel = st.text(2);
    job.recipient = st.text(3);
    job.payload = st.text(4);
    job.attempts = st.integer(5);
    job.next_attempt_at = st.time(6);
    job.state = parse_job_state(st.text(7));
    job.last_error = st.text(8);
    return job;
}

AccessGrant read_grant(const Statement& st) {
    AccessGrant grant;
    grant.id = st.text(0);
    grant.recording_id = st.text(1);
    grant.grantee_id = st.text(2);
    grant.permission = parse_permission(st.text(3));
    grant.granted_by = st.text(4);
    grant.granted_at = st.time(5);
    grant.expires_at = st.time(6);
    return grant;
}

AccessLogEntry read_access_entry(const Statement& st) {
    AccessLogEntry entry;
    entry.id = st.int64(0);
    entry.recording_id = st.text(1);
    entry.accessor_id = st.text(2);
    entry.action = parse_access_action(st.text(3));
    entry.allowed = st.integer(4) != 0;
    entry.timestamp = st.time(5);
    entry.source_address = st.text(6);
    return entry;
}

ConsentRecord read_consent(const Statement& st) {
    ConsentRecord consent;
    consent.id = st.int64(0);
    consent.call_id = st.text(1);
    consent.user_id = st.text(2);
    consent.type = parse_consent_type(st.text(3));
    consent.status = parse_consent_status(st.text(4));
    consent.method = st.text(5);
    consent.source_address = st.text(6);
    consent.recorded_at = st.time(7);
    return consent;
}

LifecycleEvent read_event(const Statement& st) {
    LifecycleEvent event;
    event.seq = st.int64(0);
    event.event_id = st.text(1);
    event.type = st.text(2);
    event.call_id = st.text(3);
    event.subject_id = st.text(4);
    event.payload = st.text(5);
    event.created_at = st.time(6);
    return event;
}

void bind_call(Statement& st, const CallSession& call) {
    st.bind_text(1, call.id)
        .bind_text(2, call.initiator_id)
        .bind_text(3, call.counterpart_id)
        .bind_opt_text(4, call.escalated_to)
        .bind_text(5, to_string(call.status))
        .bind_text(6, to_string(call.call_type))
        .bind_int(7, call.escalation_level)
        .bind_text(8, call.context)
        .bind_time(9, call.created_at)
        .bind_opt_time(10, call.answered_at)
        .bind_opt_time(11, call.ended_at)
        .bind_text(12, call.end_reason)
        .bind_opt_time(13, call.flagged_at)
        .bind_text(14, call.flag_reason)
        .bind_time(15, call.last_activity_at)
        .bind_opt_time(16, call.initiator_seen_at)
        .bind_opt_time(17, call.counterpart_seen_at);
}

void bind_recording(Statement& st, const Recording& recording) {
    st.bind_text(1, recording.id)
        .bind_text(2, recording.call_id)
        .bind_text(3, to_string(recording.status))
        .bind_text(4, to_string(recording.format))
        .bind_text(5, recording.initiated_by)
        .bind_text(6, recording.encryption_key_ref)
        .bind_time(7, recording.created_at)
        .bind_int64(8, recording.duration_ms)
        .bind_opt_time(9, recording.retention_expires_at)
        .bind_text(10, recording.failure_reason)
        .bind_bool(11, recording.consent_verified)
        .bind_bool(12, recording.legal_hold);
}

void bind_segment(Statement& st, const RecordingSegment& segment) {
    st.bind_text(1, segment.recording_id)
        .bind_int(2, segment.sequence_number)
        .bind_int64(3, segment.start_offset_ms)
        .bind_opt_int64(4, segment.end_offset_ms)
        .bind_int64(5, segment.duration_ms)
        .bind_text(6, segment.local_path)
        .bind_text(7, segment.storage_path)
        .bind_text(8, segment.checksum)
        .bind_text(9, to_string(segment.state))
        .bind_int(10, segment.upload_attempts);
}

void bind_grant(Statement& st, const AccessGrant& grant) {
    st.bind_text(1, grant.id)
        .bind_text(2, grant.recording_id)
        .bind_text(3, grant.grantee_id)
        .bind_text(4, to_string(grant.permission))
        .bind_text(5, grant.granted_by)
        .bind_time(6, grant.granted_at)
        .bind_time(7, grant.expires_at);
}

// Outermost scope takes the write lock up front; a scope opened inside another
// becomes a savepoint of it.
class SqliteTransaction : public Transaction {
public:
    SqliteTransaction(SqliteDb& db, std::recursive_mutex& mutex)
        : db_(db), lock_(mutex), nested_(sqlite3_get_autocommit(db.handle()) == 0) {
        db_.exec(nested_ ? "SAVEPOINT nested_tx;" : "BEGIN IMMEDIATE;");
    }

    ~SqliteTransaction() override {
        if (committed_) {
            return;
        }
        try {
            db_.exec(nested_ ? "ROLLBACK TO nested_tx; RELEASE nested_tx;" : "ROLLBACK;");
        } catch (const std::exception& ex) {
            logging::error("sqlite rollback failed", {kv("error", ex.what())});
        }
    }

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit() override {
        db_.exec(nested_ ? "RELEASE nested_tx;" : "COMMIT;");
        committed_ = true;
    }

    bool committed() const override { return committed_; }

private:
    SqliteDb& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool nested_;
    bool committed_ = false;
};

template <typename T, typename Reader>
std::vector<T> collect(Statement& st, Reader reader) {
    std::vector<T> rows;
    while (st.step()) {
        rows.push_back(reader(st));
    }
    return rows;
}

template <typename T, typename Reader>
std::optional<T> first(Statement& st, Reader reader) {
    if (!st.step()) {
        return std::nullopt;
    }
    return reader(st);
}

}

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    const int rc = sqlite3_open_v2(path_.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                       SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw StorageUnavailable(path_ + ": " + message);
    }
    configure();
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw_sqlite(nullptr, rc, message);
    }
}

void SqliteDb::configure() {
    if (path_ != ":memory:") {
        exec("PRAGMA journal_mode=WAL;");
    }
    exec("PRAGMA synchronous=NORMAL;");
    exec("PRAGMA foreign_keys=ON;");
    const int rc = sqlite3_busy_timeout(db_, 5000);
    if (rc != SQLITE_OK) {
        throw_sqlite(db_, rc, "busy_timeout");
    }
    exec("PRAGMA temp_store=MEMORY;");
}

SqliteStore::SqliteStore(const std::string& path)
    : db_(std::make_unique<SqliteDb>(path)) {
    migrate();
}

std::unique_ptr<Transaction> SqliteStore::begin() {
    return std::make_unique<SqliteTransaction>(*db_, mutex_);
}

void SqliteStore::migrate() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    db_->exec(kSchema);
}

void SqliteStore::upsert_user(const UserRecord& user) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO users(id,role,is_admin) VALUES(?,?,?) "
                 "ON CONFLICT(id) DO UPDATE SET role=excluded.role, is_admin=excluded.is_admin;");
    st.bind_text(1, user.id).bind_text(2, user.role).bind_bool(3, user.is_admin);
    st.run();
}

std::optional<UserRecord> SqliteStore::find_user(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(), "SELECT id,role,is_admin FROM users WHERE id=?;");
    st.bind_text(1, id);
    return first<UserRecord>(st, read_user);
}

std::vector<UserRecord> SqliteStore::users_with_role(const std::string& role) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(), "SELECT id,role,is_admin FROM users WHERE role=? ORDER BY id;");
    st.bind_text(1, role);
    return collect<UserRecord>(st, read_user);
}

void SqliteStore::insert_call(const CallSession& call) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = std::string("INSERT INTO calls(") + kCallColumns +
                     ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(db_->handle(), sql.c_str());
    bind_call(st, call);
    st.run();
}

void SqliteStore::update_call(const CallSession& call) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "UPDATE calls SET initiator_id=?2, counterpart_id=?3, escalated_to=?4, "
                 "status=?5, call_type=?6, escalation_level=?7, context=?8, created_at=?9, "
                 "answered_at=?10, ended_at=?11, end_reason=?12, flagged_at=?13, "
                 "flag_reason=?14, last_activity_at=?15, initiator_seen_at=?16, "
                 "counterpart_seen_at=?17 WHERE id=?1;");
    bind_call(st, call);
    st.run();
}

std::optional<CallSession> SqliteStore::find_call(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kCallColumns, "calls", "WHERE id=?;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, id);
    return first<CallSession>(st, read_call);
}

std::vector<CallSession> SqliteStore::active_calls() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(
        kCallColumns, "calls",
        "WHERE status IN ('initiated','ringing','connected') ORDER BY created_at, id;");
    Statement st(db_->handle(), sql.c_str());
    return collect<CallSession>(st, read_call);
}

std::optional<CallSession> SqliteStore::active_call_for(const std::string& initiator_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(
        kCallColumns, "calls",
        "WHERE initiator_id=? AND status IN ('initiated','ringing','connected') LIMIT 1;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, initiator_id);
    return first<CallSession>(st, read_call);
}

int64_t SqliteStore::append_signal(const SignalingMessage& message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO signaling_messages(call_id,sender_id,kind,payload,created_at,consumed) "
                 "VALUES(?,?,?,?,?,?);");
    st.bind_text(1, message.call_id)
        .bind_text(2, message.sender_id)
        .bind_text(3, to_string(message.kind))
        .bind_blob(4, message.payload)
        .bind_time(5, message.created_at)
        .bind_bool(6, message.consumed);
    st.run();
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_->handle()));
}

std::vector<SignalingMessage> SqliteStore::unconsumed_signals(const std::string& call_id,
                                                              const std::string& recipient_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT id,call_id,sender_id,kind,payload,created_at,consumed "
                 "FROM signaling_messages WHERE call_id=? AND sender_id<>? AND consumed=0 "
                 "ORDER BY id;");
    st.bind_text(1, call_id).bind_text(2, recipient_id);
    return collect<SignalingMessage>(st, read_signal);
}

void SqliteStore::mark_consumed(int64_t message_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(), "UPDATE signaling_messages SET consumed=1 WHERE id=?;");
    st.bind_int64(1, message_id);
    st.run();
}

std::vector<SignalingMessage> SqliteStore::signals_for(const std::string& call_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT id,call_id,sender_id,kind,payload,created_at,consumed "
                 "FROM signaling_messages WHERE call_id=? ORDER BY id;");
    st.bind_text(1, call_id);
    return collect<SignalingMessage>(st, read_signal);
}

size_t SqliteStore::purge_signals(Timestamp ended_before) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "DELETE FROM signaling_messages WHERE call_id IN ("
                 "SELECT id FROM calls WHERE ended_at IS NOT NULL AND ended_at < ?);");
    st.bind_time(1, ended_before);
    st.run();
    return static_cast<size_t>(sqlite3_changes(db_->handle()));
}

void SqliteStore::insert_recording(const Recording& recording) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = std::string("INSERT INTO recordings(") + kRecordingColumns +
                     ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(db_->handle(), sql.c_str());
    bind_recording(st, recording);
    try {
        st.run();
    } catch (const ConstraintViolation& ex) {
        throw InvalidStateTransition(std::string("recording already exists: ") + ex.what());
    }
}

void SqliteStore::update_recording(const Recording& recording) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "UPDATE recordings SET call_id=?2, status=?3, format=?4, initiated_by=?5, "
                 "encryption_key_ref=?6, created_at=?7, duration_ms=?8, "
                 "retention_expires_at=?9, failure_reason=?10, consent_verified=?11, "
                 "legal_hold=?12 WHERE id=?1;");
    bind_recording(st, recording);
    st.run();
}

std::optional<Recording> SqliteStore::find_recording(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kRecordingColumns, "recordings", "WHERE id=?;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, id);
    return first<Recording>(st, read_recording);
}

std::optional<Recording> SqliteStore::find_recording_for_call(const std::string& call_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kRecordingColumns, "recordings", "WHERE call_id=?;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, call_id);
    return first<Recording>(st, read_recording);
}

std::vector<Recording> SqliteStore::recordings_expired(Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(
        kRecordingColumns, "recordings",
        "WHERE retention_expires_at IS NOT NULL AND retention_expires_at <= ? "
        "AND legal_hold=0 ORDER BY retention_expires_at;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_time(1, now);
    return collect<Recording>(st, read_recording);
}

std::vector<Recording> SqliteStore::unfinished_recordings() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kRecordingColumns, "recordings",
                                 "WHERE status NOT IN ('ready','failed') ORDER BY created_at;");
    Statement st(db_->handle(), sql.c_str());
    return collect<Recording>(st, read_recording);
}

std::vector<Recording> SqliteStore::recordings_for_participant(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_recordings_from(
        "JOIN calls c ON c.id = r.call_id "
        "WHERE c.initiator_id=?1 OR c.counterpart_id=?1 ORDER BY r.created_at, r.id;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, user_id);
    return collect<Recording>(st, read_recording);
}

std::vector<Recording> SqliteStore::all_recordings() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kRecordingColumns, "recordings", "ORDER BY created_at, id;");
    Statement st(db_->handle(), sql.c_str());
    return collect<Recording>(st, read_recording);
}

void SqliteStore::delete_recording(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement segments(db_->handle(), "DELETE FROM recording_segments WHERE recording_id=?;");
    segments.bind_text(1, id);
    segments.run();
    Statement recording(db_->handle(), "DELETE FROM recordings WHERE id=?;");
    recording.bind_text(1, id);
    recording.run();
}

void SqliteStore::insert_segment(const RecordingSegment& segment) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = std::string("INSERT INTO recording_segments(") + kSegmentColumns +
                     ") VALUES(?,?,?,?,?,?,?,?,?,?);";
    Statement st(db_->handle(), sql.c_str());
    bind_segment(st, segment);
    st.run();
}

void SqliteStore::update_segment(const RecordingSegment& segment) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "UPDATE recording_segments SET start_offset_ms=?3, end_offset_ms=?4, "
                 "duration_ms=?5, local_path=?6, storage_path=?7, checksum=?8, state=?9, "
                 "upload_attempts=?10 WHERE recording_id=?1 AND sequence_number=?2;");
    bind_segment(st, segment);
    st.run();
}

std::vector<RecordingSegment> SqliteStore::segments(const std::string& recording_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kSegmentColumns, "recording_segments",
                                 "WHERE recording_id=? ORDER BY sequence_number;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, recording_id);
    return collect<RecordingSegment>(st, read_segment);
}

int64_t SqliteStore::append_consent(const ConsentRecord& consent) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO consent_log(call_id,user_id,consent_type,consent_status,method,"
                 "source_address,recorded_at) VALUES(?,?,?,?,?,?,?);");
    st.bind_text(1, consent.call_id)
        .bind_text(2, consent.user_id)
        .bind_text(3, to_string(consent.type))
        .bind_text(4, to_string(consent.status))
        .bind_text(5, consent.method)
        .bind_text(6, consent.source_address)
        .bind_time(7, consent.recorded_at);
    st.run();
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_->handle()));
}

std::optional<ConsentRecord> SqliteStore::latest_consent(const std::string& call_id,
                                                         const std::string& user_id,
                                                         ConsentType type) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kConsentColumns, "consent_log",
                                 "WHERE call_id=? AND user_id=? AND consent_type=? "
                                 "ORDER BY id DESC LIMIT 1;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, call_id).bind_text(2, user_id).bind_text(3, to_string(type));
    return first<ConsentRecord>(st, read_consent);
}

std::vector<ConsentRecord> SqliteStore::consents_for(const std::string& call_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kConsentColumns, "consent_log", "WHERE call_id=? ORDER BY id;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, call_id);
    return collect<ConsentRecord>(st, read_consent);
}

void SqliteStore::upsert_rule(const EscalationRule& rule) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO escalation_rules(id,trigger_condition,threshold_seconds,"
                 "escalate_to_role,priority_level,channels,cooldown_seconds,active) "
                 "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(id) DO UPDATE SET "
                 "trigger_condition=excluded.trigger_condition, "
                 "threshold_seconds=excluded.threshold_seconds, "
                 "escalate_to_role=excluded.escalate_to_role, "
                 "priority_level=excluded.priority_level, channels=excluded.channels, "
                 "cooldown_seconds=excluded.cooldown_seconds, active=excluded.active;");
    st.bind_text(1, rule.id)
        .bind_text(2, to_string(rule.trigger))
        .bind_int(3, rule.threshold_seconds)
        .bind_text(4, rule.escalate_to_role)
        .bind_int(5, rule.priority_level)
        .bind_text(6, nlohmann::json(rule.notification_channels).dump())
        .bind_int(7, rule.cooldown_seconds)
        .bind_bool(8, rule.active);
    st.run();
}

std::vector<EscalationRule> SqliteStore::rules() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT id,trigger_condition,threshold_seconds,escalate_to_role,"
                 "priority_level,channels,cooldown_seconds,active FROM escalation_rules "
                 "ORDER BY threshold_seconds, priority_level DESC, id;");
    return collect<EscalationRule>(st, read_rule);
}

bool SqliteStore::insert_escalation(const EscalationEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO escalation_events(id,call_id,rule_id,level,triggered_at,"
                 "acknowledged_by,acknowledged_at) VALUES(?,?,?,?,?,?,?);");
    st.bind_text(1, event.id)
        .bind_text(2, event.call_id)
        .bind_text(3, event.rule_id)
        .bind_int(4, event.level)
        .bind_time(5, event.triggered_at)
        .bind_opt_text(6, event.acknowledged_by)
        .bind_opt_time(7, event.acknowledged_at);
    try {
        st.run();
    } catch (const ConstraintViolation&) {
        return false;
    }
    return true;
}

void SqliteStore::update_escalation(const EscalationEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "UPDATE escalation_events SET acknowledged_by=?, acknowledged_at=? WHERE id=?;");
    st.bind_opt_text(1, event.acknowledged_by)
        .bind_opt_time(2, event.acknowledged_at)
        .bind_text(3, event.id);
    st.run();
}

std::optional<EscalationEvent> SqliteStore::find_escalation(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT id,call_id,rule_id,level,triggered_at,acknowledged_by,acknowledged_at "
                 "FROM escalation_events WHERE id=?;");
    st.bind_text(1, id);
    return first<EscalationEvent>(st, read_escalation);
}

std::vector<EscalationEvent> SqliteStore::escalations_for(const std::string& call_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT id,call_id,rule_id,level,triggered_at,acknowledged_by,acknowledged_at "
                 "FROM escalation_events WHERE call_id=? ORDER BY level;");
    st.bind_text(1, call_id);
    return collect<EscalationEvent>(st, read_escalation);
}

int64_t SqliteStore::insert_job(const NotificationJob& job) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO notification_jobs(event_id,channel,recipient,payload,attempts,"
                 "next_attempt_at,state,last_error) VALUES(?,?,?,?,?,?,?,?);");
    st.bind_text(1, job.event_id)
        .bind_text(2, job.channel)
        .bind_text(3, job.recipient)
        .bind_text(4, job.payload)
        .bind_int(5, job.attempts)
        .bind_time(6, job.next_attempt_at)
        .bind_text(7, to_string(job.state))
        .bind_text(8, job.last_error);
    st.run();
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_->handle()));
}

void SqliteStore::update_job(const NotificationJob& job) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "UPDATE notification_jobs SET attempts=?, next_attempt_at=?, state=?, "
                 "last_error=? WHERE id=?;");
    st.bind_int(1, job.attempts)
        .bind_time(2, job.next_attempt_at)
        .bind_text(3, to_string(job.state))
        .bind_text(4, job.last_error)
        .bind_int64(5, job.id);
    st.run();
}

std::vector<NotificationJob> SqliteStore::due_jobs(Timestamp now, size_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kJobColumns, "notification_jobs",
                                 "WHERE state='pending' AND next_attempt_at <= ? "
                                 "ORDER BY next_attempt_at, id LIMIT ?;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_time(1, now).bind_int64(2, static_cast<int64_t>(limit));
    return collect<NotificationJob>(st, read_job);
}

std::vector<NotificationJob> SqliteStore::jobs_for_event(const std::string& event_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kJobColumns, "notification_jobs",
                                 "WHERE event_id=? ORDER BY id;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, event_id);
    return collect<NotificationJob>(st, read_job);
}

void SqliteStore::insert_grant(const AccessGrant& grant) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = std::string("INSERT INTO access_grants(") + kGrantColumns +
                     ") VALUES(?,?,?,?,?,?,?);";
    Statement st(db_->handle(), sql.c_str());
    bind_grant(st, grant);
    st.run();
}

void SqliteStore::update_grant(const AccessGrant& grant) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "UPDATE access_grants SET recording_id=?2, grantee_id=?3, permission=?4, "
                 "granted_by=?5, granted_at=?6, expires_at=?7 WHERE id=?1;");
    bind_grant(st, grant);
    st.run();
}

std::optional<AccessGrant> SqliteStore::find_grant(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kGrantColumns, "access_grants", "WHERE id=?;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, id);
    return first<AccessGrant>(st, read_grant);
}

std::vector<AccessGrant> SqliteStore::grants_for(const std::string& recording_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kGrantColumns, "access_grants",
                                 "WHERE recording_id=? ORDER BY granted_at, id;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, recording_id);
    return collect<AccessGrant>(st, read_grant);
}

std::vector<AccessGrant> SqliteStore::grants_for_user(const std::string& grantee_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const auto sql = select_from(kGrantColumns, "access_grants",
                                 "WHERE grantee_id=? ORDER BY granted_at, id;");
    Statement st(db_->handle(), sql.c_str());
    st.bind_text(1, grantee_id);
    return collect<AccessGrant>(st, read_grant);
}

int64_t SqliteStore::append_access_log(const AccessLogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO access_log(recording_id,accessor_id,action,allowed,timestamp,"
                 "source_address) VALUES(?,?,?,?,?,?);");
    st.bind_text(1, entry.recording_id)
        .bind_text(2, entry.accessor_id)
        .bind_text(3, to_string(entry.action))
        .bind_bool(4, entry.allowed)
        .bind_time(5, entry.timestamp)
        .bind_text(6, entry.source_address);
    st.run();
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_->handle()));
}

std::vector<AccessLogEntry> SqliteStore::access_log(const std::string& recording_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT id,recording_id,accessor_id,action,allowed,timestamp,source_address "
                 "FROM access_log WHERE recording_id=? ORDER BY id;");
    st.bind_text(1, recording_id);
    return collect<AccessLogEntry>(st, read_access_entry);
}

int64_t SqliteStore::append_event(const LifecycleEvent& event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO events(event_id,type,call_id,subject_id,payload,created_at) "
                 "VALUES(?,?,?,?,?,?);");
    st.bind_text(1, event.event_id)
        .bind_text(2, event.type)
        .bind_text(3, event.call_id)
        .bind_text(4, event.subject_id)
        .bind_text(5, event.payload)
        .bind_time(6, event.created_at);
    st.run();
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_->handle()));
}

std::vector<LifecycleEvent> SqliteStore::events_after(int64_t cursor, size_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "SELECT seq,event_id,type,call_id,subject_id,payload,created_at "
                 "FROM events WHERE seq > ? ORDER BY seq LIMIT ?;");
    st.bind_int64(1, cursor).bind_int64(2, static_cast<int64_t>(limit));
    return collect<LifecycleEvent>(st, read_event);
}

void SqliteStore::put_setting(const std::string& key, const std::string& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(),
                 "INSERT INTO settings(key,value) VALUES(?,?) "
                 "ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    st.bind_text(1, key).bind_text(2, value);
    st.run();
}

std::map<std::string, std::string> SqliteStore::settings() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_->handle(), "SELECT key,value FROM settings;");
    std::map<std::string, std::string> result;
    while (st.step()) {
        result[st.text(0)] = st.text(1);
    }
    return result;
}

}
