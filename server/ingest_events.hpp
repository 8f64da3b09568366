#pragma once

// ============================================================
// ingest_events.hpp -- Outward-facing notifications of the core
//   Presentation layers subscribe through IngestListener; the
//   core never decides how events are displayed.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <memory>

enum class IngestEventKind {
    CONNECTION_ACCEPTED,
    ADMITTED,
    DUPLICATE_REJECTED,
    QUEUE_FULL,
    PERSISTED,
    ERROR,
};

const char* event_kind_str(IngestEventKind kind);

struct IngestEvent {
    IngestEventKind kind{IngestEventKind::ERROR};
    std::string     message_id;   // hex; empty when no request was decoded
    std::string     filename;
    std::string     peer;
    std::string     detail;
};

// A payload that reached durable storage
struct PersistedItem {
    std::string message_id;
    std::string filename;
    std::string storage_path;
    u64         size{0};
};

class IngestListener {
public:
    virtual ~IngestListener() = default;

    // Called from handler and worker threads; implementations must be thread-safe.
    // Events raised on different threads are not ordered: a message's
    // PERSISTED may arrive before its ADMITTED.
    virtual void on_event(const IngestEvent& ev) = 0;
    virtual void on_persisted(const PersistedItem& item) = 0;
};

// Default sink: renders every event through the Logger
class LoggingListener : public IngestListener {
public:
    void on_event(const IngestEvent& ev) override;
    void on_persisted(const PersistedItem& item) override;
};

using IngestListenerPtr = std::shared_ptr<IngestListener>;
