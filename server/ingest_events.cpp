// ============================================================
// ingest_events.cpp
// ============================================================

#include "ingest_events.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

const char* event_kind_str(IngestEventKind kind) {
    switch (kind) {
        case IngestEventKind::CONNECTION_ACCEPTED: return "connection-accepted";
        case IngestEventKind::ADMITTED:            return "admitted";
        case IngestEventKind::DUPLICATE_REJECTED:  return "duplicate-rejected";
        case IngestEventKind::QUEUE_FULL:          return "queue-full";
        case IngestEventKind::PERSISTED:           return "persisted";
        case IngestEventKind::ERROR:               return "error";
    }
    return "unknown";
}

void LoggingListener::on_event(const IngestEvent& ev) {
    std::string line = std::string("[") + event_kind_str(ev.kind) + "]";
    if (!ev.peer.empty())       line += " peer=" + ev.peer;
    if (!ev.message_id.empty()) line += " id=" + ev.message_id;
    if (!ev.filename.empty())   line += " file=\"" + ev.filename + "\"";
    if (!ev.detail.empty())     line += " " + ev.detail;

    switch (ev.kind) {
        case IngestEventKind::CONNECTION_ACCEPTED:
            LOG_DEBUG(line);
            break;
        case IngestEventKind::DUPLICATE_REJECTED:
        case IngestEventKind::QUEUE_FULL:
            LOG_WARN(line);
            break;
        case IngestEventKind::ERROR:
            LOG_ERROR(line);
            break;
        default:
            LOG_INFO(line);
            break;
    }
}

void LoggingListener::on_persisted(const PersistedItem& item) {
    LOG_INFO("Saved \"" + item.filename + "\" (" + utils::format_bytes(item.size) +
             ") -> " + item.storage_path);
}
