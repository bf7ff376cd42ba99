#pragma once

#include "core/audit_event.hpp"

namespace core {

// Append-only destination for committed audit events. Returns false when the
// event could not be stored; the caller must then not commit the transition.
class IAuditSink {
public:
    virtual ~IAuditSink() = default;
    virtual bool append(const AuditEvent& event) = 0;
};

} // namespace core
