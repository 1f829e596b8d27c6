// =============================================================================
// FILE: src/live/originate_request.cpp
// =============================================================================
#include "live/originate_request.h"

namespace asterisk_live {

Result OriginateRequest::validate() const {
    if (channel.empty()) return Result::kInvalidArgument;
    if (timeout.count() <= 0) return Result::kInvalidArgument;
    if (const auto* ext = std::get_if<ExtensionTarget>(&target)) {
        if (ext->context.empty() || ext->extension.empty()) return Result::kInvalidArgument;
    } else if (const auto* app = std::get_if<ApplicationTarget>(&target)) {
        if (app->application.empty()) return Result::kInvalidArgument;
    }
    return Result::kOk;
}

ManagerAction OriginateRequest::to_action() const {
    ManagerAction a("Originate");
    a.set("Channel", channel);

    if (const auto* ext = std::get_if<ExtensionTarget>(&target)) {
        a.set("Context", ext->context);
        a.set("Exten", ext->extension);
        a.set("Priority", std::to_string(ext->priority));
    } else if (const auto* app = std::get_if<ApplicationTarget>(&target)) {
        a.set("Application", app->application);
        if (!app->data.empty()) a.set("Data", app->data);
    }

    a.set("Timeout", std::to_string(timeout.count()));
    if (!caller_id.empty()) a.set("CallerID", caller_id);
    a.set("Async", "true");

    for (const auto& kv : variables) a.add_variable(kv.first, kv.second);

    a.complete_on("OriginateResponse");
    a.complete_on("OriginateSuccess");
    a.complete_on("OriginateFailure");
    return a;
}

} // namespace asterisk_live
