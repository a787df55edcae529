#include "espfleet/registration.hpp"

namespace espfleet {

RegistrationPlan plan_registration(const Registry& reg, const RegistrationRequest& req) {
    RegistrationPlan plan;
    DeviceRecord& rec = plan.record;
    rec.name    = req.name;
    rec.chip_id = req.chip_id;
    rec.host    = req.host;

    auto existing = reg.get(req.name);
    if (existing) {
        plan.updated    = true;
        rec.usb_path    = req.usb_path.value_or(existing->usb_path);
        rec.description = req.description.value_or(existing->description);

        if (req.port) {
            rec.remote_port = *req.port;
            rec.local_port  = req.local_port.value_or(*req.port);
        } else {
            plan.port_kept  = true;
            rec.remote_port = existing->remote_port;
            rec.local_port  = req.local_port.value_or(existing->local_port);
        }
        return plan;
    }

    rec.usb_path    = req.usb_path.value_or("");
    rec.description = req.description.value_or("");
    rec.remote_port = req.port ? *req.port : reg.allocate_port(req.host);
    rec.local_port  = req.local_port.value_or(rec.remote_port);
    return plan;
}

} // namespace espfleet
