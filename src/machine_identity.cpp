#include "machine_identity.hpp"
#include "hwid_types.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

namespace urhwid {

MachineIdentity::MachineIdentity(const SystemReader& reader, bool verbose)
    : reader_(reader), verbose_(verbose) {
}

MachineInfo MachineIdentity::collect() const {
    MachineInfo info;
    info.machine_id = get_machine_id();
    info.dmi_id = get_dmi_id();
    info.filesystem_uuid = get_root_filesystem_uuid();

    log("machine-id: " + (info.machine_id.empty() ? std::string("<absent>") : info.machine_id));
    log("dmi: " + (info.dmi_id.empty() ? std::string("<absent>") : info.dmi_id));
    log("root fs uuid: " + (info.filesystem_uuid.empty() ? std::string("<absent>") : info.filesystem_uuid));
    return info;
}

std::string MachineIdentity::get_machine_id() const {
    std::vector<std::string> id_files = {
        "/etc/machine-id",
        "/var/lib/dbus/machine-id"
    };

    for (const auto& file : id_files) {
        std::string id = HwidTypeUtils::normalize_value(reader_.read_first_line(file));
        if (!id.empty()) {
            return id;
        }
    }
    return "";
}

std::string MachineIdentity::get_dmi_id() const {
    std::string id = HwidTypeUtils::normalize_value(reader_.read_first_line(PRODUCT_UUID_PATH));
    if (!id.empty()) {
        return id;
    }
    return HwidTypeUtils::normalize_value(reader_.read_first_line(BOARD_SERIAL_PATH));
}

std::string MachineIdentity::find_root_device(const std::string& mount_table) {
    std::string device;
    std::istringstream stream(mount_table);
    std::string line;

    // Later entries shadow earlier ones mounted on the same point
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string source;
        std::string mount_point;
        if (!(fields >> source >> mount_point)) {
            continue;
        }
        if (mount_point == "/") {
            device = source;
        }
    }
    return device;
}

std::string MachineIdentity::get_root_filesystem_uuid() const {
    std::string mounts = reader_.read_all("/proc/self/mounts");
    if (mounts.empty()) {
        mounts = reader_.read_all("/proc/mounts");
    }

    std::string device = find_root_device(mounts);
    if (device.empty() || device[0] != '/') {
        log("Root filesystem is not backed by a device node");
        return "";
    }

    std::filesystem::path device_path = std::filesystem::path(device).lexically_normal();

    // e.g. /dev/mapper/root -> ../dm-0
    std::filesystem::path device_target;
    std::string device_link = reader_.read_link(device);
    if (!device_link.empty()) {
        device_target = (device_path.parent_path() / device_link).lexically_normal();
    }

    const std::filesystem::path by_uuid(BY_UUID_PATH);
    for (const auto& uuid : reader_.list_directory(BY_UUID_PATH)) {
        std::string link = reader_.read_link((by_uuid / uuid).string());
        if (link.empty()) {
            continue;
        }

        std::filesystem::path target = (by_uuid / link).lexically_normal();
        if (target == device_path || (!device_target.empty() && target == device_target)) {
            return HwidTypeUtils::normalize_value(uuid);
        }
    }

    log("No " + std::string(BY_UUID_PATH) + " entry for " + device);
    return "";
}

void MachineIdentity::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[MachineIdentity] " << message << std::endl;
    }
}

} // namespace urhwid
