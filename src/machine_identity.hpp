#pragma once

#include <string>
#include "system_reader.hpp"

namespace urhwid {

// Optional machine/OS facets; every value may be empty
struct MachineInfo {
    std::string machine_id;
    std::string dmi_id;
    std::string filesystem_uuid;
};

class MachineIdentity {
public:
    static constexpr const char* PRODUCT_UUID_PATH = "/sys/class/dmi/id/product_uuid";
    static constexpr const char* BOARD_SERIAL_PATH = "/sys/class/dmi/id/board_serial";
    static constexpr const char* BY_UUID_PATH = "/dev/disk/by-uuid";

    explicit MachineIdentity(const SystemReader& reader, bool verbose = false);

    MachineInfo collect() const;

    std::string get_machine_id() const;

    // Product UUID, or the board serial when the UUID is unreadable
    std::string get_dmi_id() const;

    // UUID of the filesystem mounted at "/"
    std::string get_root_filesystem_uuid() const;

    // Device of the last mount table entry whose mount point is "/"
    static std::string find_root_device(const std::string& mount_table);

private:
    const SystemReader& reader_;
    bool verbose_;

    void log(const std::string& message) const;
};

} // namespace urhwid
