// Optional machine facets: machine-id, DMI identifiers and root filesystem UUID

#include "machine_identity.hpp"
#include "test_support.hpp"

#include <iostream>

using namespace urhwid;
using namespace urhwid_test;

void test_root_filesystem_uuid() {
    FixtureTree tree("machine_fs");
    tree.write("/proc/self/mounts",
               "sysfs /sys sysfs rw,nosuid,nodev,noexec,relatime 0 0\n"
               "/dev/sda1 / ext4 rw,relatime,errors=remount-ro 0 0\n"
               "/dev/sda2 /home ext4 rw,relatime 0 0\n");
    tree.symlink("../../sda2", "/dev/disk/by-uuid/0000-home");
    tree.symlink("../../sda1", "/dev/disk/by-uuid/abcd-1234");

    SystemReader reader = tree.reader();
    MachineIdentity machine(reader);
    expect_eq(machine.get_root_filesystem_uuid(), "abcd-1234", "fs uuid");
    pass("Root device is reverse-matched against /dev/disk/by-uuid");
}

void test_root_device_is_symlink() {
    FixtureTree tree("machine_mapper");
    tree.write("/proc/mounts", "/dev/mapper/vg0-root / xfs rw 0 0\n");
    tree.symlink("../dm-0", "/dev/mapper/vg0-root");
    tree.symlink("../../dm-0", "/dev/disk/by-uuid/7C1F-E2A9");

    SystemReader reader = tree.reader();
    MachineIdentity machine(reader);
    expect_eq(machine.get_root_filesystem_uuid(), "7c1f-e2a9", "mapper fs uuid");
    pass("Device-mapper root resolves through its symlink");
}

void test_find_root_device() {
    expect_eq(MachineIdentity::find_root_device(
                  "rootfs / rootfs rw 0 0\n"
                  "/dev/nvme0n1p2 / btrfs rw 0 0\n"
                  "tmpfs /tmp tmpfs rw 0 0\n"),
              "/dev/nvme0n1p2", "last root entry wins");
    expect(MachineIdentity::find_root_device("tmpfs /tmp tmpfs rw 0 0\n").empty(), "no root entry");
    expect(MachineIdentity::find_root_device("").empty(), "empty table");
    pass("Mount table parsing");
}

void test_overlay_root_is_absent() {
    FixtureTree tree("machine_overlay");
    tree.write("/proc/self/mounts", "overlay / overlay rw,lowerdir=/a,upperdir=/b 0 0\n");
    tree.symlink("../../sda1", "/dev/disk/by-uuid/abcd-1234");

    SystemReader reader = tree.reader();
    MachineIdentity machine(reader);
    expect(machine.get_root_filesystem_uuid().empty(), "overlay root has no UUID");
    pass("Non-device root filesystem is soft-absent");
}

void test_machine_id_and_dmi() {
    FixtureTree tree("machine_ids");
    tree.write("/var/lib/dbus/machine-id", "3F9A0C7E2B4D4E1A9C8B7A6F5E4D3C2B\n");
    tree.write("/sys/class/dmi/id/board_serial", " PF2ABCDE \n");

    SystemReader reader = tree.reader();
    MachineIdentity machine(reader);
    expect_eq(machine.get_machine_id(), "3f9a0c7e2b4d4e1a9c8b7a6f5e4d3c2b", "dbus machine-id fallback");
    expect_eq(machine.get_dmi_id(), "pf2abcde", "board serial fallback");

    tree.write("/etc/machine-id", "0123456789abcdef0123456789abcdef\n");
    tree.write("/sys/class/dmi/id/product_uuid", "4C4C4544-0042-3510-8050-B3C04F4A4E32\n");
    expect_eq(machine.get_machine_id(), "0123456789abcdef0123456789abcdef", "/etc/machine-id preferred");
    expect_eq(machine.get_dmi_id(), "4c4c4544-0042-3510-8050-b3c04f4a4e32", "product uuid preferred");
    pass("Machine id and DMI identity sources");
}

void test_everything_absent() {
    FixtureTree tree("machine_empty");

    SystemReader reader = tree.reader();
    MachineIdentity machine(reader);
    MachineInfo info = machine.collect();
    expect(info.machine_id.empty(), "machine id absent");
    expect(info.dmi_id.empty(), "dmi absent");
    expect(info.filesystem_uuid.empty(), "fs uuid absent");
    pass("Empty system yields no machine facets");
}

int main() {
    std::cout << "=== Machine Identity Tests ===" << std::endl;

    try {
        test_root_filesystem_uuid();
        test_root_device_is_symlink();
        test_find_root_device();
        test_overlay_root_is_absent();
        test_machine_id_and_dmi();
        test_everything_absent();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "=== All Tests Passed! ===" << std::endl;
    return 0;
}
