// Accelerator/storage discovery chain: driver directory, diagnostic command, Tegra eMMC CID

#include "accelerator_identity.hpp"
#include "test_support.hpp"

#include <iostream>

using namespace urhwid;
using namespace urhwid_test;

namespace {

void write_gpu(const FixtureTree& tree, const std::string& bus_id, const std::string& uuid) {
    tree.write("/proc/driver/nvidia/gpus/" + bus_id + "/information",
               "Model: \t\t NVIDIA A100-SXM4-40GB\n"
               "GPU UUID: \t " + uuid + "\n");
}

void make_tegra(const FixtureTree& tree) {
    std::string compatible = "nvidia,p3737-0000+p3701-0000";
    compatible += '\0';
    compatible += "nvidia,tegra234";
    compatible += '\0';
    tree.write("/proc/device-tree/compatible", compatible);
}

void write_emmc(const FixtureTree& tree, const std::string& device, const std::string& removable,
                const std::string& type, const std::string& cid) {
    tree.write("/sys/block/" + device + "/removable", removable + "\n");
    tree.write("/sys/block/" + device + "/device/type", type + "\n");
    tree.write("/sys/block/" + device + "/device/cid", cid + "\n");
}

} // namespace

void test_driver_directory() {
    FixtureTree tree("accel_driver");
    write_gpu(tree, "0000:81:00.0", "GPU-FFFF0000-1111-2222-3333-444455556666");
    write_gpu(tree, "0000:01:00.0", "GPU-AAAA0000-1111-2222-3333-444455556666");
    write_gpu(tree, "0000:02:00.0", "GPU-AAAA0000-1111-2222-3333-444455556666");

    SystemReader reader = tree.reader();
    StubLister lister({"gpu-should-not-be-used"});
    auto identity = AcceleratorIdentity::with_default_chain(reader, lister, true);
    AcceleratorInfo info = identity.collect();

    expect_eq(info.source, "driver-directory", "source");
    expect_eq(info.gpu_uuids.size(), 2u, "duplicates removed");
    expect_eq(info.token_value(),
              "gpu-aaaa0000-1111-2222-3333-444455556666;gpu-ffff0000-1111-2222-3333-444455556666",
              "sorted, lower-cased, ';' joined");
    expect_eq(lister.calls, 0, "diagnostic command not invoked");
    pass("Driver directory UUIDs are deduplicated and sorted");
}

void test_diagnostic_command_fallback() {
    FixtureTree tree("accel_smi");
    tree.mkdir("/proc/driver/nvidia/gpus");

    SystemReader reader = tree.reader();
    StubLister lister({"gpu-22222222-0000-0000-0000-000000000000", "gpu-11111111-0000-0000-0000-000000000000"});
    auto identity = AcceleratorIdentity::with_default_chain(reader, lister, true);
    AcceleratorInfo info = identity.collect();

    expect_eq(info.source, "diagnostic-command", "source");
    expect_eq(lister.calls, 1, "diagnostic command invoked once");
    expect_eq(info.gpu_uuids.front(), "gpu-11111111-0000-0000-0000-000000000000", "sorted");
    pass("Empty driver directory falls back to the diagnostic command");
}

void test_nvidia_smi_listing_parser() {
    auto uuids = NvidiaSmiLister::parse_listing(
        "GPU 0: NVIDIA GeForce RTX 4090 (UUID: GPU-5E8C1D3A-0B7F-4C2E-9A61-D3F2B8E7C0A4)\n"
        "GPU 1: Tesla T4 (uuid:GPU-0d1e2f3a-4b5c-6d7e-8f90-a1b2c3d4e5f6)\n"
        "No devices were found\n");
    expect_eq(uuids.size(), 2u, "two UUIDs");
    expect_eq(uuids[0], "gpu-5e8c1d3a-0b7f-4c2e-9a61-d3f2b8e7c0a4", "first lower-cased");
    expect_eq(uuids[1], "gpu-0d1e2f3a-4b5c-6d7e-8f90-a1b2c3d4e5f6", "case-insensitive label");
    expect(NvidiaSmiLister::parse_listing("").empty(), "empty listing");
    pass("nvidia-smi -L listing parser");
}

void test_no_gpu_not_tegra() {
    FixtureTree tree("accel_none");
    write_emmc(tree, "mmcblk0", "0", "MMC", "150100484147344452024a1bf3d4e900");

    SystemReader reader = tree.reader();
    StubLister lister;
    auto identity = AcceleratorIdentity::with_default_chain(reader, lister, true);
    AcceleratorInfo info = identity.collect();

    expect(!info.found(), "nothing found on a non-Tegra board");
    expect(info.source.empty(), "no source");
    pass("No GPU and no Tegra compatible string finds nothing");
}

void test_tegra_emmc_cid() {
    FixtureTree tree("accel_tegra");
    make_tegra(tree);
    write_emmc(tree, "mmcblk1", "0", "MMC", "FFFF0000000000000000000000000000");
    write_emmc(tree, "mmcblk0", "0", "MMC", "15 01 00 48 41 47 34 44 52 02 4a 1b f3 d4 e9 00");
    write_emmc(tree, "mmcblk0boot0", "0", "MMC", "ignored");

    SystemReader reader = tree.reader();
    StubLister lister;
    auto identity = AcceleratorIdentity::with_default_chain(reader, lister, true);
    AcceleratorInfo info = identity.collect();

    expect_eq(info.source, "embedded-storage", "source");
    expect(info.gpu_uuids.empty(), "no GPU UUIDs");
    expect_eq(info.token_value(), "150100484147344452024a1bf3d4e900", "CID of mmcblk0, normalized");
    pass("Tegra board falls back to the smallest eMMC CID");
}

void test_tegra_skips_removable_and_sd() {
    FixtureTree tree("accel_tegra_skip");
    make_tegra(tree);
    write_emmc(tree, "mmcblk0", "1", "MMC", "aaaa");
    write_emmc(tree, "mmcblk1", "0", "SD", "bbbb");
    write_emmc(tree, "mmcblk2", "0", "MMC", "CCCC");

    SystemReader reader = tree.reader();
    StubLister lister;
    auto identity = AcceleratorIdentity::with_default_chain(reader, lister, true);
    expect_eq(identity.collect().token_value(), "cccc", "first non-removable eMMC");

    tree.remove("/sys/block/mmcblk2");
    expect(!identity.collect().found(), "no usable eMMC left");
    pass("Removable and SD devices are skipped");
}

void test_chain_without_embedded_storage() {
    FixtureTree tree("accel_optional");
    make_tegra(tree);
    write_emmc(tree, "mmcblk0", "0", "MMC", "abcd");

    SystemReader reader = tree.reader();
    StubLister lister;
    auto identity = AcceleratorIdentity::with_default_chain(reader, lister, false);
    expect_eq(identity.provider_count(), 2u, "two providers");
    expect(!identity.collect().found(), "eMMC provider not in the chain");
    pass("Embedded storage provider is optional");
}

void test_nvidia_smi_command() {
    NvidiaSmiLister listing("printf 'GPU 0: NVIDIA A2 (UUID: GPU-ABC-1)\\n'");
    auto ids = listing.list_identifiers();
    expect_eq(ids.size(), 1u, "one GPU listed");
    expect_eq(ids[0], "gpu-abc-1", "lower-cased UUID");

    NvidiaSmiLister missing("urhwid-no-such-tool -L");
    expect(missing.list_identifiers().empty(), "missing tool yields nothing");

    NvidiaSmiLister failing("printf 'GPU 0: NVIDIA A2 (UUID: GPU-ABC-1)\\n'; exit 2");
    expect(failing.list_identifiers().empty(), "non-zero exit yields nothing");
    pass("Diagnostic command output, missing tool and failure status");
}

int main() {
    std::cout << "=== Accelerator Identity Tests ===" << std::endl;

    try {
        test_driver_directory();
        test_diagnostic_command_fallback();
        test_nvidia_smi_listing_parser();
        test_no_gpu_not_tegra();
        test_tegra_emmc_cid();
        test_tegra_skips_removable_and_sd();
        test_chain_without_embedded_storage();
        test_nvidia_smi_command();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "=== All Tests Passed! ===" << std::endl;
    return 0;
}
