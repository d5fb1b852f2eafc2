#include "hwid_collector.hpp"
#include "board_identity.hpp"
#include "cpu_identity.hpp"
#include "machine_identity.hpp"

#include <iostream>

namespace urhwid {

HwidCollector::HwidCollector(const SystemReader& reader, AcceleratorLister& lister, bool verbose)
    : reader_(reader), lister_(lister), verbose_(verbose) {
}

CollectionResult HwidCollector::collect(IdentityProfile profile) {
    return run_steps(profile, steps_for(profile));
}

std::vector<CollectorStep> HwidCollector::steps_for(IdentityProfile profile) {
    std::vector<CollectorStep> steps;
    steps.push_back({"board", [this](CollectionResult& r) { collect_board(r); }});
    steps.push_back({"cpu", [this](CollectionResult& r) { collect_cpu(r); }});

    switch (profile) {
        case IdentityProfile::Accelerator:
            steps.push_back({"accelerator", [this](CollectionResult& r) { collect_accelerator(r, true); }});
            break;
        case IdentityProfile::Machine:
            steps.push_back({"accelerator", [this](CollectionResult& r) { collect_accelerator(r, false); }});
            steps.push_back({"machine", [this](CollectionResult& r) { collect_machine(r); }});
            break;
        case IdentityProfile::Minimal:
            break;
    }
    return steps;
}

CollectionResult HwidCollector::run_steps(IdentityProfile profile, const std::vector<CollectorStep>& steps) {
    CollectionResult result;
    result.profile = profile;

    log("Collecting " + HwidTypeUtils::identity_profile_to_string(profile) + " profile");
    for (const auto& step : steps) {
        log("Running " + step.name + " collector");
        step.run(result);
    }
    log("Collected " + std::to_string(result.components.size()) + " component(s)");
    return result;
}

void HwidCollector::collect_board(CollectionResult& result) {
    BoardIdentity board(reader_, verbose_);
    if (!result.components.add(ComponentLabel::Board, board.collect())) {
        throw MissingIdentityError(std::string("missing DMI board_name (") + BoardIdentity::BOARD_NAME_PATH + ")");
    }
}

void HwidCollector::collect_cpu(CollectionResult& result) {
    CpuIdentity cpu(reader_, verbose_);
    auto info = cpu.collect();
    if (!info) {
        throw MissingIdentityError(std::string("missing or unparsable ") + CpuIdentity::CPUINFO_PATH);
    }

    result.components.add(ComponentLabel::CpuVendor, info->vendor);
    result.components.add(ComponentLabel::CpuSignature, info->signature);
    result.components.add(ComponentLabel::CpuIsa, info->isa);
}

void HwidCollector::collect_accelerator(CollectionResult& result, bool mandatory) {
    // The eMMC fallback only stands in for a GPU where one is required
    auto identity = AcceleratorIdentity::with_default_chain(reader_, lister_, mandatory, verbose_);
    result.accelerator = identity.collect();
    result.accelerator_probed = true;

    if (!result.components.add(ComponentLabel::Gpu, result.accelerator.token_value()) && mandatory) {
        throw MissingIdentityError("no NVIDIA GPU UUID or Tegra eMMC CID found (need at least one GPU)");
    }
}

void HwidCollector::collect_machine(CollectionResult& result) {
    MachineIdentity machine(reader_, verbose_);
    MachineInfo info = machine.collect();

    result.components.add(ComponentLabel::MachineId, info.machine_id);
    result.components.add(ComponentLabel::Dmi, info.dmi_id);
    result.components.add(ComponentLabel::Filesystem, info.filesystem_uuid);
}

void HwidCollector::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[HwidCollector] " << message << std::endl;
    }
}

} // namespace urhwid
