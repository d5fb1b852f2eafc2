#pragma once

#include <functional>
#include <string>
#include <vector>
#include "hwid_types.hpp"
#include "system_reader.hpp"
#include "accelerator_lister.hpp"
#include "accelerator_identity.hpp"
#include "hardware_fingerprint.hpp"

namespace urhwid {

struct CollectionResult {
    IdentityProfile profile = IdentityProfile::Accelerator;
    ComponentSet components;
    bool accelerator_probed = false;
    AcceleratorInfo accelerator;
};

// One collector invocation of a profile; throws MissingIdentityError when a
// mandatory facet is absent
struct CollectorStep {
    std::string name;
    std::function<void(CollectionResult&)> run;
};

class HwidCollector {
public:
    HwidCollector(const SystemReader& reader, AcceleratorLister& lister, bool verbose = false);

    CollectionResult collect(IdentityProfile profile);

    // Steps making up a profile, in their default order
    std::vector<CollectorStep> steps_for(IdentityProfile profile);

    CollectionResult run_steps(IdentityProfile profile, const std::vector<CollectorStep>& steps);

private:
    const SystemReader& reader_;
    AcceleratorLister& lister_;
    bool verbose_;

    void collect_board(CollectionResult& result);
    void collect_cpu(CollectionResult& result);
    void collect_accelerator(CollectionResult& result, bool mandatory);
    void collect_machine(CollectionResult& result);
    void log(const std::string& message) const;
};

} // namespace urhwid
