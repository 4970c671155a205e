#pragma once

#include "descriptors.hpp"
#include <functional>

namespace RDKit {
    class ROMol;
}

namespace pfpred {
namespace descriptors {

class RDKitDescriptor : public Descriptor {
public:
    using DescriptorFunction = std::function<double(const RDKit::ROMol&)>;

    RDKitDescriptor(const std::string& name, const std::string& description,
                    DescriptorFunction calcFunction);

    double calculate(const Molecule& mol) const override;

private:
    DescriptorFunction calcFunction_;
};

// Average molecular weight including implicit hydrogens
class RDKitMolWtDescriptor : public RDKitDescriptor {
public:
    RDKitMolWtDescriptor();
};

// Wildman-Crippen octanol/water partition coefficient
class RDKitCrippenLogPDescriptor : public RDKitDescriptor {
public:
    RDKitCrippenLogPDescriptor();
};

class RDKitNumHDonorsDescriptor : public RDKitDescriptor {
public:
    RDKitNumHDonorsDescriptor();
};

class RDKitNumHAcceptorsDescriptor : public RDKitDescriptor {
public:
    RDKitNumHAcceptorsDescriptor();
};

} // namespace descriptors
} // namespace pfpred
