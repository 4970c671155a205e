#include "descriptors/lipinski.hpp"
#include "utils.hpp"
#include <GraphMol/GraphMol.h>
#include <GraphMol/Descriptors/MolDescriptors.h>
#include <GraphMol/Descriptors/Crippen.h>
#include <GraphMol/Descriptors/Lipinski.h>

namespace pfpred {
namespace descriptors {

RDKitDescriptor::RDKitDescriptor(const std::string& name, const std::string& description,
                                DescriptorFunction calcFunction)
    : Descriptor(name, description), calcFunction_(std::move(calcFunction)) {}

double RDKitDescriptor::calculate(const Molecule& mol) const {
    const RDKit::ROMol* rdkMol = mol.getMolecule().get();
    if (!rdkMol) {
        throw PredictionException(getName() + ": molecule has no RDKit structure",
                                  ErrorCode::INVALID_STRUCTURE);
    }

    try {
        return calcFunction_(*rdkMol);
    } catch (const std::exception& e) {
        globalLogger.error(getName() + ": RDKit calculation error: " + e.what() +
                           " for SMILES: " + mol.getOriginalSmiles());
        throw PredictionException(getName() + ": " + e.what(), ErrorCode::UNKNOWN_ERROR);
    }
}

// Molecular Weight
RDKitMolWtDescriptor::RDKitMolWtDescriptor()
    : RDKitDescriptor("MW", "Molecular Weight",
                     [](const RDKit::ROMol& mol) {
                         return RDKit::Descriptors::calcAMW(mol, false);
                     }) {}

// LogP
RDKitCrippenLogPDescriptor::RDKitCrippenLogPDescriptor()
    : RDKitDescriptor("LogP", "Octanol-Water Partition Coefficient (LogP)",
                     [](const RDKit::ROMol& mol) {
                         double logp, mr;
                         RDKit::Descriptors::calcCrippenDescriptors(mol, logp, mr);
                         return logp;
                     }) {}

// Number of H-Bond Donors
RDKitNumHDonorsDescriptor::RDKitNumHDonorsDescriptor()
    : RDKitDescriptor("NumHDonors", "Number of Hydrogen Bond Donors",
                     [](const RDKit::ROMol& mol) {
                         return static_cast<double>(RDKit::Descriptors::calcNumHBD(mol));
                     }) {}

// Number of H-Bond Acceptors
RDKitNumHAcceptorsDescriptor::RDKitNumHAcceptorsDescriptor()
    : RDKitDescriptor("NumHAcceptors", "Number of Hydrogen Bond Acceptors",
                     [](const RDKit::ROMol& mol) {
                         return static_cast<double>(RDKit::Descriptors::calcNumHBA(mol));
                     }) {}

} // namespace descriptors
} // namespace pfpred
