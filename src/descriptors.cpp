#include "descriptors.hpp"
#include "descriptors/lipinski.hpp"
#include <algorithm>
#include "utils.hpp"

namespace pfpred {

double DescriptorVector::at(const std::string& name) const {
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) {
        throw std::out_of_range("Unknown descriptor column: " + name);
    }
    return values[static_cast<size_t>(it - names.begin())];
}

// DescriptorFactory implementation
void DescriptorFactory::registerDescriptor(std::unique_ptr<Descriptor> descriptor) {
    if (!descriptor) {
        return;
    }
    auto it = index.find(descriptor->getName());
    if (it != index.end()) {
        descriptors[it->second] = std::move(descriptor);
        return;
    }
    index[descriptor->getName()] = descriptors.size();
    descriptors.push_back(std::move(descriptor));
}

const Descriptor* DescriptorFactory::getDescriptor(const std::string& name) const {
    auto it = index.find(name);
    if (it != index.end()) {
        return descriptors[it->second].get();
    }
    return nullptr;
}

double DescriptorFactory::calculate(const std::string& descriptorName, const Molecule& mol) const {
    const Descriptor* descriptor = getDescriptor(descriptorName);
    if (!descriptor) {
        throw PredictionException("Unknown descriptor: " + descriptorName, ErrorCode::UNKNOWN_ERROR);
    }

    return descriptor->calculate(mol);
}

DescriptorVector DescriptorFactory::calculate(const std::vector<std::string>& descriptorNames,
                                              const Molecule& mol) const {
    DescriptorVector result;
    result.names.reserve(descriptorNames.size());
    result.values.reserve(descriptorNames.size());

    for (const auto& name : descriptorNames) {
        result.names.push_back(name);
        result.values.push_back(calculate(name, mol));
    }
    return result;
}

// LipinskiEngine implementation
LipinskiEngine::LipinskiEngine() {
    factory.registerDescriptor(std::make_unique<descriptors::RDKitMolWtDescriptor>());
    factory.registerDescriptor(std::make_unique<descriptors::RDKitCrippenLogPDescriptor>());
    factory.registerDescriptor(std::make_unique<descriptors::RDKitNumHDonorsDescriptor>());
    factory.registerDescriptor(std::make_unique<descriptors::RDKitNumHAcceptorsDescriptor>());
}

const std::vector<std::string>& LipinskiEngine::columnNames() {
    static const std::vector<std::string> names = {"MW", "LogP", "NumHDonors", "NumHAcceptors"};
    return names;
}

const std::vector<std::string>& LipinskiEngine::displayNames() {
    static const std::vector<std::string> names = {
        "Molecular Weight",
        "Octanol-Water Partition Coefficient (LogP)",
        "Number of Hydrogen Bond Donors",
        "Number of Hydrogen Bond Acceptors"
    };
    return names;
}

DescriptorVector LipinskiEngine::calculate(const Molecule& mol) {
    const std::string& key = mol.getOriginalSmiles();

    DescriptorVector result;
    if (lookup(key, result)) {
        globalLogger.debug("Lipinski cache hit for " + key);
        return result;
    }

    result = factory.calculate(columnNames(), mol);
    store(key, result);
    globalLogger.debug("Computed Lipinski descriptors for " + key);
    return result;
}

#ifdef PFPRED_WITH_TBB
bool LipinskiEngine::lookup(const std::string& key, DescriptorVector& result) const {
    tbb::concurrent_hash_map<std::string, DescriptorVector>::const_accessor acc;
    if (!cache.find(acc, key)) {
        return false;
    }
    result = acc->second;
    return true;
}

void LipinskiEngine::store(const std::string& key, const DescriptorVector& result) {
    // Last writer wins; every writer stores the same deterministic value
    tbb::concurrent_hash_map<std::string, DescriptorVector>::accessor acc;
    cache.insert(acc, key);
    acc->second = result;
}

size_t LipinskiEngine::cacheSize() const {
    return cache.size();
}

void LipinskiEngine::clearCache() {
    cache.clear();
}
#else
bool LipinskiEngine::lookup(const std::string& key, DescriptorVector& result) const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = cache.find(key);
    if (it == cache.end()) {
        return false;
    }
    result = it->second;
    return true;
}

void LipinskiEngine::store(const std::string& key, const DescriptorVector& result) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    cache[key] = result;
}

size_t LipinskiEngine::cacheSize() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return cache.size();
}

void LipinskiEngine::clearCache() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    cache.clear();
}
#endif

} // namespace pfpred
