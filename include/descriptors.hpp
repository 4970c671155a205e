#pragma once

#include "utils.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>

#ifdef PFPRED_WITH_TBB
#include <tbb/concurrent_hash_map.h>
#endif


namespace pfpred {

// Ordered named numeric features for one compound. Column order is part of the
// contract with the models that consume it.
struct DescriptorVector {
    std::vector<std::string> names;
    std::vector<double> values;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    double at(const std::string& name) const;

    bool operator==(const DescriptorVector& other) const {
        return names == other.names && values == other.values;
    }
};

// Base descriptor class
class Descriptor {
protected:
    std::string name;
    std::string description;

public:
    Descriptor(const std::string& name, const std::string& description)
        : name(name), description(description) {}
    virtual ~Descriptor() = default;

    const std::string& getName() const { return name; }
    const std::string& getDescription() const { return description; }

    // The molecule must already be valid.
    virtual double calculate(const Molecule& mol) const = 0;
};

// Registry of descriptors, looked up by name
class DescriptorFactory {
private:
    std::vector<std::unique_ptr<Descriptor>> descriptors;
    std::unordered_map<std::string, size_t> index;

public:
    DescriptorFactory() = default;

    void registerDescriptor(std::unique_ptr<Descriptor> descriptor);
    const Descriptor* getDescriptor(const std::string& name) const;

    double calculate(const std::string& descriptorName, const Molecule& mol) const;
    DescriptorVector calculate(const std::vector<std::string>& descriptorNames, const Molecule& mol) const;
};

// Computes MW, LogP, NumHDonors, NumHAcceptors in that order and memoizes
// results by the exact input string.
class LipinskiEngine {
private:
    DescriptorFactory factory;

#ifdef PFPRED_WITH_TBB
    tbb::concurrent_hash_map<std::string, DescriptorVector> cache;
#else
    std::unordered_map<std::string, DescriptorVector> cache;
    mutable std::mutex cacheMutex;
#endif

    bool lookup(const std::string& key, DescriptorVector& result) const;
    void store(const std::string& key, const DescriptorVector& result);

public:
    LipinskiEngine();

    static const std::vector<std::string>& columnNames();
    static const std::vector<std::string>& displayNames();

    DescriptorVector calculate(const Molecule& mol);

    size_t cacheSize() const;
    void clearCache();
};

}  // namespace pfpred
