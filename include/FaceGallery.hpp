// FaceGallery.hpp
#pragma once

#include <vector>
#include <string>
#include <unordered_map>
#include <memory>
#include <limits>
#include "hnswlib/hnswlib.h"

// Nearest gallery entry for a probe embedding
struct MatchResult {
    bool found = false;
    std::string studentId;
    std::string name;
    float distance = std::numeric_limits<float>::infinity(); // L2, nearest entry even when not found
};

// FaceGallery: registered student embeddings with an exact (brute force) L2 nearest-neighbor match.
// Embeddings are expected to be unit length.
class FaceGallery {
public:
    FaceGallery(int dim, int maxElements, float tolerance);

    // Adds a student, or replaces the embedding and name of an existing one
    void upsert(const std::string& studentId, const std::string& name, const std::vector<float>& embedding);

    bool remove(const std::string& studentId);
    bool rename(const std::string& studentId, const std::string& name);

    // A match needs distance <= tolerance
    MatchResult match(const std::vector<float>& embedding) const;

    bool contains(const std::string& studentId) const;
    size_t size() const { return labelsByStudent.size(); }
    int dimension() const { return dim; }
    float tolerance() const { return matchTolerance; }
    void setTolerance(float tolerance) { matchTolerance = tolerance; }
    void clear();

    // Scales v to unit length in place; zero vectors are left alone
    static void normalize(std::vector<float>& v);

private:
    struct Entry {
        std::string studentId;
        std::string name;
    };

    int dim;
    size_t maxElements;
    float matchTolerance;
    hnswlib::labeltype nextLabel = 0;
    std::unordered_map<hnswlib::labeltype, Entry> entries;
    std::unordered_map<std::string, hnswlib::labeltype> labelsByStudent;

    std::unique_ptr<hnswlib::L2Space> space;
    std::unique_ptr<hnswlib::BruteforceSearch<float>> index;

    void checkDimension(const std::vector<float>& embedding) const;
};
