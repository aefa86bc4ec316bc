// FaceGallery.cpp

#include "FaceGallery.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <QDebug>

FaceGallery::FaceGallery(int dim, int maxElements, float tolerance)
    : dim(dim), maxElements(static_cast<size_t>(maxElements)), matchTolerance(tolerance)
{
    if (dim <= 0 || maxElements <= 0) {
        throw std::invalid_argument("FaceGallery needs a positive dimension and capacity");
    }
    space = std::make_unique<hnswlib::L2Space>(static_cast<size_t>(dim));
    index = std::make_unique<hnswlib::BruteforceSearch<float>>(space.get(), this->maxElements);
}

void FaceGallery::checkDimension(const std::vector<float>& embedding) const
{
    if (embedding.size() != static_cast<size_t>(dim)) {
        throw std::invalid_argument("Embedding has " + std::to_string(embedding.size()) +
                                    " values, gallery expects " + std::to_string(dim));
    }
}

void FaceGallery::upsert(const std::string& studentId, const std::string& name, const std::vector<float>& embedding)
{
    checkDimension(embedding);

    auto existing = labelsByStudent.find(studentId);
    if (existing != labelsByStudent.end()) {
        // Same label: BruteforceSearch overwrites the stored vector in place
        index->addPoint(embedding.data(), existing->second);
        entries[existing->second].name = name;
        return;
    }

    // Throws std::runtime_error once maxElements is reached
    index->addPoint(embedding.data(), nextLabel);
    entries[nextLabel] = {studentId, name};
    labelsByStudent[studentId] = nextLabel;
    ++nextLabel;
}

bool FaceGallery::remove(const std::string& studentId)
{
    auto it = labelsByStudent.find(studentId);
    if (it == labelsByStudent.end()) {
        return false;
    }
    index->removePoint(it->second);
    entries.erase(it->second);
    labelsByStudent.erase(it);
    return true;
}

bool FaceGallery::rename(const std::string& studentId, const std::string& name)
{
    auto it = labelsByStudent.find(studentId);
    if (it == labelsByStudent.end() || name.empty()) {
        return false;
    }
    entries[it->second].name = name;
    return true;
}

MatchResult FaceGallery::match(const std::vector<float>& embedding) const
{
    checkDimension(embedding);

    MatchResult result;
    if (labelsByStudent.empty()) {
        return result;
    }

    auto queue = index->searchKnn(embedding.data(), 1);
    if (queue.empty()) {
        return result;
    }
    auto item = queue.top();
    // L2Space reports squared distance
    result.distance = std::sqrt(std::max(0.0f, item.first));
    if (result.distance > matchTolerance) {
        return result;
    }

    auto it = entries.find(item.second);
    if (it == entries.end()) {
        qWarning() << "Gallery index returned label" << item.second << "with no registered student";
        return result;
    }
    result.found = true;
    result.studentId = it->second.studentId;
    result.name = it->second.name;
    return result;
}

bool FaceGallery::contains(const std::string& studentId) const
{
    return labelsByStudent.count(studentId) > 0;
}

void FaceGallery::clear()
{
    index = std::make_unique<hnswlib::BruteforceSearch<float>>(space.get(), maxElements);
    entries.clear();
    labelsByStudent.clear();
    nextLabel = 0;
}

void FaceGallery::normalize(std::vector<float>& v)
{
    float norm = 0.0f;
    for (float x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (norm > 0.0f) {
        for (float& x : v) x /= norm;
    }
}
