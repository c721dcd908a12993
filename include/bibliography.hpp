#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "line_record.hpp"

/**
 * @file bibliography.hpp
 * @brief Reference tag collection for the bibliography output blob.
 */

namespace lxt
{

/**
 * @brief Returns the reference tags carried by a line.
 *
 * A reference code yields itself; numeric indices yield "#<n>" for each
 * non-zero index.
 */
std::vector<std::string> reference_tags(const LineRecord& record);

/**
 * @brief Optional tag-to-citation lookup loaded from a tab-separated file.
 */
class ReferenceCatalog
{
public:
    /**
     * @brief Loads "tag<TAB>citation" lines; blank lines and '#' comments are ignored.
     * @return False with a message when the file cannot be read.
     */
    bool load(const std::string& path, std::string& error);

    void add(const std::string& tag, const std::string& citation);

    const std::string* find(const std::string& tag) const;

    std::size_t size() const { return citations_.size(); }

private:
    std::unordered_map<std::string, std::string> citations_;
};

struct ReferenceCount
{
    std::string tag;
    std::size_t lines = 0;
};

/**
 * @brief Distinct reference tags in first-use order with line counts.
 */
class Bibliography
{
public:
    void add_line(const LineRecord& record);

    const std::vector<ReferenceCount>& entries() const { return entries_; }

    /**
     * @brief Renders one line per tag: tag, line count and citation when catalogued.
     */
    std::string render(const ReferenceCatalog* catalog = nullptr) const;

private:
    std::vector<ReferenceCount> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

} // namespace lxt
