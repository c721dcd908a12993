/**
 * @file bibliography.cpp
 * @brief Reference tag extraction, catalog loading and bibliography rendering.
 */

#include "bibliography.hpp"
#include "string_utils.hpp"

#include <fstream>
#include <sstream>

namespace lxt
{

std::vector<std::string> reference_tags(const LineRecord& record)
{
    std::vector<std::string> tags;
    if (record.has_reference_ids())
    {
        for (std::uint16_t id : record.reference_ids)
        {
            if (id != 0)
            {
                tags.push_back("#" + std::to_string(id));
            }
        }
        return tags;
    }
    const std::string code = reference_code(record);
    if (!code.empty())
    {
        tags.push_back(code);
    }
    return tags;
}

bool ReferenceCatalog::load(const std::string& path, std::string& error)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        error = "cannot open reference catalog '" + path + "'";
        return false;
    }

    std::string line;
    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#')
        {
            continue;
        }
        const std::size_t tab = line.find('\t');
        if (tab == std::string::npos)
        {
            continue;
        }
        const std::string tag = strutil::trim_copy(line.substr(0, tab));
        if (!tag.empty())
        {
            add(tag, strutil::trim_copy(line.substr(tab + 1)));
        }
    }
    return true;
}

void ReferenceCatalog::add(const std::string& tag, const std::string& citation)
{
    citations_[tag] = citation;
}

const std::string* ReferenceCatalog::find(const std::string& tag) const
{
    const auto it = citations_.find(tag);
    return it == citations_.end() ? nullptr : &it->second;
}

void Bibliography::add_line(const LineRecord& record)
{
    for (const std::string& tag : reference_tags(record))
    {
        const auto it = positions_.find(tag);
        if (it != positions_.end())
        {
            ++entries_[it->second].lines;
            continue;
        }
        positions_.emplace(tag, entries_.size());
        entries_.push_back(ReferenceCount{tag, 1});
    }
}

std::string Bibliography::render(const ReferenceCatalog* catalog) const
{
    std::ostringstream oss;
    for (const ReferenceCount& entry : entries_)
    {
        oss << entry.tag << "\t" << entry.lines;
        if (catalog)
        {
            if (const std::string* citation = catalog->find(entry.tag))
            {
                oss << "\t" << *citation;
            }
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace lxt
